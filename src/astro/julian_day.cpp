/// @file julian_day.cpp
/// @brief Implementation of Julian Day conversions.

#include "astro/julian_day.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <cmath>

namespace heliochron::astro
{

// -----------------------------------------------------------------
// Julian Day anchoring the solar model for a civil date
// -----------------------------------------------------------------

f64 JulianDay::for_date(const CalendarDate& date)
{
    // Next day's midnight minus half a day. Added in JD space so the last
    // representable date never steps outside year_month_day.
    return (at_midnight(date) + 1.0) - 0.5;
}

// -----------------------------------------------------------------
// Julian Day at 00:00 UT, Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 JulianDay::at_midnight(const CalendarDate& date)
{
    i64 y = static_cast<i32>(date.year());
    i64 m = static_cast<unsigned>(date.month());
    const i64 d = static_cast<unsigned>(date.day());

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i64 a = floor_div(y, 100);
    const i64 b = 2 - a + floor_div(a, 4);

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(d)
         + static_cast<f64>(b)
         - 1524.5;
}

// -----------------------------------------------------------------
// Julian Day → UTC instant
// -----------------------------------------------------------------

Instant JulianDay::to_instant(f64 jd)
{
    if (std::isnan(jd))
    {
        HLC_CORE_ERROR("JulianDay: cannot convert NaN Julian Day to an instant");
        throw InvalidComputationError("Invalid Julian Day: NaN");
    }
    if (std::isinf(jd))
    {
        HLC_CORE_ERROR("JulianDay: cannot convert infinite Julian Day to an instant");
        throw InvalidComputationError("Invalid Julian Day: infinite");
    }

    const f64 seconds = (jd - astro_constants::kUnixEpochJd) * astro_constants::kSecondsPerDay;
    const f64 microseconds = seconds * 1e6;

    // 2^63 is exactly representable; anything at or beyond it overflows i64
    constexpr f64 kClockLimit = 9223372036854775808.0;
    if (!(microseconds > -kClockLimit && microseconds < kClockLimit))
    {
        HLC_CORE_ERROR("JulianDay: JD {} is outside the microsecond clock range", jd);
        throw InvalidComputationError("Invalid Julian Day: outside the representable time range");
    }

    return Instant{Duration{static_cast<i64>(microseconds)}};
}

i64 JulianDay::floor_div(i64 a, i64 b)
{
    i64 q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
    {
        --q;
    }
    return q;
}

} // namespace heliochron::astro
