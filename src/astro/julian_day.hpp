#pragma once

/// @file julian_day.hpp
/// @brief Julian Day conversions for the solar event model.

#include "core/types.hpp"

namespace heliochron::astro
{
    /// @brief Static utility class for Julian Day arithmetic.
    ///
    /// Civil dates are proleptic Gregorian. Julian Days are a private
    /// intermediate of the solar model and never cross the engine boundary.
    class JulianDay
    {
    public:
        JulianDay() = delete;

        /// @brief Julian Day used to anchor the solar model for a civil date.
        ///
        /// The midnight Julian Day of the following day, shifted back by half
        /// a day, which lands on 12:00 UT of @p date. All model constants are calibrated against this value.
        /// @param date Civil date; any representable date gives a finite result.
        [[nodiscard]] static f64 for_date(const CalendarDate& date);

        /// @brief Julian Day at 00:00 UT of a civil date (Meeus, Ch. 7).
        [[nodiscard]] static f64 at_midnight(const CalendarDate& date);

        /// @brief Convert a Julian Day to a UTC instant.
        ///
        /// The offset from the Unix epoch is computed in double precision
        /// before truncation to microseconds.
        /// @throws InvalidComputationError if @p jd is NaN, infinite, or does
        /// not fit the microsecond clock.
        [[nodiscard]] static Instant to_instant(f64 jd);

    private:
        /// @brief Floor division, so years before 0 follow the proleptic calendar.
        [[nodiscard]] static i64 floor_div(i64 a, i64 b);
    };

} // namespace heliochron::astro
