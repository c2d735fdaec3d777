#pragma once

#include <chrono>
#include <cstdint>

namespace heliochron
{
    // Precision aliases
    using f64 = double;
    using i32 = int32_t;
    using i64 = int64_t;

    // Time types. Instants are always UTC; zones only affect display.
    // Microseconds keep every year_month_day (±32767 years) in range.
    using Duration     = std::chrono::microseconds;
    using Instant      = std::chrono::sys_time<Duration>;
    using LocalTime    = std::chrono::local_time<Duration>;
    using CalendarDate = std::chrono::year_month_day;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd = 2440587.5;  // 1970-01-01 00:00 UTC
        constexpr f64 kSecondsPerDay = 86400.0;
        constexpr f64 kFullCircleDeg = 360.0;
    }
}
