/// @file test_julian_day.cpp
/// @brief Unit tests for heliochron::astro::JulianDay.
///
/// Verifies the Meeus conversion against reference values, the model's
/// next-day anchoring, proleptic Gregorian behaviour, and instant conversion.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/julian_day.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>
#include <limits>

using namespace heliochron;
using namespace heliochron::astro;
using namespace std::chrono;

static constexpr f64 kJdTolerance = 1e-9;

// =================================================================
// Julian Day at midnight: Meeus reference values
// =================================================================

TEST_CASE("Known date: 1999-01-01 00:00 UT → JD 2451179.5")
{
    CHECK(JulianDay::at_midnight(1999y / January / 1) == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 2024-06-15 00:00 UT → JD 2460476.5")
{
    CHECK(JulianDay::at_midnight(2024y / June / 15) == doctest::Approx(2460476.5).epsilon(kJdTolerance));
}

TEST_CASE("Historical date: Sputnik launch day 1957-10-04")
{
    CHECK(JulianDay::at_midnight(1957y / October / 4) == doctest::Approx(2436115.5).epsilon(kJdTolerance));
}

TEST_CASE("First day of the Gregorian calendar: 1582-10-15 → JD 2299160.5")
{
    CHECK(JulianDay::at_midnight(1582y / October / 15) == 2299160.5);
}

TEST_CASE("Proleptic Gregorian: year 0 and negative years")
{
    SUBCASE("0000-01-01 → JD 1721059.5")
    {
        CHECK(JulianDay::at_midnight(year{0} / January / 1) == 1721059.5);
    }

    SUBCASE("Days stay contiguous across the year 0 boundary")
    {
        CHECK(JulianDay::at_midnight(year{0} / January / 1)
              - JulianDay::at_midnight(year{-1} / December / 31) == 1.0);
    }

    SUBCASE("-100 is not a leap year")
    {
        CHECK(JulianDay::at_midnight(year{-100} / March / 1)
              - JulianDay::at_midnight(year{-100} / February / 28) == 1.0);
    }
}

// =================================================================
// Model anchor: the date is advanced one day, then shifted back 0.5
// =================================================================

TEST_CASE("for_date lands on 12:00 UT of the given date")
{
    SUBCASE("2000-01-01 is exactly J2000.0")
    {
        CHECK(JulianDay::for_date(2000y / January / 1) == astro_constants::kJ2000);
    }

    SUBCASE("2025-11-02 → JD 2460982.0")
    {
        CHECK(JulianDay::for_date(2025y / November / 2) == 2460982.0);
    }

    SUBCASE("Equals the next midnight minus half a day")
    {
        const CalendarDate date = 2031y / July / 9;
        const CalendarDate next{sys_days{date} + days{1}};
        CHECK(JulianDay::for_date(date) == JulianDay::at_midnight(next) - 0.5);
    }
}

TEST_CASE("for_date advances by exactly one per calendar day")
{
    SUBCASE("Across a year boundary")
    {
        CHECK(JulianDay::for_date(2026y / January / 1) - JulianDay::for_date(2025y / December / 31) == 1.0);
    }

    SUBCASE("Across a leap day")
    {
        CHECK(JulianDay::for_date(2024y / February / 29) - JulianDay::for_date(2024y / February / 28) == 1.0);
        CHECK(JulianDay::for_date(2024y / March / 1) - JulianDay::for_date(2024y / February / 29) == 1.0);
    }

    SUBCASE("Non-leap February")
    {
        CHECK(JulianDay::for_date(2025y / March / 1) - JulianDay::for_date(2025y / February / 28) == 1.0);
    }
}

// =================================================================
// Julian Day → instant
// =================================================================

TEST_CASE("to_instant: Unix epoch")
{
    CHECK(JulianDay::to_instant(astro_constants::kUnixEpochJd) == Instant{});
}

TEST_CASE("to_instant: J2000.0 is 2000-01-01 12:00 UTC")
{
    const Instant expected = sys_days{2000y / January / 1} + hours{12};
    CHECK(JulianDay::to_instant(astro_constants::kJ2000) == expected);
}

TEST_CASE("to_instant keeps sub-second resolution")
{
    const f64 jd = astro_constants::kJ2000 + 0.25 + 1.5 / astro_constants::kSecondsPerDay;
    const Instant expected = sys_days{2000y / January / 1} + hours{18} + milliseconds{1500};

    const auto error = JulianDay::to_instant(jd) - expected;
    CHECK(std::abs(duration_cast<microseconds>(error).count()) < 100);
}

TEST_CASE("to_instant before the Unix epoch")
{
    const Instant expected = sys_days{1957y / October / 4};
    CHECK(JulianDay::to_instant(2436115.5) == expected);
}

TEST_CASE("Every representable civil date converts to an instant")
{
    for (const CalendarDate date : {CalendarDate{year{-32767} / January / 1},
                                    CalendarDate{1650y / June / 21},
                                    CalendarDate{2300y / June / 21},
                                    CalendarDate{year{32767} / December / 31}})
    {
        // Midnight JD agrees with the civil day count of the chrono calendar
        const f64 days_since_epoch = static_cast<f64>(sys_days{date}.time_since_epoch().count());
        CHECK(JulianDay::at_midnight(date) == astro_constants::kUnixEpochJd + days_since_epoch);

        const Instant noon = sys_days{date} + hours{12};
        CHECK(JulianDay::to_instant(JulianDay::for_date(date)) == noon);
    }
}

TEST_CASE("to_instant rejects non-finite and unrepresentable Julian Days")
{
    CHECK_THROWS_AS((void)JulianDay::to_instant(std::numeric_limits<f64>::quiet_NaN()), InvalidComputationError);
    CHECK_THROWS_AS((void)JulianDay::to_instant(std::numeric_limits<f64>::infinity()), InvalidComputationError);
    CHECK_THROWS_AS((void)JulianDay::to_instant(-std::numeric_limits<f64>::infinity()), InvalidComputationError);
    CHECK_THROWS_AS((void)JulianDay::to_instant(1e12), InvalidComputationError);

    CHECK_THROWS_WITH((void)JulianDay::to_instant(std::numeric_limits<f64>::quiet_NaN()),
                      "Invalid Julian Day: NaN");
}
