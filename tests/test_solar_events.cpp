/// @file test_solar_events.cpp
/// @brief Unit tests for event naming, thresholds and the JSON event bundle.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "solar/solar_engine.hpp"
#include "solar/solar_events.hpp"
#include "time/time_zone.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace heliochron;
using namespace heliochron::solar;
using namespace std::chrono;

// =================================================================
// Naming and thresholds
// =================================================================

TEST_CASE("Altitude thresholds")
{
    CHECK(altitude_degrees(SolarAltitude::SunriseSunset) == -0.8333);
    CHECK(altitude_degrees(SolarAltitude::Civil) == -6.0);
    CHECK(altitude_degrees(SolarAltitude::Nautical) == -12.0);
    CHECK(altitude_degrees(SolarAltitude::Astronomical) == -18.0);
}

TEST_CASE("Each event pairs an altitude with a crossing")
{
    const auto dawn = event_threshold(SolarEvent::NauticalDawn);
    REQUIRE(dawn.has_value());
    CHECK(dawn->altitude == SolarAltitude::Nautical);
    CHECK(dawn->crossing == astro::Crossing::Rising);

    const auto sunset = event_threshold(SolarEvent::Sunset);
    REQUIRE(sunset.has_value());
    CHECK(sunset->altitude == SolarAltitude::SunriseSunset);
    CHECK(sunset->crossing == astro::Crossing::Setting);

    CHECK_FALSE(event_threshold(SolarEvent::SolarNoon).has_value());
}

TEST_CASE("Keys and labels")
{
    CHECK(event_key(SolarEvent::AstronomicalDawn) == "astronomical_dawn");
    CHECK(event_key(SolarEvent::SolarNoon) == "solar_noon");
    CHECK(event_label(SolarEvent::CivilDusk) == "civil dusk");
    CHECK(event_label(SolarEvent::Sunrise) == "sunrise");
}

// =================================================================
// Bundle
// =================================================================

TEST_CASE("A fresh bundle holds no events")
{
    const SolarEvents events(2025y / November / 2, time::TimeZone::utc());
    for (const SolarEvent event : kAllSolarEvents)
    {
        CHECK_FALSE(events[event].has_value());
    }
    CHECK(events.date() == 2025y / November / 2);
}

TEST_CASE("JSON keys follow chronological order")
{
    const SolarPositionEngine paris(48.87, 2.67);
    const nlohmann::ordered_json json = paris.events(2025y / November / 2, *time::TimeZone::fixed(hours{1}));

    const std::vector<std::string> expected{
        "astronomical_dawn", "nautical_dawn", "civil_dawn", "sunrise", "solar_noon",
        "sunset", "civil_dusk", "nautical_dusk", "astronomical_dusk",
    };

    std::vector<std::string> keys;
    for (const auto& item : json.items())
    {
        keys.push_back(item.key());
    }
    CHECK(keys == expected);
}

TEST_CASE("JSON values are ISO-8601 strings in the bundle's zone")
{
    const SolarPositionEngine paris(48.87, 2.67);
    const nlohmann::ordered_json json = paris.events(2025y / November / 2, *time::TimeZone::fixed(hours{1}));

    for (const auto& item : json.items())
    {
        REQUIRE(item.value().is_string());
        const auto text = item.value().get<std::string>();
        CHECK(text.size() == 25);
        CHECK(text.substr(0, 11) == "2025-11-02T");
        CHECK(text.substr(19) == "+01:00");
    }
    CHECK(json["sunrise"].get<std::string>().substr(0, 16) == "2025-11-02T07:38");
}

TEST_CASE("Events that do not occur serialize as null, never omitted")
{
    const SolarPositionEngine pole(85.0, 0.0);
    const nlohmann::ordered_json json = pole.events(2025y / December / 21);

    CHECK(json.size() == kSolarEventCount);
    CHECK(json["sunrise"].is_null());
    CHECK(json["sunset"].is_null());
    CHECK(json["astronomical_dawn"].is_null());
    CHECK(json["solar_noon"].is_string());
    CHECK(json["solar_noon"].get<std::string>().back() == 'Z');
}
