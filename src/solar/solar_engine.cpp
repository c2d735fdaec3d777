/// @file solar_engine.cpp
/// @brief SolarPositionEngine: event solving and the accessors built on it.

#include "solar/solar_engine.hpp"

#include "astro/hour_angle.hpp"
#include "astro/julian_day.hpp"
#include "astro/solar_model.hpp"
#include "core/error.hpp"

#include <string>

namespace heliochron::solar
{

using astro::Crossing;
using astro::HourAngle;
using astro::JulianDay;
using astro::SolarModel;
using time::TimeZone;
using time::ZonedInstant;

SolarPositionEngine::SolarPositionEngine(const geo::GeoCoordinate& site)
    : m_site(site)
{
}

SolarPositionEngine::SolarPositionEngine(f64 latitude_deg, f64 longitude_deg)
    : m_site(latitude_deg, longitude_deg)
{
}

SolarPositionEngine::SolarPositionEngine(const std::pair<f64, f64>& lat_lon)
    : m_site(lat_lon)
{
}

// -----------------------------------------------------------------
// Core solve
//
//   JD (12:00 UT of date) → M, C, λ, δ, J_transit
//   H0 from the sunrise equation at the requested altitude
//   J_event = J_transit ∓ H0 / 360
// -----------------------------------------------------------------

EventOutcome SolarPositionEngine::solve_event(const CalendarDate& date, f64 altitude_deg,
                                              Crossing crossing) const
{
    const f64 jd = JulianDay::for_date(date);
    const auto position = SolarModel::compute(jd, m_site.longitude());

    const auto h0 = HourAngle::solve(m_site.latitude(), position.declination, altitude_deg);
    if (!h0)
    {
        return NoEvent{};
    }

    return JulianDay::to_instant(HourAngle::event_julian_day(position.transit_jd, *h0, crossing));
}

EventOutcome SolarPositionEngine::solve_event(const CalendarDate& date, SolarEvent event) const
{
    const auto threshold = event_threshold(event);
    if (!threshold)
    {
        const f64 jd = JulianDay::for_date(date);
        return JulianDay::to_instant(SolarModel::compute(jd, m_site.longitude()).transit_jd);
    }
    return solve_event(date, altitude_degrees(threshold->altitude), threshold->crossing);
}

// -----------------------------------------------------------------
// Named events: one failing and one optional form over solve_event
// -----------------------------------------------------------------

std::optional<ZonedInstant> SolarPositionEngine::try_event(const CalendarDate& date, SolarEvent event,
                                                           const TimeZone& zone) const
{
    const auto outcome = solve_event(date, event);
    if (const auto* instant = std::get_if<Instant>(&outcome))
    {
        return ZonedInstant{*instant, zone};
    }
    return std::nullopt;
}

ZonedInstant SolarPositionEngine::event(const CalendarDate& date, SolarEvent event,
                                        const TimeZone& zone) const
{
    auto instant = try_event(date, event, zone);
    if (!instant)
    {
        throw NoEventError(std::string(event_label(event)), date);
    }
    return *std::move(instant);
}

ZonedInstant SolarPositionEngine::sunrise(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::Sunrise, zone);
}

ZonedInstant SolarPositionEngine::sunset(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::Sunset, zone);
}

ZonedInstant SolarPositionEngine::civil_dawn(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::CivilDawn, zone);
}

ZonedInstant SolarPositionEngine::civil_dusk(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::CivilDusk, zone);
}

ZonedInstant SolarPositionEngine::nautical_dawn(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::NauticalDawn, zone);
}

ZonedInstant SolarPositionEngine::nautical_dusk(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::NauticalDusk, zone);
}

ZonedInstant SolarPositionEngine::astronomical_dawn(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::AstronomicalDawn, zone);
}

ZonedInstant SolarPositionEngine::astronomical_dusk(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::AstronomicalDusk, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_sunrise(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::Sunrise, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_sunset(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::Sunset, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_civil_dawn(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::CivilDawn, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_civil_dusk(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::CivilDusk, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_nautical_dawn(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::NauticalDawn, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_nautical_dusk(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::NauticalDusk, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_astronomical_dawn(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::AstronomicalDawn, zone);
}

std::optional<ZonedInstant> SolarPositionEngine::try_astronomical_dusk(const CalendarDate& date, const TimeZone& zone) const
{
    return try_event(date, SolarEvent::AstronomicalDusk, zone);
}

ZonedInstant SolarPositionEngine::solar_noon(const CalendarDate& date, const TimeZone& zone) const
{
    return event(date, SolarEvent::SolarNoon, zone);
}

// -----------------------------------------------------------------
// Derived spans and bundles
// -----------------------------------------------------------------

Duration SolarPositionEngine::daylight_length(const CalendarDate& date) const
{
    const auto rise = try_sunrise(date);
    const auto set  = try_sunset(date);
    if (!rise || !set)
    {
        return Duration::zero();
    }
    return set->utc - rise->utc;
}

std::optional<Duration> SolarPositionEngine::daylight_remaining(Instant now, const TimeZone& zone) const
{
    const CalendarDate today = time::calendar_date(now, zone);

    const auto rise = try_sunrise(today, zone);
    const auto set  = try_sunset(today, zone);
    if (!rise || !set || now < rise->utc || now > set->utc)
    {
        return std::nullopt;
    }
    return set->utc - now;
}

SolarEvents SolarPositionEngine::events(const CalendarDate& date, const TimeZone& zone) const
{
    SolarEvents bundle(date, zone);
    for (const SolarEvent event : kAllSolarEvents)
    {
        bundle.set(event, try_event(date, event, zone));
    }
    return bundle;
}

} // namespace heliochron::solar
