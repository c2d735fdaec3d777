/// @file solar_events.cpp
/// @brief Event naming, thresholds and JSON serialization of the event bundle.

#include "solar/solar_events.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace heliochron::solar
{

std::optional<EventThreshold> event_threshold(SolarEvent event)
{
    using astro::Crossing;

    switch (event)
    {
        case SolarEvent::AstronomicalDawn: return EventThreshold{SolarAltitude::Astronomical, Crossing::Rising};
        case SolarEvent::NauticalDawn:     return EventThreshold{SolarAltitude::Nautical, Crossing::Rising};
        case SolarEvent::CivilDawn:        return EventThreshold{SolarAltitude::Civil, Crossing::Rising};
        case SolarEvent::Sunrise:          return EventThreshold{SolarAltitude::SunriseSunset, Crossing::Rising};
        case SolarEvent::SolarNoon:        return std::nullopt;
        case SolarEvent::Sunset:           return EventThreshold{SolarAltitude::SunriseSunset, Crossing::Setting};
        case SolarEvent::CivilDusk:        return EventThreshold{SolarAltitude::Civil, Crossing::Setting};
        case SolarEvent::NauticalDusk:     return EventThreshold{SolarAltitude::Nautical, Crossing::Setting};
        case SolarEvent::AstronomicalDusk: return EventThreshold{SolarAltitude::Astronomical, Crossing::Setting};
    }
    return std::nullopt;
}

std::string_view event_key(SolarEvent event)
{
    switch (event)
    {
        case SolarEvent::AstronomicalDawn: return "astronomical_dawn";
        case SolarEvent::NauticalDawn:     return "nautical_dawn";
        case SolarEvent::CivilDawn:        return "civil_dawn";
        case SolarEvent::Sunrise:          return "sunrise";
        case SolarEvent::SolarNoon:        return "solar_noon";
        case SolarEvent::Sunset:           return "sunset";
        case SolarEvent::CivilDusk:        return "civil_dusk";
        case SolarEvent::NauticalDusk:     return "nautical_dusk";
        case SolarEvent::AstronomicalDusk: return "astronomical_dusk";
    }
    return "unknown";
}

std::string_view event_label(SolarEvent event)
{
    switch (event)
    {
        case SolarEvent::AstronomicalDawn: return "astronomical dawn";
        case SolarEvent::NauticalDawn:     return "nautical dawn";
        case SolarEvent::CivilDawn:        return "civil dawn";
        case SolarEvent::Sunrise:          return "sunrise";
        case SolarEvent::SolarNoon:        return "solar noon";
        case SolarEvent::Sunset:           return "sunset";
        case SolarEvent::CivilDusk:        return "civil dusk";
        case SolarEvent::NauticalDusk:     return "nautical dusk";
        case SolarEvent::AstronomicalDusk: return "astronomical dusk";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// SolarEvents
// -----------------------------------------------------------------

SolarEvents::SolarEvents(CalendarDate date, time::TimeZone zone)
    : m_date(date)
    , m_zone(std::move(zone))
{
}

const std::optional<time::ZonedInstant>& SolarEvents::operator[](SolarEvent event) const
{
    return m_events[static_cast<std::size_t>(event)];
}

void SolarEvents::set(SolarEvent event, std::optional<time::ZonedInstant> instant)
{
    m_events[static_cast<std::size_t>(event)] = std::move(instant);
}

void to_json(nlohmann::ordered_json& j, const SolarEvents& events)
{
    j = nlohmann::ordered_json::object();
    for (const SolarEvent event : kAllSolarEvents)
    {
        const auto& instant = events[event];
        const std::string key(event_key(event));
        if (instant)
        {
            j[key] = instant->to_string();
        }
        else
        {
            j[key] = nullptr;
        }
    }
}

} // namespace heliochron::solar
