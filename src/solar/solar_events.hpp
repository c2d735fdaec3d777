#pragma once

/// @file solar_events.hpp
/// @brief Named solar events, altitude thresholds and the daily event bundle.

#include "astro/hour_angle.hpp"
#include "core/types.hpp"
#include "time/time_zone.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace heliochron::solar
{
    /// @brief Altitude of the Sun's centre that defines an event family.
    enum class SolarAltitude
    {
        SunriseSunset,  ///< -0.8333°: upper limb on the horizon, standard refraction
        Civil,          ///< -6°
        Nautical,       ///< -12°
        Astronomical,   ///< -18°
    };

    [[nodiscard]] constexpr f64 altitude_degrees(SolarAltitude altitude)
    {
        switch (altitude)
        {
            case SolarAltitude::SunriseSunset: return -0.8333;
            case SolarAltitude::Civil:         return -6.0;
            case SolarAltitude::Nautical:      return -12.0;
            case SolarAltitude::Astronomical:  return -18.0;
        }
        return -0.8333;
    }

    /// @brief The nine daily events, in chronological order.
    enum class SolarEvent
    {
        AstronomicalDawn,
        NauticalDawn,
        CivilDawn,
        Sunrise,
        SolarNoon,
        Sunset,
        CivilDusk,
        NauticalDusk,
        AstronomicalDusk,
    };

    inline constexpr std::size_t kSolarEventCount = 9;

    inline constexpr std::array<SolarEvent, kSolarEventCount> kAllSolarEvents{
        SolarEvent::AstronomicalDawn,
        SolarEvent::NauticalDawn,
        SolarEvent::CivilDawn,
        SolarEvent::Sunrise,
        SolarEvent::SolarNoon,
        SolarEvent::Sunset,
        SolarEvent::CivilDusk,
        SolarEvent::NauticalDusk,
        SolarEvent::AstronomicalDusk,
    };

    /// @brief Threshold and crossing direction of a rise/set/twilight event.
    struct EventThreshold
    {
        SolarAltitude   altitude;
        astro::Crossing crossing;
    };

    /// @brief The threshold an event is solved at, or std::nullopt for solar
    /// noon, which is the transit itself.
    [[nodiscard]] std::optional<EventThreshold> event_threshold(SolarEvent event);

    /// @brief Stable serialization key, e.g. "astronomical_dawn".
    [[nodiscard]] std::string_view event_key(SolarEvent event);

    /// @brief Human-readable name, e.g. "astronomical dawn".
    [[nodiscard]] std::string_view event_label(SolarEvent event);

    /// @brief All nine events of one civil date, expressed in one zone.
    ///
    /// An event that does not occur is held as std::nullopt and serialized as
    /// JSON null, never omitted.
    class SolarEvents
    {
    public:
        SolarEvents(CalendarDate date, time::TimeZone zone);

        [[nodiscard]] const std::optional<time::ZonedInstant>& operator[](SolarEvent event) const;
        void set(SolarEvent event, std::optional<time::ZonedInstant> instant);

        [[nodiscard]] CalendarDate date() const { return m_date; }
        [[nodiscard]] const time::TimeZone& zone() const { return m_zone; }

    private:
        CalendarDate   m_date;
        time::TimeZone m_zone;
        std::array<std::optional<time::ZonedInstant>, kSolarEventCount> m_events{};
    };

    /// @brief Ordered JSON object keyed by event_key(), chronological order,
    /// ISO-8601 strings or null.
    void to_json(nlohmann::ordered_json& j, const SolarEvents& events);

} // namespace heliochron::solar
