#pragma once

/// @file solar_engine.hpp
/// @brief Sunrise, sunset, solar noon and twilight times for a fixed site.

#include "astro/hour_angle.hpp"
#include "core/types.hpp"
#include "geo/geo_coordinate.hpp"
#include "solar/solar_events.hpp"
#include "time/time_zone.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace heliochron::solar
{
    /// @brief The Sun does not reach the requested altitude on that date.
    struct NoEvent
    {
        friend bool operator==(NoEvent, NoEvent) = default;
    };

    /// @brief Outcome of a rise/set/twilight solve: a UTC instant or NoEvent.
    using EventOutcome = std::variant<Instant, NoEvent>;

    /// @brief Solar event calculator bound to one geographic coordinate.
    ///
    /// Immutable after construction and free of hidden state: every method is
    /// const, deterministic, and safe to call from many threads at once.
    ///
    /// Each rise/set/twilight accessor comes in two forms. The plain form
    /// throws NoEventError during polar day or night; the `try_` form returns
    /// std::nullopt instead. Only the civil date of the input participates in
    /// the computation; results are expressed in @p zone (UTC by default).
    class SolarPositionEngine
    {
    public:
        explicit SolarPositionEngine(const geo::GeoCoordinate& site);

        /// @throws InvalidCoordinateError on an out-of-range coordinate.
        SolarPositionEngine(f64 latitude_deg, f64 longitude_deg);

        /// @throws InvalidCoordinateError on an out-of-range coordinate.
        explicit SolarPositionEngine(const std::pair<f64, f64>& lat_lon);

        [[nodiscard]] const geo::GeoCoordinate& site() const { return m_site; }

        // -------------------------------------------------------------
        // Core solve
        // -------------------------------------------------------------

        /// @brief Instant at which the Sun's centre crosses @p altitude_deg on
        /// the rising or setting side of the transit.
        /// @throws InvalidComputationError on an internal numeric fault.
        [[nodiscard]] EventOutcome solve_event(const CalendarDate& date, f64 altitude_deg,
                                               astro::Crossing crossing) const;

        /// @brief Solve a named event. Solar noon always occurs.
        [[nodiscard]] EventOutcome solve_event(const CalendarDate& date, SolarEvent event) const;

        // -------------------------------------------------------------
        // Named events
        // -------------------------------------------------------------

        /// @throws NoEventError if the event does not occur on @p date.
        [[nodiscard]] time::ZonedInstant event(const CalendarDate& date, SolarEvent event,
                                               const time::TimeZone& zone = time::TimeZone::utc()) const;

        [[nodiscard]] std::optional<time::ZonedInstant> try_event(const CalendarDate& date, SolarEvent event,
                                                                  const time::TimeZone& zone = time::TimeZone::utc()) const;

        [[nodiscard]] time::ZonedInstant sunrise(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant sunset(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant civil_dawn(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant civil_dusk(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant nautical_dawn(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant nautical_dusk(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant astronomical_dawn(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] time::ZonedInstant astronomical_dusk(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;

        [[nodiscard]] std::optional<time::ZonedInstant> try_sunrise(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_sunset(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_civil_dawn(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_civil_dusk(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_nautical_dawn(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_nautical_dusk(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_astronomical_dawn(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;
        [[nodiscard]] std::optional<time::ZonedInstant> try_astronomical_dusk(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;

        /// @brief Local solar noon (the Sun's transit). Always occurs.
        [[nodiscard]] time::ZonedInstant solar_noon(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;

        // -------------------------------------------------------------
        // Derived spans and bundles
        // -------------------------------------------------------------

        /// @brief sunset − sunrise, or zero when either does not occur.
        [[nodiscard]] Duration daylight_length(const CalendarDate& date) const;

        /// @brief Time left until sunset, for the civil date of @p now in
        /// @p zone. std::nullopt when @p now is outside [sunrise, sunset] or
        /// either does not occur.
        [[nodiscard]] std::optional<Duration> daylight_remaining(Instant now, const time::TimeZone& zone = time::TimeZone::utc()) const;

        /// @brief All nine events of @p date in chronological order.
        [[nodiscard]] SolarEvents events(const CalendarDate& date, const time::TimeZone& zone = time::TimeZone::utc()) const;

    private:
        geo::GeoCoordinate m_site;
    };

} // namespace heliochron::solar
