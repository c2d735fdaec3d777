#pragma once

/// @file time_zone.hpp
/// @brief Fixed-offset display zones and zoned instants.

#include "core/types.hpp"

#include <chrono>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace heliochron::time
{
    /// @brief A display zone: a name plus a fixed offset from UTC.
    ///
    /// Zone lookup (tz database, DST rules) is the caller's concern; callers
    /// resolve the offset valid for the date of interest and pass it here.
    class TimeZone
    {
    public:
        /// @brief Coordinated Universal Time.
        [[nodiscard]] static TimeZone utc();

        /// @brief A zone with the given offset. An empty name is replaced by
        /// the canonical form, e.g. "UTC+05:30".
        /// @return std::nullopt if |offset| exceeds 18 hours.
        [[nodiscard]] static std::optional<TimeZone> fixed(std::chrono::minutes offset, std::string name = {});

        /// @brief Parse "UTC", "GMT", "Z", "+01:00", "-0530", "+2", "UTC+1",
        /// "UTC-05:30".
        /// @return std::nullopt if the text is not an offset or is out of range.
        [[nodiscard]] static std::optional<TimeZone> parse(std::string_view text);

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] std::chrono::minutes offset() const { return m_offset; }

        /// @brief Wall-clock time in this zone for a UTC instant.
        [[nodiscard]] LocalTime to_local(Instant instant) const;

        /// @brief "+01:00" style suffix, or "Z" for a zero offset.
        [[nodiscard]] std::string offset_suffix() const;

        friend bool operator==(const TimeZone&, const TimeZone&) = default;

        static constexpr std::chrono::minutes kMaxOffset{18 * 60};

    private:
        TimeZone(std::chrono::minutes offset, std::string name);

        std::chrono::minutes m_offset;
        std::string m_name;
    };

    /// @brief An absolute instant together with the zone it is displayed in.
    /// Ordering and equality consider only the instant.
    struct ZonedInstant
    {
        Instant  utc;
        TimeZone zone;

        [[nodiscard]] LocalTime local_time() const { return zone.to_local(utc); }

        /// @brief ISO-8601 local time with offset, whole seconds
        /// (e.g. "2025-11-02T07:38:19+01:00").
        [[nodiscard]] std::string to_string() const;

        friend auto operator<=>(const ZonedInstant& a, const ZonedInstant& b) { return a.utc <=> b.utc; }
        friend bool operator==(const ZonedInstant& a, const ZonedInstant& b) { return a.utc == b.utc; }
    };

    /// @brief Civil date of @p instant as seen in @p zone (time of day dropped).
    [[nodiscard]] CalendarDate calendar_date(Instant instant, const TimeZone& zone);

    /// @brief Parse an ISO calendar date "YYYY-MM-DD" (a leading '-' for
    /// years before 0).
    /// @return std::nullopt on malformed text, an invalid date, or a year
    /// outside [-32767, 32767].
    [[nodiscard]] std::optional<CalendarDate> parse_calendar_date(std::string_view text);

    /// @brief "YYYY-MM-DD".
    [[nodiscard]] std::string format_calendar_date(const CalendarDate& date);

    /// @brief "9h 48m 49s" style rendering of a non-negative span.
    [[nodiscard]] std::string format_duration(Duration span);

} // namespace heliochron::time
