#pragma once

/// @file app_config.hpp
/// @brief Observing site, display zone and logging settings loaded from JSON.

#include "core/logger.hpp"
#include "geo/geo_coordinate.hpp"
#include "time/time_zone.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace heliochron::config
{
    /// @brief Application configuration.
    struct AppConfig
    {
        geo::GeoCoordinate site;
        time::TimeZone     zone = time::TimeZone::utc();
        core::LogSettings  log;
    };

    /// @brief Static utility class for loading AppConfig.
    ///
    /// Expected JSON object:
    /// @code
    /// { "latitude": 49.8419, "longitude": 24.0311,
    ///   "tz_offset": 2, "tz_name": "EET",
    ///   "log_level": "info", "log_file": "heliochron.log" }
    /// @endcode
    /// latitude and longitude are required. The zone is taken from "tz"
    /// (an offset string such as "UTC+1") or from "tz_offset" (hours, may be
    /// fractional) with an optional "tz_name"; it defaults to UTC.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load configuration from a JSON file.
        /// @return The configuration, or std::nullopt after logging the reason.
        [[nodiscard]] static std::optional<AppConfig> load(const std::filesystem::path& path);

        /// @brief Parse configuration from JSON text.
        /// @return The configuration, or std::nullopt after logging the reason.
        [[nodiscard]] static std::optional<AppConfig> parse(std::string_view text);
    };

} // namespace heliochron::config
