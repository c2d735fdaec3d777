/// @file app_config.cpp
/// @brief JSON configuration loading.

#include "config/app_config.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace heliochron::config
{

using nlohmann::json;

namespace
{
    std::optional<f64> read_number(const json& j, const char* key)
    {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_number())
        {
            return std::nullopt;
        }
        return it->get<f64>();
    }

    std::optional<std::string> read_string(const json& j, const char* key)
    {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_string())
        {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    // "tz" wins over "tz_offset"; neither means UTC
    std::optional<time::TimeZone> read_zone(const json& j)
    {
        if (j.contains("tz"))
        {
            const auto text = read_string(j, "tz");
            if (!text)
            {
                HLC_CORE_ERROR("ConfigLoader: \"tz\" must be a string");
                return std::nullopt;
            }
            auto zone = time::TimeZone::parse(*text);
            if (!zone)
            {
                HLC_CORE_ERROR("ConfigLoader: unrecognized zone offset \"{}\"", *text);
            }
            return zone;
        }

        if (!j.contains("tz_offset"))
        {
            return time::TimeZone::utc();
        }

        const auto hours = read_number(j, "tz_offset");
        if (!hours || !std::isfinite(*hours))
        {
            HLC_CORE_ERROR("ConfigLoader: \"tz_offset\" must be a number of hours");
            return std::nullopt;
        }

        const auto name = read_string(j, "tz_name");
        if (j.contains("tz_name") && !name)
        {
            HLC_CORE_ERROR("ConfigLoader: \"tz_name\" must be a string");
            return std::nullopt;
        }

        const std::chrono::minutes offset{std::llround(*hours * 60.0)};
        auto zone = time::TimeZone::fixed(offset, name.value_or(""));
        if (!zone)
        {
            HLC_CORE_ERROR("ConfigLoader: tz_offset {} h is outside ±18 h", *hours);
        }
        return zone;
    }
} // namespace

// -----------------------------------------------------------------
// Load from file
// -----------------------------------------------------------------

std::optional<AppConfig> ConfigLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        HLC_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto config = parse(contents.str());
    if (config)
    {
        HLC_CORE_INFO("ConfigLoader: Loaded site {:.4f}, {:.4f} ({}) from {}",
                      config->site.latitude(), config->site.longitude(),
                      config->zone.name(), path.string());
    }
    return config;
}

// -----------------------------------------------------------------
// Parse from text
// -----------------------------------------------------------------

std::optional<AppConfig> ConfigLoader::parse(std::string_view text)
{
    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        HLC_CORE_ERROR("ConfigLoader: configuration is not a valid JSON object");
        return std::nullopt;
    }

    const auto latitude  = read_number(j, "latitude");
    const auto longitude = read_number(j, "longitude");
    if (!latitude || !longitude)
    {
        HLC_CORE_ERROR("ConfigLoader: \"latitude\" and \"longitude\" are required numbers");
        return std::nullopt;
    }
    if (!geo::GeoCoordinate::is_valid(*latitude, *longitude))
    {
        HLC_CORE_ERROR("ConfigLoader: coordinate {}, {} is out of range", *latitude, *longitude);
        return std::nullopt;
    }

    auto zone = read_zone(j);
    if (!zone)
    {
        return std::nullopt;
    }

    core::LogSettings log;
    if (j.contains("log_level"))
    {
        const auto name  = read_string(j, "log_level");
        const auto level = name ? core::parse_log_level(*name) : std::nullopt;
        if (!level)
        {
            HLC_CORE_ERROR("ConfigLoader: unknown log_level {}", j.at("log_level").dump());
            return std::nullopt;
        }
        log.level = *level;
    }
    if (const auto file = read_string(j, "log_file"))
    {
        log.file = *file;
    }

    return AppConfig{
        .site = geo::GeoCoordinate(*latitude, *longitude),
        .zone = *std::move(zone),
        .log  = log,
    };
}

} // namespace heliochron::config
