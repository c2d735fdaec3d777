/// @file test_app_config.cpp
/// @brief Unit tests for heliochron::config::ConfigLoader and log level parsing.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "config/app_config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace heliochron;
using namespace heliochron::config;

// =================================================================
// Test entry point (logger must be live for the loader's diagnostics)
// =================================================================

int main(int argc, char** argv)
{
    heliochron::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    heliochron::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: create a temporary JSON file for testing
// =================================================================

class TempJsonFile
{
public:
    explicit TempJsonFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempJsonFile()
    {
        std::filesystem::remove(m_path);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempJsonFile(const TempJsonFile&) = delete;
    TempJsonFile& operator=(const TempJsonFile&) = delete;

private:
    std::filesystem::path m_path;
};

// =================================================================
// Loading from file
// =================================================================

TEST_CASE("Load a complete configuration file")
{
    const TempJsonFile json("heliochron_test_full.json",
        R"({
            "latitude": 49.8419,
            "longitude": 24.0311,
            "tz_offset": 2,
            "tz_name": "EET",
            "log_level": "debug",
            "log_file": "heliochron_test.log"
        })");

    const auto config = ConfigLoader::load(json.path());
    REQUIRE(config.has_value());

    CHECK(config->site.latitude() == doctest::Approx(49.8419));
    CHECK(config->site.longitude() == doctest::Approx(24.0311));
    CHECK(config->zone.name() == "EET");
    CHECK(config->zone.offset() == std::chrono::minutes{120});
    CHECK(config->log.level == spdlog::level::debug);
    CHECK(config->log.file == std::filesystem::path("heliochron_test.log"));
}

TEST_CASE("Missing file returns nullopt")
{
    const auto config = ConfigLoader::load(std::filesystem::temp_directory_path() / "heliochron_missing.json");
    CHECK_FALSE(config.has_value());
}

// =================================================================
// Parsing: site
// =================================================================

TEST_CASE("Minimal configuration defaults to UTC and info logging")
{
    const auto config = ConfigLoader::parse(R"({"latitude": 48.87, "longitude": 2.67})");
    REQUIRE(config.has_value());

    CHECK(config->zone == time::TimeZone::utc());
    CHECK(config->log.level == spdlog::level::info);
    CHECK(config->log.file.empty());
}

TEST_CASE("Site fields are required and validated")
{
    CHECK_FALSE(ConfigLoader::parse(R"({"longitude": 2.67})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": "48.87", "longitude": 2.67})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 91, "longitude": 0})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": -200})").has_value());
}

TEST_CASE("Malformed documents are rejected")
{
    CHECK_FALSE(ConfigLoader::parse("").has_value());
    CHECK_FALSE(ConfigLoader::parse("{ latitude: 1 }").has_value());
    CHECK_FALSE(ConfigLoader::parse("[48.87, 2.67]").has_value());
}

// =================================================================
// Parsing: zone
// =================================================================

TEST_CASE("Zone from an offset string")
{
    const auto config = ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz": "UTC-05:30"})");
    REQUIRE(config.has_value());
    CHECK(config->zone.offset() == std::chrono::minutes{-330});
}

TEST_CASE("Fractional tz_offset hours")
{
    const auto config = ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz_offset": 5.75})");
    REQUIRE(config.has_value());
    CHECK(config->zone.offset() == std::chrono::minutes{345});
    CHECK(config->zone.name() == "UTC+05:45");
}

TEST_CASE("\"tz\" takes precedence over \"tz_offset\"")
{
    const auto config = ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz": "+01:00", "tz_offset": 9})");
    REQUIRE(config.has_value());
    CHECK(config->zone.offset() == std::chrono::minutes{60});
}

TEST_CASE("Invalid zones are rejected")
{
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz": "Mars/Olympus"})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz": 3})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz_offset": 20})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz_offset": "2"})").has_value());
}

TEST_CASE("tz_name must be a string")
{
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz_offset": 2, "tz_name": 2})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz_offset": 2, "tz_name": null})").has_value());

    const auto config = ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "tz_offset": 2, "tz_name": "EET"})");
    REQUIRE(config.has_value());
    CHECK(config->zone.name() == "EET");
}

// =================================================================
// Parsing: logging
// =================================================================

TEST_CASE("Log level names")
{
    CHECK(core::parse_log_level("trace") == spdlog::level::trace);
    CHECK(core::parse_log_level("warning") == spdlog::level::warn);
    CHECK(core::parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(core::parse_log_level("verbose").has_value());
}

TEST_CASE("Unknown log_level is an error")
{
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "log_level": "chatty"})").has_value());
    CHECK_FALSE(ConfigLoader::parse(R"({"latitude": 0, "longitude": 0, "log_level": 3})").has_value());
}
