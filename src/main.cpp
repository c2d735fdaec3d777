// src/main.cpp - Heliochron command-line front end
//
// Usage: heliochron [config.json] [YYYY-MM-DD]
//
//  1. Load the observing site and display zone
//  2. Compute the twilight table for the date (default: today in the zone)
//  3. Print daylight length and, when the sun is up, daylight left
//  4. Print the event bundle as JSON

#include "config/app_config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "solar/solar_engine.hpp"
#include "solar/solar_events.hpp"
#include "time/time_zone.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace heliochron;

namespace {

constexpr const char* kDefaultConfig = "heliochron.json";

void printUsage(std::ostream& os) {
    os << "Usage: heliochron [config.json] [YYYY-MM-DD]\n"
       << "  config.json  site and zone (default: " << kDefaultConfig << ")\n"
       << "  YYYY-MM-DD   civil date (default: today in the configured zone)\n";
}

std::string formatEvent(const std::optional<time::ZonedInstant>& instant) {
    return instant ? instant->to_string() : "N/A";
}

int run(int argc, char** argv) {
    if (argc > 3 || (argc > 1 && (std::string_view(argv[1]) == "-h"
                                   || std::string_view(argv[1]) == "--help"))) {
        printUsage(argc > 3 ? std::cerr : std::cout);
        return argc > 3 ? 1 : 0;
    }

    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    const std::filesystem::path config_path = argc > 1 ? argv[1] : kDefaultConfig;
    const auto config = config::ConfigLoader::load(config_path);
    if (!config) {
        HLC_ERROR("Cannot start without a valid configuration ({})", config_path.string());
        printUsage(std::cerr);
        return 1;
    }
    core::Logger::init(config->log);

    const time::TimeZone& zone = config->zone;
    const auto now = std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());

    CalendarDate date = time::calendar_date(now, zone);
    if (argc > 2) {
        const auto parsed = time::parse_calendar_date(argv[2]);
        if (!parsed) {
            HLC_ERROR("Invalid date '{}', expected YYYY-MM-DD", argv[2]);
            return 1;
        }
        date = *parsed;
    }

    const solar::SolarPositionEngine engine(config->site);

    try {
        // -------------------------------------------------------------------
        // 2. Twilight table
        // -------------------------------------------------------------------
        const solar::SolarEvents events = engine.events(date, zone);

        std::cout << "Location: " << std::fixed << std::setprecision(4)
                  << engine.site().latitude() << ", " << engine.site().longitude() << "\n"
                  << "Timezone: " << zone.name() << " (" << zone.offset_suffix() << ")\n"
                  << "Date:     " << time::format_calendar_date(date) << "\n\n";

        std::cout << "=== Twilight Periods ===\n";
        for (const solar::SolarEvent event : solar::kAllSolarEvents) {
            std::string label(solar::event_label(event));
            label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
            std::cout << std::left << std::setw(20) << (label + ":")
                      << formatEvent(events[event]) << "\n";
        }

        // -------------------------------------------------------------------
        // 3. Daylight
        // -------------------------------------------------------------------
        std::cout << "\n=== Daylight ===\n"
                  << "Daylight:      " << time::format_duration(engine.daylight_length(date)) << "\n";

        if (date == time::calendar_date(now, zone)) {
            if (const auto left = engine.daylight_remaining(now, zone)) {
                std::cout << "Daylight left: " << time::format_duration(*left) << "\n";
            }
        }

        // -------------------------------------------------------------------
        // 4. JSON bundle
        // -------------------------------------------------------------------
        const nlohmann::ordered_json json = events;
        std::cout << "\n" << json.dump() << "\n";
    } catch (const InvalidComputationError& e) {
        HLC_CRITICAL("Internal computation fault: {}", e.what());
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const int status = run(argc, argv);
    core::Logger::shutdown();
    return status;
}
