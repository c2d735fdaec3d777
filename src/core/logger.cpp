/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <utility>
#include <vector>

namespace heliochron::core
{

namespace
{
    std::mutex g_init_mutex;

    constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

    std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                                const std::vector<spdlog::sink_ptr>& sinks,
                                                spdlog::level::level_enum level)
    {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        return logger;
    }

    void init_locked(const LogSettings& settings,
                     std::shared_ptr<spdlog::logger>& core_logger,
                     std::shared_ptr<spdlog::logger>& app_logger)
    {
        // Console sink with color output, shared by both loggers
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kPattern);

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (!settings.file.empty())
        {
            // Rotating file sink: 5 MB max size, 3 rotated files
            constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
            constexpr std::size_t kMaxFiles = 3;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file.string(), kMaxFileSize, kMaxFiles);
            file_sink->set_pattern(kPattern);
            sinks.push_back(std::move(file_sink));
        }

        core_logger = make_logger("HELIOCHRON", sinks, settings.level);
        app_logger  = make_logger("APP", sinks, settings.level);
    }
} // namespace

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name)
{
    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};

    for (const auto& [key, level] : kLevels)
    {
        if (key == name)
        {
            return level;
        }
    }
    return std::nullopt;
}

void Logger::init(const LogSettings& settings)
{
    std::lock_guard lock(g_init_mutex);
    init_locked(settings, s_core_logger, s_app_logger);
}

void Logger::shutdown()
{
    std::lock_guard lock(g_init_mutex);
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

// Caller holds g_init_mutex
void Logger::ensure_initialized_locked()
{
    if (!s_core_logger || !s_app_logger)
    {
        init_locked(LogSettings{}, s_core_logger, s_app_logger);
    }
}

std::shared_ptr<spdlog::logger> Logger::get_core_logger()
{
    std::lock_guard lock(g_init_mutex);
    ensure_initialized_locked();
    return s_core_logger;
}

std::shared_ptr<spdlog::logger> Logger::get_app_logger()
{
    std::lock_guard lock(g_init_mutex);
    ensure_initialized_locked();
    return s_app_logger;
}

} // namespace heliochron::core
