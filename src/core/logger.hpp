#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace heliochron::core
{
    /// @brief Logger configuration, usually filled from the app config file.
    struct LogSettings
    {
        spdlog::level::level_enum level = spdlog::level::info;
        std::filesystem::path file;   ///< Rotating log file; empty = console only
    };

    /// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
    /// "critical", "off").
    /// @return The level, or std::nullopt for an unknown name.
    [[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

    /// @brief Centralized logging facility for Heliochron.
    ///
    /// Provides two separate loggers:
    /// - **HELIOCHRON** (core): numeric core, configuration loading
    /// - **APP**: command-line front end, user-facing messages
    ///
    /// Both write to colored console output and, when configured, a rotating
    /// log file. Call init() once from main(); library code that logs before
    /// that gets console-only defaults.
    class Logger
    {
    public:
        /// @brief Initialize (or re-initialize) both loggers.
        static void init(const LogSettings& settings = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("HELIOCHRON").
        /// Returned by value; a concurrent init() leaves the caller's copy valid.
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_app_logger();

    private:
        static void ensure_initialized_locked();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace heliochron::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define HLC_CORE_TRACE(...)    ::heliochron::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define HLC_CORE_DEBUG(...)    ::heliochron::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define HLC_CORE_INFO(...)     ::heliochron::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define HLC_CORE_WARN(...)     ::heliochron::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define HLC_CORE_ERROR(...)    ::heliochron::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define HLC_CORE_CRITICAL(...) ::heliochron::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define HLC_TRACE(...)         ::heliochron::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define HLC_DEBUG(...)         ::heliochron::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define HLC_INFO(...)          ::heliochron::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define HLC_WARN(...)          ::heliochron::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define HLC_ERROR(...)         ::heliochron::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define HLC_CRITICAL(...)      ::heliochron::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
