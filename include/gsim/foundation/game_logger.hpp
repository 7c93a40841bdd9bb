#pragma once

/// @file game_logger.hpp
/// @brief Category-filtered logging for the simulation core, routed through
///        the kcenon common_system logger registry.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gsim/foundation/game_result.hpp"

namespace gsim::foundation {

/// Log severity levels.
///
/// Maps 1:1 onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories; each has its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Startup, shutdown, composition
    Event       = 1, ///< Event bus delivery and handler health
    AI          = 2, ///< Behavior trees and action selection
    Dispatch    = 3, ///< Decision tasks, cache, deadlines
    State       = 4, ///< Transactions, validation, snapshots
    Persistence = 5, ///< Snapshot files on disk
    Runtime     = 6, ///< Tick scheduling and simulation systems
    Config      = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Event", "AI", "Dispatch", "State", "Persistence", "Runtime", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse "info", "WARNING", "warn" etc. Returns nullopt for unknown names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured fields appended to a log line as `{key=value, ...}`.
///
/// @code
///   LogContext ctx;
///   ctx.agentId = "npc-7";
///   ctx.tick = 120;
///   ctx.extra["tree"] = "patrol";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Dispatch,
///                         "cache miss", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> agentId;
    std::optional<uint64_t> tick;
    std::optional<std::string> eventId;
    std::optional<uint64_t> taskId;
    std::map<std::string, std::string> extra;
};

/// Category-aware logger that formats `[Category] message` lines and hands
/// them to the ILogger registered as `gsim.<Category>`, or to the registry's
/// default logger when no category-specific one exists.
///
/// Default levels: Info for every category except AI and Dispatch (Debug).
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply the same minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gsim::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// GSIM_MIN_LOG_LEVEL strips calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef GSIM_MIN_LOG_LEVEL
    #define GSIM_MIN_LOG_LEVEL 0
#endif

#define GSIM_LOG(level, cat, msg)                                                 \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= GSIM_MIN_LOG_LEVEL &&                      \
            ::gsim::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::gsim::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define GSIM_LOG_TRACE(cat, msg) \
    GSIM_LOG(::gsim::foundation::LogLevel::Trace, (cat), (msg))

#define GSIM_LOG_DEBUG(cat, msg) \
    GSIM_LOG(::gsim::foundation::LogLevel::Debug, (cat), (msg))

#define GSIM_LOG_INFO(cat, msg) \
    GSIM_LOG(::gsim::foundation::LogLevel::Info, (cat), (msg))

#define GSIM_LOG_WARN(cat, msg) \
    GSIM_LOG(::gsim::foundation::LogLevel::Warning, (cat), (msg))

#define GSIM_LOG_ERROR(cat, msg) \
    GSIM_LOG(::gsim::foundation::LogLevel::Error, (cat), (msg))
