#pragma once

/// @file game_logger.hpp
/// @brief GameLogger: category-filtered logging on top of kcenon common_system.
///
/// Engine code logs through the LHE_LOG_* macros. Messages are routed to the
/// ILogger registered in kcenon's GlobalLoggerRegistry, either the one named
/// "lhe.<Category>" or the registry's default logger.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lhe/foundation/game_result.hpp"
#include "lhe/foundation/types.hpp"

namespace lhe::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level one to one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Library lifecycle, registries
    Config   = 1, ///< YAML loading, rule declaration failures
    Reaction = 2, ///< Reaction table registration and lookup
    Combat   = 3  ///< Damage, heal and death events
};

inline constexpr std::size_t kLogCategoryCount = 4;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Reaction", "Combat"
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

/// Structured fields appended to a log line as `{key=val, ...}`.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = EntityId(7);
///   ctx.extra["damage_class"] = "Fire";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger wrapping kcenon's logger registry.
///
/// Default levels:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Config   | Info          |
/// | Reaction | Info          |
/// | Combat   | Debug         |
///
/// Category levels are atomics so isEnabled() stays cheap on the damage path.
/// kcenon types stay behind the PIMPL.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log @p msg as "[Category] msg". No-op below the category level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log @p msg with @p ctx appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Off for an unknown category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    GameResult<void> flush();

    /// Process-wide logger used by the LHE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lhe::foundation

/// @name LHE_LOG Macros
/// @brief Logging macros with a compile-time floor and a runtime category check.
///
/// Define LHE_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef LHE_MIN_LOG_LEVEL
    #define LHE_MIN_LOG_LEVEL 0
#endif

#define LHE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= LHE_MIN_LOG_LEVEL &&                      \
            ::lhe::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::lhe::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define LHE_LOG_DEBUG(cat, msg) \
    LHE_LOG(::lhe::foundation::LogLevel::Debug, (cat), (msg))

#define LHE_LOG_INFO(cat, msg) \
    LHE_LOG(::lhe::foundation::LogLevel::Info, (cat), (msg))

#define LHE_LOG_WARN(cat, msg) \
    LHE_LOG(::lhe::foundation::LogLevel::Warning, (cat), (msg))

#define LHE_LOG_ERROR(cat, msg) \
    LHE_LOG(::lhe::foundation::LogLevel::Error, (cat), (msg))

/// @}
