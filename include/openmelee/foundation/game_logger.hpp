#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for the
///        matchmaking server.
///
/// Provides category-based filtering, structured logging with peer and
/// match context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "openmelee/foundation/game_result.hpp"
#include "openmelee/foundation/types.hpp"

namespace openmelee::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Server log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Process lifecycle
    Network     = 1, ///< ENet transport host
    Protocol    = 2, ///< Wire codec
    Matchmaking = 3, ///< Registry, grouping and session building
    Config      = 4  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 5;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Network", "Protocol", "Matchmaking", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.peerId = peer;
///   ctx.extra["mode"] = "teams";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Matchmaking,
///                         "Play mode not implemented", ctx);
/// @endcode
struct LogContext {
    std::optional<PeerId> peerId;
    std::optional<std::string> matchId;
    std::unordered_map<std::string, std::string> extra;
};

/// Server logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Network     | Info          |
/// | Protocol    | Info          |
/// | Matchmaking | Debug         |
/// | Config      | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Render the context as "key=val, key=val" (empty when nothing is set).
[[nodiscard]] std::string formatLogContext(const LogContext& ctx);

} // namespace openmelee::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name OPENMELEE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// OPENMELEE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef OPENMELEE_MIN_LOG_LEVEL
    #define OPENMELEE_MIN_LOG_LEVEL 0
#endif

#define OPENMELEE_LOG(level, cat, msg)                                                 \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= OPENMELEE_MIN_LOG_LEVEL &&                      \
            ::openmelee::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                              \
            ::openmelee::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define OPENMELEE_LOG_DEBUG(cat, msg) \
    OPENMELEE_LOG(::openmelee::foundation::LogLevel::Debug, (cat), (msg))

#define OPENMELEE_LOG_INFO(cat, msg) \
    OPENMELEE_LOG(::openmelee::foundation::LogLevel::Info, (cat), (msg))

#define OPENMELEE_LOG_WARN(cat, msg) \
    OPENMELEE_LOG(::openmelee::foundation::LogLevel::Warning, (cat), (msg))

#define OPENMELEE_LOG_ERROR(cat, msg) \
    OPENMELEE_LOG(::openmelee::foundation::LogLevel::Error, (cat), (msg))

/// @}
