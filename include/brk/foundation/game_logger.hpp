#pragma once

/// @file game_logger.hpp
/// @brief Category-filtered logging for the simulation, level and session code.
///
/// Records go to the kcenon GlobalLoggerRegistry as
/// "[Category] message {key=value, ...}".  Each category has its own
/// minimum level so per-step Physics chatter can be silenced without
/// losing level transitions; the `logging.*` config keys set them at
/// startup.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "brk/foundation/game_result.hpp"

namespace breakout::foundation {

/// Ordered by severity; mapped one-to-one onto kcenon's log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup and wiring
    Physics = 1, ///< Per-step outcomes (Debug by default)
    Level   = 2, ///< Level loading, advances, restarts, progress saves
    Session = 3, ///< Loop start/stop, pause, input
    Config  = 4  ///< Config file loading and type mismatches
};

inline constexpr std::size_t kLogCategoryCount = 5;

/// Display name used inside the "[...]" prefix and the "brk.<Name>" logger.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Physics", "Level", "Session", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Lower-case name used under the `logging.` config section.
constexpr std::string_view logCategoryKey(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> keys = {
        "core", "physics", "level", "session", "config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? keys[idx] : "";
}

/// Game position a record refers to.  Set fields are appended in the
/// order level, lives, tick, then @c extra.
struct LogContext {
    std::optional<std::size_t> levelIndex;
    std::optional<int32_t> lives;
    std::optional<uint64_t> tickNumber;
    std::unordered_map<std::string, std::string> extra;
};

/// Process-wide logger front end.  Category levels are atomics, so the
/// loop thread may log while another thread changes them.
///
/// A logger registered as "brk.<Category>" receives that category;
/// everything else goes to the registry default.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;

    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Put every category back to its default: Physics at Debug, the rest at Info.
    void resetCategoryLevels();

    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Accepts the lower-case level names ("trace" ... "off").
/// Anything else is InvalidArgument.
GameResult<LogLevel> parseLogLevel(std::string_view name);

} // namespace breakout::foundation

/// BRK_MIN_LOG_LEVEL (0=Trace .. 6=Off) compiles out calls below it; the
/// runtime category level is checked as well.
#ifndef BRK_MIN_LOG_LEVEL
    #define BRK_MIN_LOG_LEVEL 0
#endif

#define BRK_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= BRK_MIN_LOG_LEVEL &&                      \
            ::breakout::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::breakout::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define BRK_LOG_DEBUG(cat, msg) \
    BRK_LOG(::breakout::foundation::LogLevel::Debug, (cat), (msg))

#define BRK_LOG_INFO(cat, msg) \
    BRK_LOG(::breakout::foundation::LogLevel::Info, (cat), (msg))

#define BRK_LOG_WARN(cat, msg) \
    BRK_LOG(::breakout::foundation::LogLevel::Warning, (cat), (msg))

#define BRK_LOG_ERROR(cat, msg) \
    BRK_LOG(::breakout::foundation::LogLevel::Error, (cat), (msg))
