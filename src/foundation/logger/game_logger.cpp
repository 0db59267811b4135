/// @file game_logger.cpp
/// @brief GameLogger implementation over kcenon common_system logging.

#include "brk/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>
#include <utility>

namespace breakout::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: BRK -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Debug,  // Physics
    LogLevel::Info,   // Level
    LogLevel::Info,   // Session
    LogLevel::Info    // Config
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.levelIndex) {
        append("level", std::to_string(*ctx.levelIndex));
    }
    if (ctx.lives) {
        append("lives", std::to_string(*ctx.lives));
    }
    if (ctx.tickNumber) {
        append("tick", std::to_string(*ctx.tickNumber));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    // Atomic for lock-free reads from the loop thread.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        resetLevels();
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            loggerNames[i] = std::string("brk.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    void resetLevels() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_release);
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // Unregistered names resolve to the null logger; use the default.
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    std::string format(LogCategory cat, std::string_view msg,
                       std::string_view ctx) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        return formatted;
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    logger->log(mapLevel(level), impl_->format(cat, msg, {}));
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    logger->log(mapLevel(level), impl_->format(cat, msg, formatContext(ctx)));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

void GameLogger::resetCategoryLevels() {
    impl_->resetLevels();
}

GameResult<void> GameLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

GameResult<LogLevel> parseLogLevel(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 7> kNames = {{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    }};
    for (const auto& [key, level] : kNames) {
        if (key == name) {
            return GameResult<LogLevel>::ok(level);
        }
    }
    return GameResult<LogLevel>::err(
        GameError(ErrorCode::InvalidArgument,
                  "unknown log level: " + std::string(name)));
}

} // namespace breakout::foundation
