/// @file logger_adapter_test.cpp
/// @brief GameLogger routing, category filtering and context formatting.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "brk/foundation/error_code.hpp"
#include "brk/foundation/game_logger.hpp"
#include "brk/game/level_lifecycle.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace breakout::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

namespace {

struct LogRecord {
    log_level level;
    std::string message;
};

/// Keeps every record it is handed.
class RecordingLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        flushed = true;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool flushed = false;

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

breakout::game::LevelDescriptor clearableLevel(const char* name) {
    breakout::game::LevelDescriptor level;
    level.name = name;
    level.size = {100.0f, 80.0f};
    level.paddle = {{42.0f, 74.0f}, 16.0f, 2.0f};
    level.ball = {{50.0f, 20.0f}, 1.0f};
    level.blocks = {{{45.0f, 10.0f}, 10.0f, 4.0f, 1}};
    return level;
}

}  // namespace

class GameLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        recorder_ = std::make_shared<RecordingLogger>();
        registry.set_default_logger(recorder_);
        GameLogger::instance().resetCategoryLevels();
    }

    void TearDown() override {
        GameLogger::instance().resetCategoryLevels();
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<RecordingLogger> recorder_;
};

// ===========================================================================
// Names and parsing
// ===========================================================================

TEST(LogCategoryTest, NamesAndConfigKeys) {
    EXPECT_EQ(logCategoryName(LogCategory::Physics), "Physics");
    EXPECT_EQ(logCategoryName(LogCategory::Level), "Level");
    EXPECT_EQ(logCategoryKey(LogCategory::Physics), "physics");
    EXPECT_EQ(logCategoryKey(LogCategory::Config), "config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(99)), "Unknown");
    EXPECT_EQ(logCategoryKey(static_cast<LogCategory>(99)), "");
}

TEST(ParseLogLevelTest, KnownNames) {
    EXPECT_EQ(parseLogLevel("trace").value(), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("debug").value(), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning").value(), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off").value(), LogLevel::Off);
}

TEST(ParseLogLevelTest, UnknownOrMiscasedNameFails) {
    for (const char* name : {"Info", "warn", ""}) {
        auto result = parseLogLevel(name);
        ASSERT_TRUE(result.hasError()) << name;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    }
}

TEST(LoggerErrorCodeTest, FlushFailureBelongsToLogger) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// ===========================================================================
// Category filtering
// ===========================================================================

TEST_F(GameLoggerTest, PhysicsDefaultsToDebugOthersToInfo) {
    auto& logger = GameLogger::instance();
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Physics));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Level));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Level));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Level));
}

TEST_F(GameLoggerTest, SilencingPhysicsKeepsLevelRecords) {
    auto& logger = GameLogger::instance();
    logger.setCategoryLevel(LogCategory::Physics, LogLevel::Warning);

    logger.log(LogLevel::Debug, LogCategory::Physics, "Block hit");
    logger.log(LogLevel::Info, LogCategory::Level, "Level cleared");

    auto records = recorder_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Level] Level cleared");
    EXPECT_EQ(records[0].level, log_level::info);
}

TEST_F(GameLoggerTest, ResetRestoresDefaults) {
    auto& logger = GameLogger::instance();
    logger.setCategoryLevel(LogCategory::Physics, LogLevel::Off);
    logger.setCategoryLevel(LogCategory::Session, LogLevel::Error);

    logger.resetCategoryLevels();

    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Physics), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Session), LogLevel::Info);
}

TEST_F(GameLoggerTest, CategoryLoggerTakesPrecedenceOverDefault) {
    auto levelLogger = std::make_shared<RecordingLogger>();
    ASSERT_TRUE(
        GlobalLoggerRegistry::instance().register_logger("brk.Level", levelLogger).is_ok());

    GameLogger::instance().log(LogLevel::Info, LogCategory::Level, "Level restarted");
    GameLogger::instance().log(LogLevel::Info, LogCategory::Session, "Session paused");

    ASSERT_EQ(levelLogger->records().size(), 1u);
    ASSERT_EQ(recorder_->records().size(), 1u);
    EXPECT_EQ(recorder_->records()[0].message, "[Session] Session paused");
}

// ===========================================================================
// Context
// ===========================================================================

TEST_F(GameLoggerTest, ContextListsLevelLivesTickInOrder) {
    LogContext ctx;
    ctx.tickNumber = 812;
    ctx.lives = 2;
    ctx.levelIndex = 1;

    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Level,
                                          "Life lost", ctx);

    auto records = recorder_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Level] Life lost {level=1, lives=2, tick=812}");
}

TEST_F(GameLoggerTest, ExtraFieldsFollowFixedOnes) {
    LogContext ctx;
    ctx.lives = 0;
    ctx.extra["outcome"] = "level_restarted";

    GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Level,
                                          "Out of lives", ctx);

    auto records = recorder_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Level] Out of lives {lives=0, outcome=level_restarted}");
    EXPECT_EQ(records[0].level, log_level::warning);
}

TEST_F(GameLoggerTest, EmptyContextAddsNoBraces) {
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Config,
                                          "Config loaded", LogContext{});

    auto records = recorder_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Config] Config loaded");
}

TEST_F(GameLoggerTest, LevelAdvanceIsLoggedWithPosition) {
    breakout::game::LevelSettings settings;
    settings.launchAngle = 180.0f;
    auto lifecycle = breakout::game::LevelLifecycle::Create(
        {clearableLevel("one"), clearableLevel("two")}, nullptr, settings);
    ASSERT_TRUE(lifecycle.hasValue());

    auto update = lifecycle.value().Advance(breakout::game::Movement::None, 1000.0f);
    ASSERT_EQ(update.outcome, breakout::game::LevelOutcome::LevelAdvanced);

    auto records = recorder_->records();
    auto it = std::find_if(records.begin(), records.end(), [](const LogRecord& r) {
        return r.message.rfind("[Level] Level transition", 0) == 0;
    });
    ASSERT_NE(it, records.end());
    EXPECT_EQ(it->message,
              "[Level] Level transition {level=1, lives=3, outcome=level_advanced}");
}

// ===========================================================================
// Macros and flush
// ===========================================================================

TEST_F(GameLoggerTest, MacrosHonourCategoryLevel) {
    BRK_LOG_DEBUG(LogCategory::Physics, "Paddle bounce");
    BRK_LOG_DEBUG(LogCategory::Session, "Movement latched");
    BRK_LOG_WARN(LogCategory::Session, "Frame overran");

    auto records = recorder_->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "[Physics] Paddle bounce");
    EXPECT_EQ(records[1].message, "[Session] Frame overran");
}

TEST_F(GameLoggerTest, FlushReachesDefaultLogger) {
    auto result = GameLogger::instance().flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(recorder_->flushed);
}
