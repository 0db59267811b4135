/// @file game_session_test.cpp
/// @brief Unit tests for GameSession.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "brk/service/game_session.hpp"

using namespace breakout::service;
using namespace std::chrono_literals;
using breakout::foundation::ErrorCode;
using breakout::game::LevelDescriptor;
using breakout::game::LevelLifecycle;
using breakout::game::LevelOutcome;
using breakout::game::LevelSettings;
using breakout::game::Movement;

namespace {

/// Ball moving straight up toward a single block.
LevelDescriptor upwardLevel() {
    LevelDescriptor level;
    level.name = "upward";
    level.size = {100.0f, 80.0f};
    level.paddle = {{42.0f, 74.0f}, 16.0f, 2.0f};
    level.ball = {{50.0f, 20.0f}, 1.0f};
    level.blocks = {{{45.0f, 10.0f}, 10.0f, 4.0f, 1}};
    return level;
}

/// Ball dropping past the paddle on every step.
LevelDescriptor missLevel() {
    LevelDescriptor level;
    level.name = "miss";
    level.size = {100.0f, 80.0f};
    level.paddle = {{60.0f, 74.0f}, 16.0f, 2.0f};
    level.ball = {{10.0f, 76.0f}, 1.0f};
    level.blocks = {{{80.0f, 5.0f}, 10.0f, 4.0f, 1}};
    return level;
}

LevelLifecycle makeLifecycle(std::vector<LevelDescriptor> levels, float launchAngle) {
    LevelSettings settings;
    settings.launchAngle = launchAngle;
    auto result = LevelLifecycle::Create(std::move(levels),
                                         std::make_shared<breakout::game::InMemoryLevelStore>(),
                                         settings);
    EXPECT_TRUE(result.hasValue());
    return std::move(result).value();
}

GameSessionConfig configWithMaxDelta(float maxDeltaMs) {
    GameSessionConfig config;
    config.tickRate = 100;
    config.maxDeltaMs = maxDeltaMs;
    return config;
}

}  // namespace

// ===========================================================================
// Stepping
// ===========================================================================

TEST(GameSessionTest, SnapshotStartsAtLevelState) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    auto snapshot = session.snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_FLOAT_EQ(snapshot->GetBall().center.y, 20.0f);
    EXPECT_EQ(snapshot->Lives(), 3);
}

TEST(GameSessionTest, UpdatePublishesNewSnapshot) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    auto before = session.snapshot();

    EXPECT_EQ(session.update(20.0f), LevelOutcome::Continue);

    auto after = session.snapshot();
    EXPECT_NE(before, after);
    // Held snapshots are immutable.
    EXPECT_FLOAT_EQ(before->GetBall().center.y, 20.0f);
    EXPECT_NEAR(after->GetBall().center.y, 19.0f, 1e-4f);
}

TEST(GameSessionTest, LargeDeltaIsClamped) {
    GameSession session(configWithMaxDelta(10.0f), makeLifecycle({upwardLevel()}, 180.0f));
    session.update(1000.0f);
    EXPECT_NEAR(session.snapshot()->GetBall().center.y, 19.5f, 1e-4f);
}

TEST(GameSessionTest, NegativeDeltaDoesNotMoveBall) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    session.update(-30.0f);
    EXPECT_FLOAT_EQ(session.snapshot()->GetBall().center.y, 20.0f);
}

TEST(GameSessionTest, NonPositiveMaxDeltaFallsBackToDefault) {
    GameSession session(configWithMaxDelta(0.0f), makeLifecycle({upwardLevel()}, 180.0f));
    EXPECT_FLOAT_EQ(session.config().maxDeltaMs, kDefaultMaxDeltaMs);
}

TEST(GameSessionTest, MovementIsLatched) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    EXPECT_EQ(session.movement(), Movement::None);

    session.setMovement(Movement::Right);
    session.update(25.0f);
    session.update(25.0f);

    // 0.08 units/ms * 50 ms = 4 units.
    EXPECT_NEAR(session.snapshot()->GetPaddle().position.x, 46.0f, 1e-4f);
}

// ===========================================================================
// Pause
// ===========================================================================

TEST(GameSessionTest, PausedSessionDoesNotAdvance) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    session.pause();
    EXPECT_TRUE(session.isPaused());

    auto before = session.snapshot();
    EXPECT_EQ(session.update(50.0f), LevelOutcome::Continue);
    EXPECT_EQ(session.snapshot(), before);
    EXPECT_EQ(session.stats().ticks, 0u);

    session.resume();
    EXPECT_FALSE(session.isPaused());
    session.update(50.0f);
    EXPECT_EQ(session.stats().ticks, 1u);
}

TEST(GameSessionTest, TogglePauseReturnsNewState) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    EXPECT_TRUE(session.togglePause());
    EXPECT_FALSE(session.togglePause());
}

// ===========================================================================
// Outcomes and statistics
// ===========================================================================

TEST(GameSessionTest, CountsLivesLostAndRestarts) {
    GameSession session({}, makeLifecycle({missLevel()}, 0.0f));

    EXPECT_EQ(session.update(100.0f), LevelOutcome::LifeLost);
    EXPECT_EQ(session.update(100.0f), LevelOutcome::LifeLost);
    EXPECT_EQ(session.update(100.0f), LevelOutcome::LevelRestarted);

    auto stats = session.stats();
    EXPECT_EQ(stats.ticks, 3u);
    EXPECT_EQ(stats.livesLost, 3u);
    EXPECT_EQ(stats.levelRestarts, 1u);
    EXPECT_EQ(session.snapshot()->Lives(), 3);
}

TEST(GameSessionTest, CountsClearedLevels) {
    GameSession session(configWithMaxDelta(200.0f),
                        makeLifecycle({upwardLevel(), upwardLevel()}, 180.0f));

    EXPECT_EQ(session.update(120.0f), LevelOutcome::LevelAdvanced);
    EXPECT_EQ(session.levelIndex(), 1u);
    EXPECT_EQ(session.update(120.0f), LevelOutcome::FinalLevelRepeated);
    EXPECT_EQ(session.levelIndex(), 1u);
    EXPECT_EQ(session.stats().levelsCleared, 2u);
}

// ===========================================================================
// Loop
// ===========================================================================

TEST(GameSessionTest, StartRunsLoop) {
    GameSession session(configWithMaxDelta(20.0f), makeLifecycle({upwardLevel()}, 180.0f));
    ASSERT_TRUE(session.start().hasValue());
    EXPECT_TRUE(session.isRunning());

    std::this_thread::sleep_for(100ms);
    session.stop();

    EXPECT_FALSE(session.isRunning());
    EXPECT_GT(session.stats().ticks, 0u);
    EXPECT_GT(session.lastTickMetrics().tickNumber, 0u);
}

TEST(GameSessionTest, DoubleStartFails) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    ASSERT_TRUE(session.start().hasValue());

    auto second = session.start();
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::SessionAlreadyRunning);
    session.stop();
}

TEST(GameSessionTest, PausedLoopKeepsRunning) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    session.pause();
    ASSERT_TRUE(session.start().hasValue());
    std::this_thread::sleep_for(60ms);

    EXPECT_TRUE(session.isRunning());
    EXPECT_EQ(session.stats().ticks, 0u);
    EXPECT_FLOAT_EQ(session.snapshot()->GetBall().center.y, 20.0f);
    session.stop();
}

TEST(GameSessionTest, StopWithoutStartIsSafe) {
    GameSession session({}, makeLifecycle({upwardLevel()}, 180.0f));
    session.stop();
    EXPECT_FALSE(session.isRunning());
}
