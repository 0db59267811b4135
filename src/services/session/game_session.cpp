/// @file game_session.cpp
/// @brief GameSession implementation.

#include "brk/service/game_session.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "brk/foundation/game_logger.hpp"

namespace breakout::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

GameSessionConfig sanitize(GameSessionConfig config) {
    if (!(config.maxDeltaMs > 0.0f) || !std::isfinite(config.maxDeltaMs)) {
        config.maxDeltaMs = kDefaultMaxDeltaMs;
    }
    return config;
}

}  // namespace

GameSession::GameSession(GameSessionConfig config, game::LevelLifecycle lifecycle)
    : config_(sanitize(config)),
      lifecycle_(std::move(lifecycle)),
      snapshot_(std::make_shared<const game::GameState>(lifecycle_.State())),
      loop_(config_.tickRate) {
    loop_.setTickCallback([this](float deltaMs) { update(deltaMs); });
}

GameSession::~GameSession() {
    stop();
}

void GameSession::setMovement(game::Movement movement) noexcept {
    movement_.store(movement);
}

game::Movement GameSession::movement() const noexcept {
    return movement_.load();
}

void GameSession::pause() {
    if (!paused_.exchange(true)) {
        BRK_LOG_INFO(LogCategory::Session, "Session paused");
    }
}

void GameSession::resume() {
    if (paused_.exchange(false)) {
        BRK_LOG_INFO(LogCategory::Session, "Session resumed");
    }
}

bool GameSession::togglePause() {
    if (isPaused()) {
        resume();
    } else {
        pause();
    }
    return isPaused();
}

bool GameSession::isPaused() const noexcept {
    return paused_.load();
}

game::LevelOutcome GameSession::update(float deltaMs) {
    if (paused_.load()) {
        return game::LevelOutcome::Continue;
    }
    const float dt = std::isfinite(deltaMs) ? std::clamp(deltaMs, 0.0f, config_.maxDeltaMs) : 0.0f;

    std::lock_guard<std::mutex> lock(mutex_);
    auto step = lifecycle_.Advance(movement_.load(), dt);

    ++stats_.ticks;
    switch (step.outcome) {
        case game::LevelOutcome::LifeLost:
            ++stats_.livesLost;
            break;
        case game::LevelOutcome::LevelRestarted:
            ++stats_.livesLost;
            ++stats_.levelRestarts;
            break;
        case game::LevelOutcome::LevelAdvanced:
        case game::LevelOutcome::FinalLevelRepeated:
            ++stats_.levelsCleared;
            break;
        case game::LevelOutcome::Continue:
            break;
    }

    logTransitions(step.transitions);
    snapshot_ = std::make_shared<const game::GameState>(lifecycle_.State());
    return step.outcome;
}

std::shared_ptr<const game::GameState> GameSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::size_t GameSession::levelIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifecycle_.LevelIndex();
}

SessionStats GameSession::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

GameResult<void> GameSession::start() {
    if (!loop_.start()) {
        return GameResult<void>::err(
            GameError(ErrorCode::SessionAlreadyRunning, "game session is already running"));
    }
    LogContext ctx;
    ctx.levelIndex = levelIndex();
    ctx.extra["tick_rate"] = std::to_string(loop_.tickRate());
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                          "Session started", ctx);
    return GameResult<void>::ok();
}

void GameSession::stop() {
    if (!loop_.isRunning()) {
        return;
    }
    loop_.stop();

    const auto counters = stats();
    LogContext ctx;
    ctx.tickNumber = counters.ticks;
    ctx.extra["lives_lost"] = std::to_string(counters.livesLost);
    ctx.extra["levels_cleared"] = std::to_string(counters.levelsCleared);
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                          "Session stopped", ctx);
}

bool GameSession::isRunning() const noexcept {
    return loop_.isRunning();
}

TickMetrics GameSession::lastTickMetrics() const {
    return loop_.lastMetrics();
}

void GameSession::logTransitions(const std::vector<game::Transition>& transitions) const {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Physics)) {
        return;
    }
    for (const auto& transition : transitions) {
        // Movement is emitted every tick; only contacts are worth a line.
        if (std::holds_alternative<game::PaddleMoved>(transition) ||
            std::holds_alternative<game::BallAdvanced>(transition)) {
            continue;
        }
        LogContext ctx;
        ctx.tickNumber = stats_.ticks;
        ctx.levelIndex = lifecycle_.LevelIndex();
        logger.logWithContext(LogLevel::Debug, LogCategory::Physics,
                              std::string(game::TransitionName(transition)), ctx);
    }
}

}  // namespace breakout::service
