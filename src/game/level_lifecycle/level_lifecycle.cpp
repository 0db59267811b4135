/// @file level_lifecycle.cpp
/// @brief LevelLifecycle implementation.

#include "brk/game/level_lifecycle.hpp"

#include <string>
#include <utility>

#include "brk/foundation/game_logger.hpp"
#include "brk/game/level_loader.hpp"
#include "brk/game/simulation.hpp"

namespace breakout::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::string_view LevelOutcomeName(LevelOutcome outcome) noexcept {
    switch (outcome) {
        case LevelOutcome::Continue:           return "continue";
        case LevelOutcome::LifeLost:           return "life_lost";
        case LevelOutcome::LevelRestarted:     return "level_restarted";
        case LevelOutcome::LevelAdvanced:      return "level_advanced";
        case LevelOutcome::FinalLevelRepeated: return "final_level_repeated";
    }
    return "unknown";
}

namespace {

std::size_t resolveStartIndex(ILevelStore& store, std::size_t levelCount) {
    auto stored = store.Load();
    if (!stored) {
        if (stored.error().code() != ErrorCode::LevelNotFound) {
            LogContext ctx;
            ctx.extra["error"] = std::string(stored.error().message());
            GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Level,
                                                  "Could not read saved level, starting at 0", ctx);
        }
        return 0;
    }
    if (stored.value() >= levelCount) {
        LogContext ctx;
        ctx.levelIndex = stored.value();
        GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Level,
                                              "Saved level out of range, holding at final level", ctx);
        return levelCount - 1;
    }
    return stored.value();
}

}  // namespace

GameResult<LevelLifecycle> LevelLifecycle::Create(std::vector<LevelDescriptor> levels,
                                                  std::shared_ptr<ILevelStore> store,
                                                  LevelSettings settings) {
    if (levels.empty()) {
        return GameResult<LevelLifecycle>::err(
            GameError(ErrorCode::EmptyLevelCatalog, "no levels to play"));
    }
    if (auto valid = ValidateSettings(settings); !valid) {
        return GameResult<LevelLifecycle>::err(valid.error());
    }

    // Build every level up front so later rebuilds cannot fail.
    std::vector<GameState> initialStates;
    initialStates.reserve(levels.size());
    for (std::size_t i = 0; i < levels.size(); ++i) {
        auto built = BuildInitialState(levels[i], settings);
        if (!built) {
            std::string message = "level " + std::to_string(i) + " (" + levels[i].name +
                                  "): " + std::string(built.error().message());
            return GameResult<LevelLifecycle>::err(
                GameError(built.error().code(), std::move(message), i));
        }
        initialStates.push_back(std::move(built).value());
    }

    if (!store) {
        store = std::make_shared<InMemoryLevelStore>();
    }
    const std::size_t index = resolveStartIndex(*store, levels.size());

    return GameResult<LevelLifecycle>::ok(LevelLifecycle(
        std::move(levels), std::move(initialStates), std::move(store), settings, index));
}

LevelLifecycle::LevelLifecycle(std::vector<LevelDescriptor> levels,
                               std::vector<GameState> initialStates,
                               std::shared_ptr<ILevelStore> store,
                               LevelSettings settings,
                               std::size_t index)
    : levels_(std::move(levels)),
      initialStates_(std::move(initialStates)),
      store_(std::move(store)),
      settings_(settings),
      index_(index),
      state_(initialStates_[index]) {}

LevelUpdate LevelLifecycle::Advance(Movement movement, float deltaTimeMs) {
    auto step = Step(state_, movement, deltaTimeMs);

    LevelUpdate update;
    if (step.state.IsOutOfLives()) {
        state_ = initialStates_[index_];
        update.outcome = LevelOutcome::LevelRestarted;
    } else if (step.state.IsCleared()) {
        update.outcome = completeLevel();
    } else {
        update.outcome = step.LostLife() ? LevelOutcome::LifeLost : LevelOutcome::Continue;
        state_ = std::move(step.state);
    }
    update.transitions = std::move(step.transitions);

    if (update.outcome != LevelOutcome::Continue) {
        LogContext ctx;
        ctx.levelIndex = index_;
        ctx.lives = state_.Lives();
        ctx.extra["outcome"] = std::string(LevelOutcomeName(update.outcome));
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Level,
                                              "Level transition", ctx);
    }
    return update;
}

void LevelLifecycle::RestartLevel() {
    state_ = initialStates_[index_];
}

LevelOutcome LevelLifecycle::completeLevel() {
    if (index_ + 1 < levels_.size()) {
        ++index_;
        state_ = initialStates_[index_];
        persistIndex();
        return LevelOutcome::LevelAdvanced;
    }
    state_ = initialStates_[index_];
    return LevelOutcome::FinalLevelRepeated;
}

void LevelLifecycle::persistIndex() {
    auto saved = store_->Save(index_);
    if (!saved) {
        LogContext ctx;
        ctx.levelIndex = index_;
        ctx.extra["error"] = std::string(saved.error().message());
        GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Level,
                                              "Could not save level index", ctx);
    }
}

}  // namespace breakout::game
