#pragma once

/// @file game_session.hpp
/// @brief Host-side driver that runs a LevelLifecycle on a GameLoop.
///
/// The session owns the per-player mutable context that the simulation
/// core leaves out: the latched paddle input, the paused flag, and the
/// published state snapshot read by renderers or other threads.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "brk/foundation/game_result.hpp"
#include "brk/game/entities.hpp"
#include "brk/game/level_lifecycle.hpp"
#include "brk/service/game_loop.hpp"

namespace breakout::service {

/// Largest step accepted by update() unless configured otherwise.
inline constexpr float kDefaultMaxDeltaMs = 100.0f;

struct GameSessionConfig {
    uint32_t tickRate = kDefaultTickRate;

    /// Elapsed time above this is clamped before stepping, which bounds
    /// how far the ball moves in one tick after a stall.
    float maxDeltaMs = kDefaultMaxDeltaMs;
};

/// Running counters, reset only by constructing a new session.
struct SessionStats {
    uint64_t ticks = 0;
    uint64_t livesLost = 0;
    uint64_t levelRestarts = 0;
    uint64_t levelsCleared = 0;
};

class GameSession {
public:
    GameSession(GameSessionConfig config, game::LevelLifecycle lifecycle);
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;
    GameSession(GameSession&&) = delete;
    GameSession& operator=(GameSession&&) = delete;

    /// Latch the paddle input used by subsequent ticks.
    void setMovement(game::Movement movement) noexcept;
    [[nodiscard]] game::Movement movement() const noexcept;

    void pause();
    void resume();

    /// Flip the paused flag.
    /// @return The new paused state.
    bool togglePause();
    [[nodiscard]] bool isPaused() const noexcept;

    /// Advance one step by @p deltaMs, clamped to [0, maxDeltaMs].
    ///
    /// Does nothing and returns Continue while paused.
    game::LevelOutcome update(float deltaMs);

    /// Latest published state; safe to hold across later updates.
    [[nodiscard]] std::shared_ptr<const game::GameState> snapshot() const;

    [[nodiscard]] std::size_t levelIndex() const;
    [[nodiscard]] SessionStats stats() const;
    [[nodiscard]] const GameSessionConfig& config() const noexcept { return config_; }

    /// Run update() from the game loop thread.
    ///
    /// @return SessionAlreadyRunning if the loop is already started.
    [[nodiscard]] foundation::GameResult<void> start();

    void stop();
    [[nodiscard]] bool isRunning() const noexcept;

    /// Metrics of the most recent loop tick.
    [[nodiscard]] TickMetrics lastTickMetrics() const;

private:
    void logTransitions(const std::vector<game::Transition>& transitions) const;

    GameSessionConfig config_;

    mutable std::mutex mutex_;
    game::LevelLifecycle lifecycle_;
    std::shared_ptr<const game::GameState> snapshot_;
    SessionStats stats_;

    std::atomic<game::Movement> movement_{game::Movement::None};
    std::atomic<bool> paused_{false};

    GameLoop loop_;
};

}  // namespace breakout::service
