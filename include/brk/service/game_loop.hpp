#pragma once

/// @file game_loop.hpp
/// @brief Thread that calls the simulation at a steady rate.
///
/// The simulation core is driven by elapsed milliseconds.  GameLoop
/// supplies them: on its own thread it hands each callback the wall time
/// since the previous call, so a late frame shows up as a larger delta
/// rather than as lost game time.  tick() runs one frame on the caller's
/// thread with the nominal delta and is what the tests use.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace breakout::service {

/// Frames per second used when none (or zero) is configured.
inline constexpr uint32_t kDefaultTickRate = 60;

/// Timing of one frame.
struct TickMetrics {
    /// Milliseconds handed to the callback.
    float deltaMs = 0.0f;

    /// Time spent inside the callback.
    std::chrono::microseconds updateTime{0};

    /// Start-to-start time of this frame; equals updateTime for tick().
    std::chrono::microseconds frameTime{0};

    /// updateTime over the frame budget.
    float budgetUtilization = 0.0f;

    uint64_t tickNumber = 0;

    /// The callback ran longer than one frame budget.
    bool overrun = false;
};

class GameLoop {
public:
    using TickCallback = std::function<void(float deltaMs)>;

    explicit GameLoop(uint32_t tickRate = kDefaultTickRate);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    void setTickCallback(TickCallback callback);

    /// Spawn the loop thread.  The first frame gets the nominal delta.
    ///
    /// @return false if the thread is already running.
    [[nodiscard]] bool start();

    /// Join the loop thread; no-op when stopped.
    void stop();

    /// Run one frame on the calling thread with the nominal delta.
    /// Not for use while the loop thread is running.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept;
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;
    [[nodiscard]] uint64_t tickCount() const noexcept;
    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    void run();
    TickMetrics executeTick(float deltaMs);
    void recordMetrics(const TickMetrics& metrics);
    [[nodiscard]] float nominalDeltaMs() const noexcept;

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    mutable std::mutex callbackMutex_;
    TickCallback tickCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;
};

}  // namespace breakout::service
