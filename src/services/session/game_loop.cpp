/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "brk/service/game_loop.hpp"

#include <optional>

namespace breakout::service {

namespace {

float toMilliseconds(std::chrono::steady_clock::duration d) {
    return static_cast<float>(
               std::chrono::duration_cast<std::chrono::microseconds>(d).count()) /
           1'000.0f;
}

}  // namespace

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setTickCallback(TickCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

bool GameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    thread_ = std::thread([this] { run(); });
    return true;
}

void GameLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

TickMetrics GameLoop::tick() {
    auto metrics = executeTick(nominalDeltaMs());
    recordMetrics(metrics);
    return metrics;
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t GameLoop::tickRate() const noexcept {
    return tickRate_;
}

std::chrono::microseconds GameLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

uint64_t GameLoop::tickCount() const noexcept {
    return tickCount_.load();
}

TickMetrics GameLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

float GameLoop::nominalDeltaMs() const noexcept {
    return static_cast<float>(targetFrameTime_.count()) / 1'000.0f;
}

void GameLoop::recordMetrics(const TickMetrics& metrics) {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    lastMetrics_ = metrics;
}

void GameLoop::run() {
    using Clock = std::chrono::steady_clock;

    auto deadline = Clock::now();
    std::optional<Clock::time_point> previousStart;

    while (running_.load()) {
        deadline += targetFrameTime_;

        const auto frameStart = Clock::now();
        const float deltaMs = previousStart ? toMilliseconds(frameStart - *previousStart)
                                            : nominalDeltaMs();

        auto metrics = executeTick(deltaMs);
        if (previousStart) {
            metrics.frameTime = std::chrono::duration_cast<std::chrono::microseconds>(
                frameStart - *previousStart);
        }
        previousStart = frameStart;
        recordMetrics(metrics);

        const auto now = Clock::now();
        if (now < deadline) {
            std::this_thread::sleep_until(deadline);
        } else {
            // Late: start the schedule over instead of bursting to catch up.
            deadline = now;
        }
    }
}

TickMetrics GameLoop::executeTick(float deltaMs) {
    const auto start = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (tickCallback_) {
            tickCallback_(deltaMs);
        }
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    TickMetrics metrics;
    metrics.deltaMs = deltaMs;
    metrics.updateTime = elapsed;
    metrics.frameTime = elapsed;
    metrics.budgetUtilization = static_cast<float>(elapsed.count()) /
                                static_cast<float>(targetFrameTime_.count());
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = elapsed > targetFrameTime_;
    return metrics;
}

}  // namespace breakout::service
