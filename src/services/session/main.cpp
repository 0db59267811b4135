/// @file main.cpp
/// @brief Headless session entry point.
///
/// Loads the level catalog named by the config, runs a GameSession on its
/// fixed-rate loop and steers the paddle toward the ball until SIGINT or
/// SIGTERM arrives.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "brk/foundation/config_manager.hpp"
#include "brk/game/level_catalog.hpp"
#include "brk/game/level_lifecycle.hpp"
#include "brk/service/game_session.hpp"
#include "brk/service/service_runner.hpp"

namespace {

/// Move the paddle so its center tracks the ball horizontally.
breakout::game::Movement steerToward(const breakout::game::GameState& state) {
    const float paddleCenter = state.GetPaddle().Bounds().Center().x;
    const float ballX = state.GetBall().center.x;
    const float deadZone = state.GetPaddle().width * 0.1f;

    if (ballX < paddleCenter - deadZone) {
        return breakout::game::Movement::Left;
    }
    if (ballX > paddleCenter + deadZone) {
        return breakout::game::Movement::Right;
    }
    return breakout::game::Movement::None;
}

} // namespace

int main(int argc, char* argv[]) {
    breakout::service::SignalHandler signals;

    auto configPath = breakout::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/brk.yaml";
    }

    breakout::foundation::ConfigManager config;
    auto loadResult = breakout::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto logResult = breakout::service::applyLogLevelsFrom(config);
    if (!logResult) {
        std::cerr << "Invalid logging config: "
                  << logResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto levelsPath = breakout::service::levelsPathFrom(config);
    auto levels = breakout::game::LoadLevelCatalog(levelsPath);
    if (!levels) {
        std::cerr << "Failed to load levels from " << levelsPath << ": "
                  << levels.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto lifecycle = breakout::game::LevelLifecycle::Create(
        std::move(levels).value(),
        std::make_shared<breakout::game::InMemoryLevelStore>(),
        breakout::service::levelSettingsFrom(config));
    if (!lifecycle) {
        std::cerr << "Invalid level setup: "
                  << lifecycle.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto sessionCfg = breakout::service::sessionConfigFrom(config);
    breakout::service::GameSession session(sessionCfg, std::move(lifecycle).value());

    auto startResult = session.start();
    if (!startResult) {
        std::cerr << "Failed to start session: "
                  << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Session started (tick_rate: " << session.config().tickRate
              << " Hz, levels: " << levelsPath << ")\n";

    using namespace std::chrono_literals;
    while (!signals.shutdownRequested()) {
        session.setMovement(steerToward(*session.snapshot()));
        std::this_thread::sleep_for(5ms);
    }

    std::cout << "Shutting down session...\n";
    session.stop();

    const auto stats = session.stats();
    std::cout << "Session stopped (ticks: " << stats.ticks
              << ", lives lost: " << stats.livesLost
              << ", levels cleared: " << stats.levelsCleared << ")\n";
    return EXIT_SUCCESS;
}
