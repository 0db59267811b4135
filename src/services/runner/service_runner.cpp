/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "brk/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "brk/foundation/game_logger.hpp"

namespace breakout::service {

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- Config loading ----------------------------------------------------------

foundation::GameResult<void>
loadConfig(foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("BRK_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

game::LevelSettings levelSettingsFrom(const foundation::ConfigManager& config) {
    game::LevelSettings settings;
    settings.startingLives = config.getOr<int32_t>("game.starting_lives", settings.startingLives);
    settings.ballSpeed = config.getOr<float>("game.ball_speed", settings.ballSpeed);
    settings.launchAngle = config.getOr<float>("game.launch_angle", settings.launchAngle);
    settings.physics.paddleSpeed =
        config.getOr<float>("game.paddle_speed", settings.physics.paddleSpeed);
    settings.physics.paddleSpin =
        config.getOr<float>("game.paddle_spin", settings.physics.paddleSpin);
    settings.physics.maxBounceAngle =
        config.getOr<float>("game.max_bounce_angle", settings.physics.maxBounceAngle);
    return settings;
}

GameSessionConfig sessionConfigFrom(const foundation::ConfigManager& config) {
    GameSessionConfig session;
    session.tickRate = config.getOr<uint32_t>("session.tick_rate", session.tickRate);
    session.maxDeltaMs = config.getOr<float>("session.max_delta_ms", session.maxDeltaMs);
    return session;
}

foundation::GameResult<void>
applyLogLevelsFrom(const foundation::ConfigManager& config) {
    using foundation::LogCategory;
    using foundation::LogLevel;

    std::vector<std::pair<LogCategory, LogLevel>> levels;
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        const std::string key = "logging." + std::string(foundation::logCategoryKey(cat));
        auto name = config.get<std::string>(key);
        if (!name) {
            continue;
        }
        auto level = foundation::parseLogLevel(name.value());
        if (!level) {
            return foundation::GameResult<void>::err(foundation::GameError(
                foundation::ErrorCode::InvalidArgument,
                key + ": " + std::string(level.error().message())));
        }
        levels.emplace_back(cat, level.value());
    }

    auto& logger = foundation::GameLogger::instance();
    for (const auto& [cat, level] : levels) {
        logger.setCategoryLevel(cat, level);
    }
    return foundation::GameResult<void>::ok();
}

std::filesystem::path levelsPathFrom(const foundation::ConfigManager& config) {
    std::filesystem::path levels =
        config.getOr<std::string>("session.levels_file", std::string("levels.yaml"));
    if (levels.is_absolute() || config.sourcePath().empty()) {
        return levels;
    }
    return config.sourcePath().parent_path() / levels;
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace breakout::service
