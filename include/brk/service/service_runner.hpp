#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for executable entry points.
///
/// Provides signal handling, configuration loading and CLI argument
/// parsing for the brk executables.

#include <atomic>
#include <filesystem>

#include "brk/foundation/config_manager.hpp"
#include "brk/foundation/game_result.hpp"
#include "brk/service/game_session.hpp"

namespace breakout::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// On destruction the default handlers are restored so that a second
/// signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. BRK_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @param config      ConfigManager to populate.
/// @param defaultPath Fallback config file path.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::GameResult<void>
loadConfig(foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Read the `game.*` keys into level settings, defaulting missing ones.
[[nodiscard]] game::LevelSettings levelSettingsFrom(const foundation::ConfigManager& config);

/// Read the `session.*` keys into a session config, defaulting missing ones.
[[nodiscard]] GameSessionConfig sessionConfigFrom(const foundation::ConfigManager& config);

/// Set each category's minimum level from `logging.<category>`
/// (e.g. `logging.physics: warning`).  Categories without a key keep
/// their current level; an unknown level name is InvalidArgument and
/// leaves all levels untouched.
[[nodiscard]] foundation::GameResult<void>
applyLogLevelsFrom(const foundation::ConfigManager& config);

/// Resolve `session.levels_file` against the directory of the loaded
/// config file.  Absolute paths are returned unchanged.
[[nodiscard]] std::filesystem::path levelsPathFrom(const foundation::ConfigManager& config);

} // namespace breakout::service
