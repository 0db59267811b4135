#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "brk/foundation/game_result.hpp"

namespace breakout::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from file or text, dotted-key access
/// (e.g., "session.tick_rate"), setting values at runtime, and
/// registering callbacks for change notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    GameResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back when the key is absent.
    ///
    /// A present key with the wrong type still falls back, but is logged
    /// as a warning so a typo in the file does not go unnoticed.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers for that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Path of the last file loaded; empty when loaded from text or unset.
    [[nodiscard]] std::filesystem::path sourcePath() const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    static void reportTypeMismatch(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
    std::filesystem::path sourcePath_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result) {
        return std::move(result).value();
    }
    if (result.error().code() == ErrorCode::ConfigTypeMismatch) {
        reportTypeMismatch(key);
    }
    return fallback;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace breakout::foundation
