/// @file config_manager.cpp
/// @brief ConfigManager implementation over yaml-cpp.

#include "brk/foundation/config_manager.hpp"

#include "brk/foundation/game_logger.hpp"

namespace breakout::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        sourcePath_ = path;
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    LogContext ctx;
    ctx.extra["path"] = path.string();
    ctx.extra["keys"] = std::to_string(entries_.size());
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Config,
                                          "Configuration loaded", ctx);
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        sourcePath_.clear();
        return GameResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::filesystem::path ConfigManager::sourcePath() const {
    std::lock_guard lock(mutex_);
    return sourcePath_;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    // Copy out so callbacks may call back into the manager.
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

void ConfigManager::reportTypeMismatch(std::string_view key) {
    LogContext ctx;
    ctx.extra["key"] = std::string(key);
    GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Config,
                                          "Config value has wrong type, using default", ctx);
}

}  // namespace breakout::foundation
