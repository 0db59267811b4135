#pragma once

/// @file level_store.hpp
/// @brief Port for persisting the player's current level index.

#include <cstddef>
#include <mutex>
#include <optional>

#include "brk/foundation/game_result.hpp"

namespace breakout::game {

/// Reads and writes the index of the level the player is on.
///
/// The lifecycle depends only on this interface; where the index lives
/// (browser storage, a save file, a profile service) is up to the host.
class ILevelStore {
public:
    virtual ~ILevelStore() = default;

    /// Stored index, or LevelNotFound when nothing was saved yet.
    [[nodiscard]] virtual foundation::GameResult<std::size_t> Load() = 0;

    [[nodiscard]] virtual foundation::GameResult<void> Save(std::size_t levelIndex) = 0;
};

/// Process-local store, used by tests and by hosts without persistence.
class InMemoryLevelStore final : public ILevelStore {
public:
    InMemoryLevelStore() = default;
    explicit InMemoryLevelStore(std::size_t levelIndex) : index_(levelIndex) {}

    [[nodiscard]] foundation::GameResult<std::size_t> Load() override {
        std::lock_guard lock(mutex_);
        if (!index_) {
            return foundation::GameResult<std::size_t>::err(foundation::GameError(
                foundation::ErrorCode::LevelNotFound, "no level saved"));
        }
        return foundation::GameResult<std::size_t>::ok(*index_);
    }

    [[nodiscard]] foundation::GameResult<void> Save(std::size_t levelIndex) override {
        std::lock_guard lock(mutex_);
        index_ = levelIndex;
        return foundation::GameResult<void>::ok();
    }

private:
    std::mutex mutex_;
    std::optional<std::size_t> index_;
};

}  // namespace breakout::game
