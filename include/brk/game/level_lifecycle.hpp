#pragma once

/// @file level_lifecycle.hpp
/// @brief Level progression around the simulation step.
///
/// Owns the current level index and the state in play.  Out of lives
/// restarts the level; out of blocks advances to the next one, or
/// rebuilds the final level when none remain.  The index is persisted
/// through an injected ILevelStore.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "brk/foundation/game_result.hpp"
#include "brk/game/entities.hpp"
#include "brk/game/level_store.hpp"
#include "brk/game/level_types.hpp"
#include "brk/game/transitions.hpp"

namespace breakout::game {

/// What a lifecycle step did beyond moving things around.
enum class LevelOutcome : uint8_t {
    Continue,            ///< Nothing beyond physics.
    LifeLost,            ///< A life was lost; lives remain.
    LevelRestarted,      ///< Lives ran out; the level was rebuilt.
    LevelAdvanced,       ///< Blocks ran out; moved to the next level.
    FinalLevelRepeated   ///< Blocks ran out on the last level; rebuilt it.
};

[[nodiscard]] std::string_view LevelOutcomeName(LevelOutcome outcome) noexcept;

/// Result of LevelLifecycle::Advance().
struct LevelUpdate {
    LevelOutcome outcome = LevelOutcome::Continue;
    std::vector<Transition> transitions;
};

class LevelLifecycle {
public:
    /// Validate @p levels and @p settings and start at the stored level.
    ///
    /// A missing stored index starts at level 0; an index past the end
    /// holds at the final level.  A null @p store gets an in-memory one.
    ///
    /// @return The lifecycle, or EmptyLevelCatalog, InvalidLevel or
    ///         InvalidArgument.
    [[nodiscard]] static foundation::GameResult<LevelLifecycle> Create(
        std::vector<LevelDescriptor> levels,
        std::shared_ptr<ILevelStore> store,
        LevelSettings settings = {});

    /// Run one simulation step and apply any life or level transition.
    LevelUpdate Advance(Movement movement, float deltaTimeMs);

    /// Rebuild the current level from its descriptor.
    void RestartLevel();

    [[nodiscard]] const GameState& State() const noexcept { return state_; }
    [[nodiscard]] std::size_t LevelIndex() const noexcept { return index_; }
    [[nodiscard]] std::size_t LevelCount() const noexcept { return levels_.size(); }
    [[nodiscard]] const LevelDescriptor& CurrentLevel() const noexcept { return levels_[index_]; }
    [[nodiscard]] const LevelSettings& Settings() const noexcept { return settings_; }

private:
    LevelLifecycle(std::vector<LevelDescriptor> levels,
                   std::vector<GameState> initialStates,
                   std::shared_ptr<ILevelStore> store,
                   LevelSettings settings,
                   std::size_t index);

    LevelOutcome completeLevel();
    void persistIndex();

    std::vector<LevelDescriptor> levels_;
    std::vector<GameState> initialStates_;
    std::shared_ptr<ILevelStore> store_;
    LevelSettings settings_;
    std::size_t index_;
    GameState state_;
};

}  // namespace breakout::game
