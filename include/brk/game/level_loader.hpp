#pragma once

/// @file level_loader.hpp
/// @brief Builds a fresh GameState from a static level description.

#include "brk/foundation/game_result.hpp"
#include "brk/game/entities.hpp"
#include "brk/game/level_types.hpp"

namespace breakout::game {

/// Check a descriptor for contract violations.
///
/// Rejects an empty block list, non-positive board, block, paddle or ball
/// dimensions, a block density below one, a block, paddle or ball that
/// does not fit inside the board, and a ball spawned touching the paddle
/// or a block.  Block failures carry the block index (std::size_t) as
/// context.
///
/// @return Success or InvalidLevel.
[[nodiscard]] foundation::GameResult<void> ValidateLevel(const LevelDescriptor& level);

/// Check loader settings (lives, ball speed, paddle tuning).
///
/// @return Success or InvalidArgument.
[[nodiscard]] foundation::GameResult<void> ValidateSettings(const LevelSettings& settings);

/// Build the initial state of a level.
///
/// Every entity is copied out of @p level, lives are reset to
/// settings.startingLives and the ball is launched along
/// Down().Rotate(settings.launchAngle) at settings.ballSpeed.
///
/// @return The new state, or the first validation error.
[[nodiscard]] foundation::GameResult<GameState> BuildInitialState(
    const LevelDescriptor& level, const LevelSettings& settings = {});

}  // namespace breakout::game
