#pragma once

/// @file simulation.hpp
/// @brief The simulation step: paddle and ball motion, collisions,
///        life loss and level clear.
///
/// A step is split into sub-steps short enough that the ball cannot pass
/// through the paddle or a block.  Order within one sub-step:
///   1. Paddle motion (clamped to the board)
///   2. Ball motion
///   3. Left, right and top walls
///   4. First paddle/block contact (paddle, then blocks in stored order)
///   5. Miss below the bottom edge -> LifeLost
///   6. No blocks left -> LevelCleared
/// A step ends early at the first LifeLost or LevelCleared.
///
/// Everything here is a pure function of its arguments.

#include <optional>
#include <vector>

#include "brk/game/entities.hpp"
#include "brk/game/transitions.hpp"

namespace breakout::game {

/// Result of one step: the next state and what happened, in order.
struct StepResult {
    GameState state;
    std::vector<Transition> transitions;

    [[nodiscard]] bool LostLife() const noexcept;
    [[nodiscard]] bool ClearedLevel() const noexcept;
};

/// Face of a rectangle struck by the ball.
struct Contact {
    Vector normal;   ///< Unit normal of the struck face.
};

/// Circle-vs-rectangle contact.
///
/// Returns the face of least penetration among the faces the ball is
/// moving into, or nullopt when the circle does not overlap the
/// rectangle or is already moving away from every overlapped face.
[[nodiscard]] std::optional<Contact> FindRectContact(const Ball& ball, const Rect& rect);

/// Walls the ball currently overlaps, in Left, Right, Top order.
[[nodiscard]] std::vector<WallBounce> DetectWalls(const GameState& state);

/// First surface the ball overlaps: the paddle, then blocks in order.
[[nodiscard]] std::optional<Transition> DetectContact(const GameState& state);

/// True when the ball's lower edge is below the board.
[[nodiscard]] bool IsMiss(const GameState& state) noexcept;

/// Advance @p state by @p deltaTimeMs and report the transitions taken.
///
/// The ball travels at most min(radius, thinnest paddle or block side)
/// per sub-step.  A negative or non-finite delta is treated as zero.
/// The input state is not modified.
[[nodiscard]] StepResult Step(const GameState& state, Movement movement, float deltaTimeMs);

/// Advance @p state by @p deltaTimeMs; equivalent to Step(...).state.
[[nodiscard]] GameState Tick(const GameState& state, Movement movement, float deltaTimeMs);

}  // namespace breakout::game
