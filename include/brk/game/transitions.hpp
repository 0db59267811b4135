#pragma once

/// @file transitions.hpp
/// @brief The closed set of state changes a simulation step can make.
///
/// Each alternative records what happened; the matching Apply() overload
/// turns it into the next GameState.  Step() detects transitions in a
/// fixed order and folds them over the state with std::visit.

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

#include "brk/game/entities.hpp"

namespace breakout::game {

enum class Wall : uint8_t {
    Left,
    Right,
    Top
};

/// Paddle shifted by @p distance toward @p direction, then clamped.
struct PaddleMoved {
    Movement direction = Movement::None;
    float distance = 0.0f;
};

/// Ball advanced along its velocity for @p deltaTimeMs.
struct BallAdvanced {
    float deltaTimeMs = 0.0f;
};

/// Ball touched a side or the top of the board.
struct WallBounce {
    Wall wall = Wall::Top;
};

/// Ball struck the paddle face with unit normal @p normal.
struct PaddleBounce {
    Vector normal;
};

/// Ball struck block @p blockIndex (index before removal) on the face with
/// unit normal @p normal.
struct BlockBounce {
    std::size_t blockIndex = 0;
    Vector normal;
};

/// Ball crossed the bottom edge without being returned.
struct LifeLost {};

/// No blocks remain.
struct LevelCleared {};

using Transition = std::variant<PaddleMoved,
                                BallAdvanced,
                                WallBounce,
                                PaddleBounce,
                                BlockBounce,
                                LifeLost,
                                LevelCleared>;

/// Unit normal of a wall, pointing into the board.
[[nodiscard]] Vector WallNormal(Wall wall) noexcept;

[[nodiscard]] GameState Apply(const GameState& state, const PaddleMoved& t);
[[nodiscard]] GameState Apply(const GameState& state, const BallAdvanced& t);
[[nodiscard]] GameState Apply(const GameState& state, const WallBounce& t);
[[nodiscard]] GameState Apply(const GameState& state, const PaddleBounce& t);
[[nodiscard]] GameState Apply(const GameState& state, const BlockBounce& t);
[[nodiscard]] GameState Apply(const GameState& state, const LifeLost& t);
[[nodiscard]] GameState Apply(const GameState& state, const LevelCleared& t);

/// Dispatch to the Apply() overload for the held alternative.
[[nodiscard]] GameState Apply(const GameState& state, const Transition& t);

/// Short name for logs ("paddle_moved", "wall_bounce", ...).
[[nodiscard]] std::string_view TransitionName(const Transition& t);

}  // namespace breakout::game
