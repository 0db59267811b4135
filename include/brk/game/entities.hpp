#pragma once

/// @file entities.hpp
/// @brief Passive entity records and the immutable GameState.
///
/// All positions are in board units with the origin at the top-left
/// corner; velocities are board units per millisecond.

#include <cstdint>
#include <utility>
#include <vector>

#include "brk/game/vector.hpp"

namespace breakout::game {

/// Paddle steering intent for one tick.
enum class Movement : uint8_t {
    None,
    Left,
    Right
};

/// Axis-aligned rectangle given by its top-left corner.
struct Rect {
    Vector position;
    float width = 0.0f;
    float height = 0.0f;

    [[nodiscard]] constexpr float Left() const noexcept { return position.x; }
    [[nodiscard]] constexpr float Right() const noexcept { return position.x + width; }
    [[nodiscard]] constexpr float Top() const noexcept { return position.y; }
    [[nodiscard]] constexpr float Bottom() const noexcept { return position.y + height; }
    [[nodiscard]] constexpr Vector Center() const noexcept {
        return {position.x + width * 0.5f, position.y + height * 0.5f};
    }

    constexpr bool operator==(const Rect&) const = default;
};

struct BoardSize {
    float width = 0.0f;
    float height = 0.0f;

    constexpr bool operator==(const BoardSize&) const = default;
};

/// Destructible block.  Removed from the board when density reaches zero.
struct Block {
    Vector position;
    float width = 0.0f;
    float height = 0.0f;
    int32_t density = 1;

    [[nodiscard]] constexpr Rect Bounds() const noexcept { return {position, width, height}; }

    constexpr bool operator==(const Block&) const = default;
};

/// Player paddle.  Moves horizontally only.
struct Paddle {
    Vector position;
    float width = 0.0f;
    float height = 0.0f;

    [[nodiscard]] constexpr Rect Bounds() const noexcept { return {position, width, height}; }

    constexpr bool operator==(const Paddle&) const = default;
};

struct Ball {
    Vector center;
    float radius = 0.0f;
    Vector velocity;

    [[nodiscard]] float Speed() const noexcept { return velocity.Length(); }

    constexpr bool operator==(const Ball&) const = default;
};

/// Starting paddle and ball of a level, restored after a missed ball.
struct Spawn {
    Paddle paddle;
    Ball ball;

    constexpr bool operator==(const Spawn&) const = default;
};

/// Tuning applied by the level loader and read by the simulation step.
struct PhysicsParams {
    /// Paddle travel in board units per millisecond.
    float paddleSpeed = 0.08f;

    /// Outgoing angle added at the paddle edge, in degrees.
    float paddleSpin = 30.0f;

    /// Largest angle from straight up a paddle bounce may produce.
    float maxBounceAngle = 60.0f;

    constexpr bool operator==(const PhysicsParams&) const = default;
};

/// Complete, immutable snapshot of one level in play.
///
/// A GameState is built in one step from all of its parts and exposes
/// read-only accessors; the simulation produces a new value per tick
/// instead of mutating this one.
class GameState {
public:
    GameState(BoardSize size,
              std::vector<Block> blocks,
              Paddle paddle,
              Ball ball,
              int32_t lives,
              Spawn spawn,
              PhysicsParams physics = {})
        : size_(size),
          blocks_(std::move(blocks)),
          paddle_(paddle),
          ball_(ball),
          lives_(lives < 0 ? 0 : lives),
          spawn_(spawn),
          physics_(physics) {}

    [[nodiscard]] const BoardSize& Size() const noexcept { return size_; }
    [[nodiscard]] const std::vector<Block>& Blocks() const noexcept { return blocks_; }
    [[nodiscard]] const Paddle& GetPaddle() const noexcept { return paddle_; }
    [[nodiscard]] const Ball& GetBall() const noexcept { return ball_; }
    [[nodiscard]] int32_t Lives() const noexcept { return lives_; }
    [[nodiscard]] const Spawn& GetSpawn() const noexcept { return spawn_; }
    [[nodiscard]] const PhysicsParams& Physics() const noexcept { return physics_; }

    [[nodiscard]] bool IsCleared() const noexcept { return blocks_.empty(); }
    [[nodiscard]] bool IsOutOfLives() const noexcept { return lives_ == 0; }

    bool operator==(const GameState&) const = default;

private:
    BoardSize size_;
    std::vector<Block> blocks_;
    Paddle paddle_;
    Ball ball_;
    int32_t lives_;
    Spawn spawn_;
    PhysicsParams physics_;
};

}  // namespace breakout::game
