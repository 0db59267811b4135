/// @file transitions.cpp
/// @brief Pure state-transition functions applied by the simulation step.

#include "brk/game/transitions.hpp"

#include <algorithm>

namespace breakout::game {

namespace {

GameState rebuild(const GameState& state,
                  std::vector<Block> blocks,
                  const Paddle& paddle,
                  const Ball& ball,
                  int32_t lives) {
    return GameState(state.Size(), std::move(blocks), paddle, ball, lives,
                     state.GetSpawn(), state.Physics());
}

GameState withBall(const GameState& state, const Ball& ball) {
    return rebuild(state, state.Blocks(), state.GetPaddle(), ball, state.Lives());
}

/// Keep the ball center on the board horizontally and below the top edge.
Vector contain(Vector center, float radius, const BoardSize& size) {
    const float maxX = std::max(radius, size.width - radius);
    return {std::clamp(center.x, radius, maxX),
            std::clamp(center.y, std::min(radius, size.height), size.height)};
}

/// Place the ball just outside @p rect on the face with @p normal.
Vector pushOut(Vector center, float radius, const Rect& rect, const Vector& normal) {
    if (normal == Vector::Up()) {
        return {center.x, rect.Top() - radius};
    }
    if (normal == Vector::Down()) {
        return {center.x, rect.Bottom() + radius};
    }
    if (normal == Vector::Left()) {
        return {rect.Left() - radius, center.y};
    }
    return {rect.Right() + radius, center.y};
}

/// Bounce off @p rect: reflect, then move clear of the struck face.
Ball bounceOff(const Ball& ball, const Rect& rect, const Vector& normal, const BoardSize& size) {
    Ball next = ball;
    next.velocity = ball.velocity.Reflect(normal);
    next.center = contain(pushOut(ball.center, ball.radius, rect, normal), ball.radius, size);
    return next;
}

}  // namespace

Vector WallNormal(Wall wall) noexcept {
    switch (wall) {
        case Wall::Left:  return Vector::Right();
        case Wall::Right: return Vector::Left();
        case Wall::Top:   return Vector::Down();
    }
    return Vector::Down();
}

GameState Apply(const GameState& state, const PaddleMoved& t) {
    Paddle paddle = state.GetPaddle();
    const float maxX = std::max(0.0f, state.Size().width - paddle.width);
    float x = paddle.position.x;
    if (t.direction == Movement::Left) {
        x -= t.distance;
    } else if (t.direction == Movement::Right) {
        x += t.distance;
    }
    paddle.position.x = std::clamp(x, 0.0f, maxX);
    return rebuild(state, state.Blocks(), paddle, state.GetBall(), state.Lives());
}

GameState Apply(const GameState& state, const BallAdvanced& t) {
    Ball ball = state.GetBall();
    ball.center = ball.center.Add(ball.velocity.ScaleBy(t.deltaTimeMs));
    return withBall(state, ball);
}

GameState Apply(const GameState& state, const WallBounce& t) {
    const auto& size = state.Size();
    Ball ball = state.GetBall();
    const Vector normal = WallNormal(t.wall);

    // Only turn around when heading into the wall; always stop penetrating.
    if (ball.velocity.DotProduct(normal) < 0.0f) {
        ball.velocity = ball.velocity.Reflect(normal);
    }
    switch (t.wall) {
        case Wall::Left:
            ball.center.x = ball.radius;
            break;
        case Wall::Right:
            ball.center.x = std::max(ball.radius, size.width - ball.radius);
            break;
        case Wall::Top:
            ball.center.y = ball.radius;
            break;
    }
    return withBall(state, ball);
}

GameState Apply(const GameState& state, const PaddleBounce& t) {
    const Paddle& paddle = state.GetPaddle();
    const Ball& ball = state.GetBall();
    Ball next = bounceOff(ball, paddle.Bounds(), t.normal, state.Size());

    if (t.normal == Vector::Up()) {
        // Steer by where the ball met the paddle: the edges add up to
        // paddleSpin degrees, capped at maxBounceAngle from vertical.
        const auto& physics = state.Physics();
        const float halfWidth = paddle.width * 0.5f;
        const float offset = halfWidth > 0.0f
            ? std::clamp((ball.center.x - paddle.Bounds().Center().x) / halfWidth, -1.0f, 1.0f)
            : 0.0f;
        const float angle = std::clamp(
            Vector::Up().AngleBetween(next.velocity) + offset * physics.paddleSpin,
            -physics.maxBounceAngle, physics.maxBounceAngle);
        next.velocity = Vector::Up().ScaleBy(ball.Speed()).Rotate(angle);
    }
    return withBall(state, next);
}

GameState Apply(const GameState& state, const BlockBounce& t) {
    const auto& blocks = state.Blocks();
    if (t.blockIndex >= blocks.size()) {
        return state;
    }
    const Block& hit = blocks[t.blockIndex];
    Ball next = bounceOff(state.GetBall(), hit.Bounds(), t.normal, state.Size());

    std::vector<Block> remaining;
    remaining.reserve(blocks.size());
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i != t.blockIndex) {
            remaining.push_back(blocks[i]);
            continue;
        }
        if (blocks[i].density > 1) {
            Block damaged = blocks[i];
            --damaged.density;
            remaining.push_back(damaged);
        }
    }
    return rebuild(state, std::move(remaining), state.GetPaddle(), next, state.Lives());
}

// Only paddle and ball respawn.  Blocks keep their damage; the level is
// rebuilt from its descriptor only when lives run out.
GameState Apply(const GameState& state, const LifeLost&) {
    const auto& spawn = state.GetSpawn();
    return rebuild(state, state.Blocks(), spawn.paddle, spawn.ball,
                   std::max(state.Lives() - 1, 0));
}

GameState Apply(const GameState& state, const LevelCleared&) {
    return state;
}

GameState Apply(const GameState& state, const Transition& t) {
    return std::visit([&state](const auto& alt) { return Apply(state, alt); }, t);
}

std::string_view TransitionName(const Transition& t) {
    struct NameOf {
        std::string_view operator()(const PaddleMoved&) const { return "paddle_moved"; }
        std::string_view operator()(const BallAdvanced&) const { return "ball_advanced"; }
        std::string_view operator()(const WallBounce&) const { return "wall_bounce"; }
        std::string_view operator()(const PaddleBounce&) const { return "paddle_bounce"; }
        std::string_view operator()(const BlockBounce&) const { return "block_bounce"; }
        std::string_view operator()(const LifeLost&) const { return "life_lost"; }
        std::string_view operator()(const LevelCleared&) const { return "level_cleared"; }
    };
    return std::visit(NameOf{}, t);
}

}  // namespace breakout::game
