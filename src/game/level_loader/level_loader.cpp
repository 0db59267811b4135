/// @file level_loader.cpp
/// @brief Level validation and initial state construction.

#include "brk/game/level_loader.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace breakout::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<void> invalid(std::string message) {
    return GameResult<void>::err(GameError(ErrorCode::InvalidLevel, std::move(message)));
}

GameResult<void> invalidBlock(std::size_t index, const std::string& what) {
    return GameResult<void>::err(GameError(
        ErrorCode::InvalidLevel,
        "block " + std::to_string(index) + ": " + what,
        index));
}

bool positive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

bool finite(const Vector& v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

bool insideBoard(const Rect& rect, const BoardSize& size) {
    return rect.Left() >= 0.0f && rect.Right() <= size.width &&
           rect.Top() >= 0.0f && rect.Bottom() <= size.height;
}

/// Circle and rectangle share at least one point.
bool overlaps(const Vector& center, float radius, const Rect& rect) {
    const Vector closest{std::clamp(center.x, rect.Left(), rect.Right()),
                         std::clamp(center.y, rect.Top(), rect.Bottom())};
    const Vector d = center.Subtract(closest);
    return d.DotProduct(d) <= radius * radius;
}

}  // namespace

GameResult<void> ValidateLevel(const LevelDescriptor& level) {
    const auto& size = level.size;
    if (!positive(size.width) || !positive(size.height)) {
        return invalid("board size must be positive");
    }

    // A level without blocks would count as cleared on every step.
    if (level.blocks.empty()) {
        return invalid("level needs at least one block");
    }

    for (std::size_t i = 0; i < level.blocks.size(); ++i) {
        const auto& block = level.blocks[i];
        if (!finite(block.position)) {
            return invalidBlock(i, "position must be finite");
        }
        if (!positive(block.width) || !positive(block.height)) {
            return invalidBlock(i, "dimensions must be positive");
        }
        if (block.density < 1) {
            return invalidBlock(i, "density must be at least 1");
        }
        if (!insideBoard(Rect{block.position, block.width, block.height}, size)) {
            return invalidBlock(i, "must lie inside the board");
        }
    }

    const auto& paddle = level.paddle;
    if (!finite(paddle.position)) {
        return invalid("paddle position must be finite");
    }
    if (!positive(paddle.width) || !positive(paddle.height)) {
        return invalid("paddle dimensions must be positive");
    }
    if (!insideBoard(Rect{paddle.position, paddle.width, paddle.height}, size)) {
        return invalid("paddle must lie inside the board");
    }

    const auto& ball = level.ball;
    if (!finite(ball.center)) {
        return invalid("ball center must be finite");
    }
    if (!positive(ball.radius)) {
        return invalid("ball radius must be positive");
    }
    if (ball.center.x - ball.radius < 0.0f || ball.center.x + ball.radius > size.width ||
        ball.center.y - ball.radius < 0.0f || ball.center.y + ball.radius > size.height) {
        return invalid("ball must lie inside the board");
    }
    if (overlaps(ball.center, ball.radius,
                 Rect{paddle.position, paddle.width, paddle.height})) {
        return invalid("ball must not overlap the paddle");
    }
    for (std::size_t i = 0; i < level.blocks.size(); ++i) {
        const auto& block = level.blocks[i];
        if (overlaps(ball.center, ball.radius, Rect{block.position, block.width, block.height})) {
            return invalidBlock(i, "overlaps the ball");
        }
    }

    return GameResult<void>::ok();
}

GameResult<void> ValidateSettings(const LevelSettings& settings) {
    auto fail = [](const char* message) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, message));
    };
    if (settings.startingLives < 1) {
        return fail("starting lives must be at least 1");
    }
    if (!positive(settings.ballSpeed)) {
        return fail("ball speed must be positive");
    }
    if (!std::isfinite(settings.launchAngle)) {
        return fail("launch angle must be finite");
    }
    const auto& physics = settings.physics;
    if (!std::isfinite(physics.paddleSpeed) || physics.paddleSpeed < 0.0f) {
        return fail("paddle speed must be non-negative");
    }
    if (!std::isfinite(physics.paddleSpin) ||
        !std::isfinite(physics.maxBounceAngle) ||
        physics.maxBounceAngle < 0.0f || physics.maxBounceAngle >= 90.0f) {
        return fail("bounce angles must be finite and below 90 degrees");
    }
    return GameResult<void>::ok();
}

GameResult<GameState> BuildInitialState(const LevelDescriptor& level,
                                        const LevelSettings& settings) {
    if (auto valid = ValidateLevel(level); !valid) {
        return GameResult<GameState>::err(valid.error());
    }
    if (auto valid = ValidateSettings(settings); !valid) {
        return GameResult<GameState>::err(valid.error());
    }

    std::vector<Block> blocks;
    blocks.reserve(level.blocks.size());
    for (const auto& b : level.blocks) {
        blocks.push_back(Block{b.position, b.width, b.height, b.density});
    }

    const Paddle paddle{level.paddle.position, level.paddle.width, level.paddle.height};
    const Ball ball{
        level.ball.center,
        level.ball.radius,
        Vector::Down().Rotate(settings.launchAngle).ScaleBy(settings.ballSpeed)};

    return GameResult<GameState>::ok(GameState(
        level.size,
        std::move(blocks),
        paddle,
        ball,
        settings.startingLives,
        Spawn{paddle, ball},
        settings.physics));
}

}  // namespace breakout::game
