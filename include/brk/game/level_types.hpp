#pragma once

/// @file level_types.hpp
/// @brief Static level descriptions and loader settings.

#include <cstdint>
#include <string>
#include <vector>

#include "brk/game/entities.hpp"

namespace breakout::game {

/// Default lives granted when a level is (re)built.
constexpr int32_t kDefaultStartingLives = 3;

/// Default ball speed in board units per millisecond.
constexpr float kDefaultBallSpeed = 0.05f;

/// Default launch direction: Down() rotated by this many degrees.
constexpr float kDefaultLaunchAngle = 30.0f;

struct BlockDescriptor {
    Vector position;
    float width = 0.0f;
    float height = 0.0f;
    int32_t density = 1;
};

struct PaddleDescriptor {
    Vector position;
    float width = 0.0f;
    float height = 0.0f;
};

/// The ball's velocity is not part of a level; LevelSettings supplies it.
struct BallDescriptor {
    Vector center;
    float radius = 0.0f;
};

/// Static description of one level's board, blocks, paddle and ball.
struct LevelDescriptor {
    std::string name;
    BoardSize size;
    std::vector<BlockDescriptor> blocks;
    PaddleDescriptor paddle;
    BallDescriptor ball;
};

/// Values the loader applies on top of a descriptor.
struct LevelSettings {
    int32_t startingLives = kDefaultStartingLives;
    float ballSpeed = kDefaultBallSpeed;
    float launchAngle = kDefaultLaunchAngle;
    PhysicsParams physics;
};

}  // namespace breakout::game
