/// @file simulation.cpp
/// @brief Simulation step: detection of transitions and their composition.

#include "brk/game/simulation.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace breakout::game {

bool StepResult::LostLife() const noexcept {
    return std::any_of(transitions.begin(), transitions.end(), [](const Transition& t) {
        return std::holds_alternative<LifeLost>(t);
    });
}

bool StepResult::ClearedLevel() const noexcept {
    return std::any_of(transitions.begin(), transitions.end(), [](const Transition& t) {
        return std::holds_alternative<LevelCleared>(t);
    });
}

// ── Contact detection ──────────────────────────────────────────────────

std::optional<Contact> FindRectContact(const Ball& ball, const Rect& rect) {
    const Vector& c = ball.center;
    const float r = ball.radius;

    // Closest point of the rectangle to the ball center.
    const Vector closest{std::clamp(c.x, rect.Left(), rect.Right()),
                         std::clamp(c.y, rect.Top(), rect.Bottom())};
    const Vector d = c.Subtract(closest);
    if (d.DotProduct(d) > r * r) {
        return std::nullopt;
    }

    struct Face {
        Vector normal;
        float penetration;
    };
    const std::array<Face, 4> faces = {{
        {Vector::Up(), (c.y + r) - rect.Top()},
        {Vector::Down(), rect.Bottom() - (c.y - r)},
        {Vector::Left(), (c.x + r) - rect.Left()},
        {Vector::Right(), rect.Right() - (c.x - r)},
    }};

    std::optional<Contact> best;
    float bestPenetration = std::numeric_limits<float>::max();
    for (const auto& face : faces) {
        // A face only counts while the ball is moving into it.
        if (ball.velocity.DotProduct(face.normal) >= 0.0f) {
            continue;
        }
        if (face.penetration < bestPenetration) {
            bestPenetration = face.penetration;
            best = Contact{face.normal};
        }
    }
    return best;
}

std::vector<WallBounce> DetectWalls(const GameState& state) {
    const auto& ball = state.GetBall();
    const auto& size = state.Size();

    std::vector<WallBounce> walls;
    if (ball.center.x - ball.radius < 0.0f) {
        walls.push_back({Wall::Left});
    }
    if (ball.center.x + ball.radius > size.width) {
        walls.push_back({Wall::Right});
    }
    if (ball.center.y - ball.radius < 0.0f) {
        walls.push_back({Wall::Top});
    }
    return walls;
}

std::optional<Transition> DetectContact(const GameState& state) {
    const auto& ball = state.GetBall();

    if (auto contact = FindRectContact(ball, state.GetPaddle().Bounds())) {
        return Transition{PaddleBounce{contact->normal}};
    }

    const auto& blocks = state.Blocks();
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (auto contact = FindRectContact(ball, blocks[i].Bounds())) {
            return Transition{BlockBounce{i, contact->normal}};
        }
    }
    return std::nullopt;
}

bool IsMiss(const GameState& state) noexcept {
    const auto& ball = state.GetBall();
    return ball.center.y + ball.radius > state.Size().height;
}

// ── Step ───────────────────────────────────────────────────────────────

namespace {

/// Upper bound on sub-steps for one call; huge deltas get coarser steps.
constexpr int kMaxSubSteps = 1024;

/// Longest distance the ball may travel in one sub-step without passing
/// through the thinnest thing it can hit.
float maxTravel(const GameState& state) {
    float limit = state.GetBall().radius;
    const auto& paddle = state.GetPaddle();
    limit = std::min({limit, paddle.width, paddle.height});
    for (const auto& block : state.Blocks()) {
        limit = std::min({limit, block.width, block.height});
    }
    return limit;
}

int subStepCount(const GameState& state, float dt) {
    const float travel = state.GetBall().Speed() * dt;
    const float limit = maxTravel(state);
    if (!(limit > 0.0f) || travel <= limit) {
        return 1;
    }
    const float steps = std::ceil(travel / limit);
    return steps >= static_cast<float>(kMaxSubSteps) ? kMaxSubSteps : static_cast<int>(steps);
}

void stepOnce(StepResult& result, Movement movement, float dt) {
    auto fire = [&result](Transition t) {
        result.state = Apply(result.state, t);
        result.transitions.push_back(t);
    };

    if (movement != Movement::None) {
        fire(PaddleMoved{movement, result.state.Physics().paddleSpeed * dt});
    }
    fire(BallAdvanced{dt});

    for (const auto& wall : DetectWalls(result.state)) {
        fire(wall);
    }

    // At most one paddle or block response per sub-step.
    if (auto contact = DetectContact(result.state)) {
        fire(*contact);
    }

    if (IsMiss(result.state)) {
        fire(LifeLost{});
    }

    if (result.state.IsCleared()) {
        fire(LevelCleared{});
    }
}

}  // namespace

StepResult Step(const GameState& state, Movement movement, float deltaTimeMs) {
    const float dt = std::isfinite(deltaTimeMs) ? std::max(deltaTimeMs, 0.0f) : 0.0f;

    StepResult result{state, {}};
    const int steps = subStepCount(state, dt);
    const float slice = dt / static_cast<float>(steps);
    for (int i = 0; i < steps; ++i) {
        stepOnce(result, movement, slice);
        // The rest of the delta belongs to the respawned ball or the next level.
        if (result.LostLife() || result.ClearedLevel()) {
            break;
        }
    }
    return result;
}

GameState Tick(const GameState& state, Movement movement, float deltaTimeMs) {
    return Step(state, movement, deltaTimeMs).state;
}

}  // namespace breakout::game
