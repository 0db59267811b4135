#pragma once

/// @file vector.hpp
/// @brief Two-component vector value type for the board simulation.
///
/// Board coordinates are y-down: the origin is the top-left corner and
/// +y points toward the paddle.  Every operation is const and returns a
/// new value, so a Vector held by a GameState never changes.

#include <cmath>

namespace breakout::game {

/// Degrees <-> radians.
inline constexpr float kPi = 3.14159265358979323846f;

constexpr float ToRadians(float degrees) noexcept { return degrees * kPi / 180.0f; }
constexpr float ToDegrees(float radians) noexcept { return radians * 180.0f / kPi; }

/// Two-component floating-point vector.
struct Vector {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector() = default;
    constexpr Vector(float x, float y) : x(x), y(y) {}

    constexpr Vector operator+(const Vector& rhs) const noexcept { return {x + rhs.x, y + rhs.y}; }
    constexpr Vector operator-(const Vector& rhs) const noexcept { return {x - rhs.x, y - rhs.y}; }
    constexpr Vector operator*(float scalar) const noexcept { return {x * scalar, y * scalar}; }
    constexpr Vector operator-() const noexcept { return {-x, -y}; }

    [[nodiscard]] constexpr Vector ScaleBy(float k) const noexcept { return *this * k; }
    [[nodiscard]] constexpr Vector Add(const Vector& v) const noexcept { return *this + v; }
    [[nodiscard]] constexpr Vector Subtract(const Vector& v) const noexcept { return *this - v; }

    [[nodiscard]] constexpr float DotProduct(const Vector& v) const noexcept {
        return x * v.x + y * v.y;
    }

    /// Scalar 2D cross product (z of the 3D cross).
    [[nodiscard]] constexpr float CrossProduct(const Vector& v) const noexcept {
        return x * v.y - y * v.x;
    }

    [[nodiscard]] float Length() const noexcept { return std::hypot(x, y); }

    /// Unit vector in the same direction; the zero vector stays zero.
    [[nodiscard]] Vector Normalize() const noexcept {
        const float len = Length();
        if (len == 0.0f) {
            return {};
        }
        return ScaleBy(1.0f / len);
    }

    /// Projection along @p v, scaled by dot(v) / |v|.
    ///
    /// The divisor is |v|, not |v|^2, so the result is the true projection
    /// only when @p v is a unit vector.  Returns zero for a zero @p v.
    [[nodiscard]] Vector ProjectOn(const Vector& v) const noexcept {
        const float len = v.Length();
        if (len == 0.0f) {
            return {};
        }
        const float amount = DotProduct(v) / len;
        return {amount * v.x, amount * v.y};
    }

    /// Mirror across a surface with the given normal.
    ///
    /// @p normal must be a unit vector for the result to keep this
    /// vector's length; see ProjectOn().
    [[nodiscard]] Vector Reflect(const Vector& normal) const noexcept {
        return Subtract(ProjectOn(normal).ScaleBy(2.0f));
    }

    /// Counter-clockwise rotation in the math sense.  With y pointing down
    /// a positive angle turns Up() toward Right().
    [[nodiscard]] Vector Rotate(float degrees) const noexcept {
        const float radians = ToRadians(degrees);
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        return {x * c - y * s, x * s + y * c};
    }

    /// Signed angle in degrees that rotates this vector onto @p v.
    [[nodiscard]] float AngleBetween(const Vector& v) const noexcept {
        return ToDegrees(std::atan2(CrossProduct(v), DotProduct(v)));
    }

    [[nodiscard]] bool ApproxEqual(const Vector& v, float epsilon = 1e-4f) const noexcept {
        return std::fabs(x - v.x) <= epsilon && std::fabs(y - v.y) <= epsilon;
    }

    [[nodiscard]] static constexpr Vector Zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vector Up() noexcept { return {0.0f, -1.0f}; }
    [[nodiscard]] static constexpr Vector Down() noexcept { return {0.0f, 1.0f}; }
    [[nodiscard]] static constexpr Vector Left() noexcept { return {-1.0f, 0.0f}; }
    [[nodiscard]] static constexpr Vector Right() noexcept { return {1.0f, 0.0f}; }

    constexpr bool operator==(const Vector&) const = default;
};

constexpr Vector operator*(float scalar, const Vector& v) noexcept {
    return v * scalar;
}

}  // namespace breakout::game
