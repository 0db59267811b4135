/// @file vector_test.cpp
/// @brief Unit tests for the Vector value type.

#include <gtest/gtest.h>

#include <array>

#include "brk/game/vector.hpp"

using namespace breakout::game;

namespace {

// A handful of representative vectors, including zero and negatives.
const std::array<Vector, 6> kSamples = {{
    {0.0f, 0.0f},
    {3.0f, 4.0f},
    {-2.5f, 1.0f},
    {0.001f, -7.0f},
    {100.0f, 100.0f},
    {-1.0f, -1.0f},
}};

}  // namespace

// ===========================================================================
// Arithmetic
// ===========================================================================

TEST(VectorTest, LengthOfThreeFour) {
    EXPECT_FLOAT_EQ(Vector(3.0f, 4.0f).Length(), 5.0f);
}

TEST(VectorTest, AddAndSubtract) {
    Vector a(1.0f, 2.0f);
    Vector b(3.0f, -5.0f);
    EXPECT_EQ(a.Add(b), Vector(4.0f, -3.0f));
    EXPECT_EQ(a.Subtract(b), Vector(-2.0f, 7.0f));
    EXPECT_EQ(a + b, a.Add(b));
    EXPECT_EQ(a - b, a.Subtract(b));
}

TEST(VectorTest, AdditiveInverseIsZero) {
    for (const auto& v : kSamples) {
        EXPECT_TRUE(v.Add(v.ScaleBy(-1.0f)).ApproxEqual(Vector::Zero()));
    }
}

TEST(VectorTest, ScaleComposes) {
    for (const auto& v : kSamples) {
        EXPECT_TRUE(v.ScaleBy(2.5f).ScaleBy(-0.4f).ApproxEqual(v.ScaleBy(2.5f * -0.4f), 1e-3f));
    }
}

TEST(VectorTest, ScalarOnEitherSide) {
    Vector v(1.5f, -2.0f);
    EXPECT_EQ(2.0f * v, v * 2.0f);
}

TEST(VectorTest, DotIsSymmetricCrossIsAntisymmetric) {
    for (const auto& v : kSamples) {
        for (const auto& w : kSamples) {
            EXPECT_FLOAT_EQ(v.DotProduct(w), w.DotProduct(v));
            EXPECT_FLOAT_EQ(v.CrossProduct(w), -w.CrossProduct(v));
        }
    }
}

// ===========================================================================
// Normalize / ProjectOn / Reflect
// ===========================================================================

TEST(VectorTest, NormalizeGivesUnitLength) {
    auto n = Vector(3.0f, 4.0f).Normalize();
    EXPECT_NEAR(n.Length(), 1.0f, 1e-6f);
    EXPECT_TRUE(n.ApproxEqual({0.6f, 0.8f}));
}

TEST(VectorTest, NormalizeZeroStaysZero) {
    auto n = Vector::Zero().Normalize();
    EXPECT_EQ(n, Vector::Zero());
}

TEST(VectorTest, ProjectOnUnitAxis) {
    Vector v(3.0f, -2.0f);
    EXPECT_TRUE(v.ProjectOn(Vector::Right()).ApproxEqual({3.0f, 0.0f}));
    EXPECT_TRUE(v.ProjectOn(Vector::Down()).ApproxEqual({0.0f, -2.0f}));
}

TEST(VectorTest, ProjectOnNonUnitDividesByLengthOnly) {
    // dot((1,0),(2,0)) / |(2,0)| = 1, scaled along (2,0).
    EXPECT_TRUE(Vector(1.0f, 0.0f).ProjectOn({2.0f, 0.0f}).ApproxEqual({2.0f, 0.0f}));
}

TEST(VectorTest, ProjectOnZeroIsZero) {
    EXPECT_EQ(Vector(1.0f, 1.0f).ProjectOn(Vector::Zero()), Vector::Zero());
}

TEST(VectorTest, ReflectFlipsNormalComponentOnly) {
    auto reflected = Vector(1.0f, -1.0f).Reflect({0.0f, 1.0f});
    EXPECT_TRUE(reflected.ApproxEqual({1.0f, 1.0f}));
}

TEST(VectorTest, ReflectOffUnitNormalKeepsLength) {
    const std::array<Vector, 4> normals = {
        Vector::Up(), Vector::Down(), Vector::Left(), Vector(1.0f, 1.0f).Normalize()};
    for (const auto& v : kSamples) {
        for (const auto& n : normals) {
            EXPECT_NEAR(v.Reflect(n).Length(), v.Length(), 1e-3f);
        }
    }
}

// ===========================================================================
// Rotate / AngleBetween
// ===========================================================================

TEST(VectorTest, RotateQuarterTurn) {
    EXPECT_TRUE(Vector(1.0f, 0.0f).Rotate(90.0f).ApproxEqual({0.0f, 1.0f}));
}

TEST(VectorTest, RotateFullTurnIsIdentity) {
    for (const auto& v : kSamples) {
        EXPECT_TRUE(v.Rotate(360.0f).ApproxEqual(v, 1e-3f));
    }
}

TEST(VectorTest, UpRotatesTowardRight) {
    EXPECT_TRUE(Vector::Up().Rotate(90.0f).ApproxEqual(Vector::Right()));
}

TEST(VectorTest, AngleBetweenSelfIsZero) {
    for (const auto& v : kSamples) {
        if (v == Vector::Zero()) {
            continue;
        }
        EXPECT_NEAR(v.AngleBetween(v), 0.0f, 1e-4f);
    }
}

TEST(VectorTest, AngleBetweenIsSigned) {
    EXPECT_NEAR(Vector::Right().AngleBetween(Vector::Down()), 90.0f, 1e-4f);
    EXPECT_NEAR(Vector::Down().AngleBetween(Vector::Right()), -90.0f, 1e-4f);
}

TEST(VectorTest, RotateUndoesAngleBetween) {
    Vector from(2.0f, 1.0f);
    Vector to(-1.0f, 3.0f);
    auto angle = from.AngleBetween(to);
    EXPECT_TRUE(from.Normalize().Rotate(angle).ApproxEqual(to.Normalize()));
}

TEST(VectorTest, DegreeConversion) {
    EXPECT_FLOAT_EQ(ToRadians(180.0f), kPi);
    EXPECT_FLOAT_EQ(ToDegrees(kPi / 2.0f), 90.0f);
}
