#include <gtest/gtest.h>
#include "engine/Vec2.hpp"
#include "rendering/IRenderer.hpp"

#include <cmath>
#include <limits>

using namespace ghostwatch;

// =============================================================================
// Construction & Arithmetic
// =============================================================================

TEST(Vec2Test, DefaultConstruction) {
    Vec2 v;
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
}

TEST(Vec2Test, PureOperatorsLeaveOperandsUntouched) {
    Vec2 a(1.0f, 2.0f);
    Vec2 b(3.0f, 4.0f);

    Vec2 sum = a + b;
    Vec2 diff = a - b;
    Vec2 scaled = a * 3.0f;
    Vec2 divided = b / 2.0f;

    EXPECT_EQ(sum, Vec2(4.0f, 6.0f));
    EXPECT_EQ(diff, Vec2(-2.0f, -2.0f));
    EXPECT_EQ(scaled, Vec2(3.0f, 6.0f));
    EXPECT_EQ(divided, Vec2(1.5f, 2.0f));
    EXPECT_EQ(a, Vec2(1.0f, 2.0f));
    EXPECT_EQ(b, Vec2(3.0f, 4.0f));
}

TEST(Vec2Test, InPlaceOperators) {
    Vec2 v(5.0f, 7.0f);
    v += Vec2(1.0f, 1.0f);
    EXPECT_EQ(v, Vec2(6.0f, 8.0f));
    v -= Vec2(2.0f, 3.0f);
    EXPECT_EQ(v, Vec2(4.0f, 5.0f));
    v *= 2.0f;
    EXPECT_EQ(v, Vec2(8.0f, 10.0f));
    v /= 4.0f;
    EXPECT_EQ(v, Vec2(2.0f, 2.5f));
}

TEST(Vec2Test, InPlaceOperatorsChain) {
    Vec2 v(1.0f, 1.0f);
    (v += Vec2(1.0f, 0.0f)) *= 3.0f;
    EXPECT_EQ(v, Vec2(6.0f, 3.0f));
}

TEST(Vec2Test, AddThenSubtractIsIdentity) {
    const Vec2 samples[] = {
        {0.0f, 0.0f}, {3.5f, -2.25f}, {-100.0f, 42.0f}, {1e4f, 1e-3f}, {-0.5f, -0.5f},
    };
    for (const auto& v : samples) {
        for (const auto& w : samples) {
            Vec2 back = (v + w) - w;
            EXPECT_NEAR(back.x, v.x, 1e-3f);
            EXPECT_NEAR(back.y, v.y, 1e-3f);
        }
    }
}

TEST(Vec2Test, DivideByZeroPropagatesIeeeValues) {
    Vec2 v(1.0f, 0.0f);
    Vec2 r = v / 0.0f;
    EXPECT_TRUE(std::isinf(r.x));
    EXPECT_TRUE(std::isnan(r.y));

    Vec2 w(-2.0f, 3.0f);
    w /= 0.0f;
    EXPECT_TRUE(std::isinf(w.x));
    EXPECT_LT(w.x, 0.0f);
    EXPECT_TRUE(std::isinf(w.y));
    EXPECT_GT(w.y, 0.0f);
}

// =============================================================================
// Polar accessors
// =============================================================================

TEST(Vec2Test, Length345) {
    Vec2 v(3.0f, 4.0f);
    EXPECT_FLOAT_EQ(v.length(), 5.0f);
    EXPECT_FLOAT_EQ(v.lengthSquared(), 25.0f);
}

TEST(Vec2Test, AngleQuadrants) {
    EXPECT_NEAR(Vec2(1.0f, 0.0f).angle(), 0.0f, 1e-6f);
    EXPECT_NEAR(Vec2(0.0f, 1.0f).angle(), PI / 2.0f, 1e-6f);
    EXPECT_NEAR(Vec2(-1.0f, 0.0f).angle(), PI, 1e-6f);
    EXPECT_NEAR(Vec2(0.0f, -1.0f).angle(), -PI / 2.0f, 1e-6f);
}

TEST(Vec2Test, ZeroVectorAngleIsZero) {
    EXPECT_FLOAT_EQ(Vec2().angle(), 0.0f);
}

TEST(Vec2Test, SetLengthKeepsAngle) {
    Vec2 v(3.0f, 4.0f);
    float before = v.angle();
    v.setLength(10.0f);
    EXPECT_NEAR(v.length(), 10.0f, 1e-4f);
    EXPECT_NEAR(v.angle(), before, 1e-5f);
    EXPECT_NEAR(v.x, 6.0f, 1e-4f);
    EXPECT_NEAR(v.y, 8.0f, 1e-4f);
}

TEST(Vec2Test, SetLengthRecoversValue) {
    for (float len : {0.001f, 0.5f, 1.0f, 2.75f, 1000.0f}) {
        Vec2 v(-1.5f, 0.25f);
        v.setLength(len);
        EXPECT_NEAR(v.length(), len, len * 1e-5f);
    }
}

TEST(Vec2Test, SetLengthOnZeroVectorPointsAlongX) {
    Vec2 v;
    v.setLength(2.0f);
    EXPECT_FLOAT_EQ(v.x, 2.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
}

TEST(Vec2Test, SetAngleKeepsLength) {
    Vec2 v(3.0f, 4.0f);
    v.setAngle(PI);
    EXPECT_NEAR(v.length(), 5.0f, 1e-5f);
    EXPECT_NEAR(v.x, -5.0f, 1e-5f);
    EXPECT_NEAR(v.y, 0.0f, 1e-5f);
}

TEST(Vec2Test, SetAngleRecoversAngleModuloTwoPi) {
    for (float a : {0.3f, 1.5f, 3.0f, 4.0f, 6.0f, 7.5f, -2.0f}) {
        Vec2 v(2.0f, 0.0f);
        v.setAngle(a);
        float diff = std::remainder(v.angle() - a, TWO_PI);
        EXPECT_NEAR(diff, 0.0f, 1e-5f) << "angle " << a;
    }
}

TEST(Vec2Test, SetAngleOnZeroVectorStaysZero) {
    Vec2 v;
    v.setAngle(1.0f);
    EXPECT_FLOAT_EQ(v.length(), 0.0f);
    EXPECT_FLOAT_EQ(v.angle(), 0.0f);
}

TEST(Vec2Test, FromPolar) {
    Vec2 v = Vec2::fromPolar(PI / 2.0f, 20.0f);
    EXPECT_NEAR(v.x, 0.0f, 1e-5f);
    EXPECT_NEAR(v.y, 20.0f, 1e-5f);
}

// =============================================================================
// Utilities
// =============================================================================

TEST(Vec2Test, Normalized) {
    Vec2 n = Vec2(3.0f, 4.0f).normalized();
    EXPECT_NEAR(n.x, 0.6f, 0.0001f);
    EXPECT_NEAR(n.y, 0.8f, 0.0001f);
    EXPECT_EQ(Vec2().normalized(), Vec2());
}

TEST(Vec2Test, DotAndDistance) {
    EXPECT_FLOAT_EQ(Vec2::dot({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0f);
    EXPECT_FLOAT_EQ(Vec2::dot({2.0f, 3.0f}, {2.0f, 3.0f}), 13.0f);
    EXPECT_FLOAT_EQ(Vec2::distance({0.0f, 0.0f}, {3.0f, 4.0f}), 5.0f);
}

TEST(Vec2Test, Inequality) {
    EXPECT_TRUE(Vec2(1.0f, 2.0f) != Vec2(1.0f, 3.0f));
    EXPECT_FALSE(Vec2(1.0f, 2.0f) != Vec2(1.0f, 2.0f));
}
