/**
 * @file    affine2d_test.cpp
 * @brief   Unit tests for the 2D affine transform
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/affine2d.hpp"

#include <numbers>
#include <stdexcept>

namespace cgt {

namespace {

constexpr double kTol = 1e-9;

void expect_point_near(const Point& actual, const Point& expected) {
    EXPECT_NEAR(actual.x, expected.x, kTol);
    EXPECT_NEAR(actual.y, expected.y, kTol);
}

}  // anonymous namespace

// =============================================================================
// Builder Tests
// =============================================================================

TEST(Affine2DTest, DefaultIsIdentity) {
    const Affine2D t;
    expect_point_near(t.apply({3.0, -4.0}), {3.0, -4.0});
    EXPECT_DOUBLE_EQ(t.determinant(), 1.0);
}

TEST(Affine2DTest, Translate) {
    const Affine2D t = Affine2D::identity().translated(10.0, -5.0);
    expect_point_near(t.apply({1.0, 1.0}), {11.0, -4.0});
}

TEST(Affine2DTest, RotatePositiveTurnsXTowardsY) {
    const Affine2D r = Affine2D::identity().rotated(std::numbers::pi / 2.0);
    expect_point_near(r.apply({1.0, 0.0}), {0.0, 1.0});
    expect_point_near(r.apply({0.0, 1.0}), {-1.0, 0.0});
}

TEST(Affine2DTest, ScaleAboutPivotKeepsPivot) {
    const Point pivot{50.0, 20.0};
    const Affine2D s = Affine2D::identity().scaled(3.0, pivot);
    expect_point_near(s.apply(pivot), pivot);
    expect_point_near(s.apply({51.0, 20.0}), {53.0, 20.0});
}

TEST(Affine2DTest, ChainAppliesInOrder) {
    // translate first, then scale: (1 + 1) * 2
    const Affine2D t = Affine2D::identity().translated(1.0, 0.0).scaled(2.0);
    expect_point_near(t.apply({1.0, 0.0}), {4.0, 0.0});

    // scale first, then translate: 1 * 2 + 1
    const Affine2D u = Affine2D::identity().scaled(2.0).translated(1.0, 0.0);
    expect_point_near(u.apply({1.0, 0.0}), {3.0, 0.0});
}

TEST(Affine2DTest, ThenComposes) {
    const Affine2D first = Affine2D::identity().rotated(0.3);
    const Affine2D second = Affine2D::identity().translated(7.0, 8.0);
    const Point p{2.0, -1.0};
    expect_point_near(first.then(second).apply(p), second.apply(first.apply(p)));
}

TEST(Affine2DTest, CoefficientConstructor) {
    const Affine2D t(2.0, 0.0, 0.0, 3.0, 5.0, 6.0);
    expect_point_near(t.apply({1.0, 1.0}), {7.0, 9.0});
    EXPECT_DOUBLE_EQ(t.a(), 2.0);
    EXPECT_DOUBLE_EQ(t.d(), 3.0);
    EXPECT_DOUBLE_EQ(t.e(), 5.0);
    EXPECT_DOUBLE_EQ(t.f(), 6.0);
}

// =============================================================================
// Inversion Tests
// =============================================================================

TEST(Affine2DTest, InverseRoundTrip) {
    const Affine2D t = Affine2D::identity()
        .translated(-120.0, 40.0)
        .rotated(-0.7)
        .scaled(0.35)
        .translated(400.0, 300.0);

    ASSERT_TRUE(t.is_invertible());
    const Affine2D inv = t.inverted();

    for (const Point& p : {Point{0.0, 0.0}, Point{999.0, 499.0}, Point{-12.5, 33.0}}) {
        expect_point_near(inv.apply(t.apply(p)), p);
    }
}

TEST(Affine2DTest, SingularMatrixThrows) {
    const Affine2D flat = Affine2D::identity().scaled(0.0, 1.0);
    EXPECT_FALSE(flat.is_invertible());
    EXPECT_THROW((void)flat.inverted(), std::domain_error);
}

}  // namespace cgt
