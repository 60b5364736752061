/**
 * @file    crop_reconciler_test.cpp
 * @brief   Unit tests for refitting a crop into the image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/crop_projection.hpp"
#include "core/crop_reconciler.hpp"

#include <cmath>
#include <numbers>
#include <random>

namespace cgt {

class CropReconcilerTest : public ::testing::Test {
protected:
    const Dimension image_{1000, 500};
    const AspectRatio free_{FreeAspect{}};

    const CropState inside_{.x = 500, .y = 250, .width = 200, .height = 100, .angle = 0};
    const CropState full_{.x = 500, .y = 250, .width = 1000, .height = 500, .angle = 0};
    const CropState rotated_{.x = 500, .y = 250, .width = 600, .height = 300,
                             .angle = degrees_to_radians(30.0)};
};

// =============================================================================
// crop_fits Tests
// =============================================================================

TEST_F(CropReconcilerTest, FitsInside) {
    EXPECT_TRUE(crop_fits(inside_, image_));
}

TEST_F(CropReconcilerTest, FullImageCropTouchesOutside) {
    // Corners at x = width lie one pixel past the last column
    EXPECT_FALSE(crop_fits(full_, image_));
}

TEST_F(CropReconcilerTest, RotatedCropOverflows) {
    EXPECT_FALSE(crop_fits(rotated_, image_));
}

// =============================================================================
// Identity Tests
// =============================================================================

TEST_F(CropReconcilerTest, FittingCropIsUnchanged) {
    EXPECT_EQ(fit_crop(inside_, image_, free_, Transformation::Translate), inside_);
    EXPECT_EQ(fit_crop(inside_, image_, free_, Transformation::Scale), inside_);
}

TEST_F(CropReconcilerTest, Idempotent) {
    const CropState once = fit_crop(rotated_, image_, FixedAspect{2.0}, Transformation::Scale);
    const CropState twice = fit_crop(once, image_, FixedAspect{2.0}, Transformation::Scale);
    EXPECT_EQ(once, twice);

    const CropState moved = fit_crop(twice, image_, FixedAspect{2.0}, Transformation::Translate);
    EXPECT_EQ(moved, twice);
}

// =============================================================================
// Translate Tests
// =============================================================================

TEST_F(CropReconcilerTest, TranslateBackFromRight) {
    CropState crop = inside_;
    crop.x = 950;

    const CropState fitted = fit_crop(crop, image_, free_, Transformation::Translate);
    EXPECT_NEAR(fitted.x, 899.0, 1e-9);
    EXPECT_NEAR(fitted.y, 250.0, 1e-9);
    EXPECT_DOUBLE_EQ(fitted.width, crop.width);
    EXPECT_DOUBLE_EQ(fitted.height, crop.height);
    EXPECT_TRUE(crop_fits(fitted, image_));
}

TEST_F(CropReconcilerTest, TranslateBackFromTopLeft) {
    CropState crop = inside_;
    crop.x = 50;
    crop.y = 30;

    const CropState fitted = fit_crop(crop, image_, free_, Transformation::Translate);
    EXPECT_NEAR(fitted.x, 100.0, 1e-9);
    EXPECT_NEAR(fitted.y, 50.0, 1e-9);
    EXPECT_DOUBLE_EQ(fitted.width, crop.width);
}

TEST_F(CropReconcilerTest, TranslateFallsBackWhenFullImageMoved) {
    CropState crop = full_;
    crop.x += 50;

    const CropState fitted = fit_crop(crop, image_, free_, Transformation::Translate);
    EXPECT_LE(fitted.width, full_.width);
    EXPECT_TRUE(crop_fits(fitted, image_));
    EXPECT_NEAR(fitted.width, 999.0, 1e-9);
    EXPECT_NEAR(fitted.height, 499.0, 1e-9);
    EXPECT_NEAR(fitted.x, 499.5, 1e-9);
    EXPECT_NEAR(fitted.y, 249.5, 1e-9);
}

TEST_F(CropReconcilerTest, TranslateFallsBackOnRotatedCrop) {
    // Rotated 600x300 spans more than the image height: no shift can help
    CropState crop = rotated_;
    crop.x += 100;

    for (const AspectRatio& aspect : {free_, AspectRatio{FixedAspect{2.0}}}) {
        const CropState fitted = fit_crop(crop, image_, aspect, Transformation::Translate);
        EXPECT_TRUE(crop_fits(fitted, image_));
        EXPECT_TRUE(fitted.is_valid());
        EXPECT_DOUBLE_EQ(fitted.angle, crop.angle);
        EXPECT_LT(fitted.height, crop.height);
        EXPECT_EQ(fit_crop(fitted, image_, aspect, Transformation::Translate), fitted);
    }

    const CropState fixed = fit_crop(crop, image_, FixedAspect{2.0}, Transformation::Translate);
    EXPECT_NEAR(fixed.width / fixed.height, 2.0, 1e-9);
}

TEST_F(CropReconcilerTest, TranslateFallsBackWhenWiderThanImage) {
    const CropState crop{.x = 500, .y = 250, .width = 1200, .height = 100, .angle = 0};

    const CropState fitted = fit_crop(crop, image_, free_, Transformation::Translate);
    EXPECT_NEAR(fitted.width, 999.0, 1e-9);
    EXPECT_NEAR(fitted.height, 100.0, 1e-9);
    EXPECT_NEAR(fitted.x, 499.5, 1e-9);
    EXPECT_NEAR(fitted.y, 250.0, 1e-9);
}

// =============================================================================
// Scale Tests
// =============================================================================

TEST_F(CropReconcilerTest, ScaleFullImageCrop) {
    const CropState fitted = fit_crop(full_, image_, free_, Transformation::Scale);
    EXPECT_NEAR(fitted.width, 999.0, 1e-9);
    EXPECT_NEAR(fitted.height, 499.0, 1e-9);
    EXPECT_TRUE(crop_fits(fitted, image_));
}

TEST_F(CropReconcilerTest, ScaleRotatedKeepsCornersInside) {
    const CropState fitted = fit_crop(rotated_, image_, FixedAspect{2.0}, Transformation::Scale);

    EXPECT_TRUE(crop_fits(fitted, image_));
    EXPECT_DOUBLE_EQ(fitted.angle, rotated_.angle);
    EXPECT_LT(fitted.width, rotated_.width);
}

TEST_F(CropReconcilerTest, ScaleRotatedKeepsAspect) {
    const CropState fitted = fit_crop(rotated_, image_, FixedAspect{2.0}, Transformation::Scale);
    EXPECT_NEAR(fitted.width / fitted.height, 2.0, 1e-9);
}

TEST_F(CropReconcilerTest, ScaleCornersShareCenter) {
    const CropState fitted = fit_crop(rotated_, image_, FixedAspect{2.0}, Transformation::Scale);
    const Corners c = get_corners(fitted);

    const Point ac = midpoint(corner_at(c, Corner::A), corner_at(c, Corner::C));
    const Point bd = midpoint(corner_at(c, Corner::B), corner_at(c, Corner::D));
    EXPECT_NEAR(ac.x, fitted.x, 1e-9);
    EXPECT_NEAR(ac.y, fitted.y, 1e-9);
    EXPECT_NEAR(bd.x, fitted.x, 1e-9);
    EXPECT_NEAR(bd.y, fitted.y, 1e-9);
}

// =============================================================================
// Convergence Tests
// =============================================================================

TEST_F(CropReconcilerTest, ScaleThinRotatedCropFreeAspect) {
    // Long thin crop past the right edge of a wide, short image
    const Dimension image{1096.596, 221.005};
    const CropState crop{.x = 1032.81, .y = 83.94, .width = 594.45, .height = 31.24,
                         .angle = 0.413};

    for (Transformation t : {Transformation::Scale, Transformation::Translate}) {
        const CropState fitted = fit_crop(crop, image, free_, t);
        EXPECT_TRUE(crop_fits(fitted, image)) << to_string(t);
        EXPECT_TRUE(fitted.is_valid()) << to_string(t);
        EXPECT_DOUBLE_EQ(fitted.angle, crop.angle) << to_string(t);
        EXPECT_GT(fitted.width, 1.0) << to_string(t);
        EXPECT_GT(fitted.height, 1.0) << to_string(t);
        // No collapse: at least the crop shrunk about its own center
        EXPECT_GT(fitted.width * fitted.height, 0.5 * crop.width * crop.height) << to_string(t);
        EXPECT_EQ(fit_crop(fitted, image, free_, t), fitted) << to_string(t);
    }
}

class CropReconcilerRandomTest : public ::testing::TestWithParam<Transformation> {
protected:
    static constexpr int kIterations = 2000;
};

TEST_P(CropReconcilerRandomTest, AlwaysFitsAndIsStable) {
    const Transformation preferred = GetParam();
    std::mt19937 rng(20240611u);

    auto uniform = [&rng](double lo, double hi) {
        return std::uniform_real_distribution<double>(lo, hi)(rng);
    };

    for (int i = 0; i < kIterations; ++i) {
        const Dimension image{uniform(50.0, 2000.0), uniform(50.0, 2000.0)};
        const CropState crop{
            .x = uniform(-0.2 * image.width, 1.2 * image.width),
            .y = uniform(-0.2 * image.height, 1.2 * image.height),
            .width = uniform(5.0, 1.5 * image.width),
            .height = uniform(5.0, 1.5 * image.height),
            .angle = uniform(-std::numbers::pi, std::numbers::pi)
        };

        const bool fixed = (i % 2) == 1;
        const AspectRatio aspect = fixed ? AspectRatio{FixedAspect{crop.width / crop.height}}
                                         : AspectRatio{FreeAspect{}};

        SCOPED_TRACE(testing::Message()
                     << "iteration " << i << ", image " << image.width << "x" << image.height
                     << ", crop " << crop.x << "," << crop.y << " " << crop.width << "x"
                     << crop.height << " @ " << crop.angle << (fixed ? " fixed" : " free"));

        const CropState fitted = fit_crop(crop, image, aspect, preferred);

        ASSERT_TRUE(crop_fits(fitted, image));
        ASSERT_TRUE(fitted.is_valid());
        ASSERT_DOUBLE_EQ(fitted.angle, crop.angle);
        if (fixed) {
            ASSERT_NEAR(fitted.aspect() / crop.aspect(), 1.0, 1e-6);
        }
        ASSERT_EQ(fit_crop(fitted, image, aspect, preferred), fitted);
    }
}

INSTANTIATE_TEST_SUITE_P(Transformations, CropReconcilerRandomTest,
                         ::testing::Values(Transformation::Translate, Transformation::Scale));

}  // namespace cgt
