/**
 * @file    cli_args_test.cpp
 * @brief   Unit tests for command-line value parsers
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "cli/cli_args.hpp"

namespace cgt::cli {

// =============================================================================
// Dimension Tests
// =============================================================================

TEST(CliArgsTest, ParseDimension) {
    const auto d = parse_dimension("800x600");
    ASSERT_TRUE(d.has_value());
    EXPECT_DOUBLE_EQ(d->width, 800.0);
    EXPECT_DOUBLE_EQ(d->height, 600.0);

    const auto upper = parse_dimension(" 1920X1080 ");
    ASSERT_TRUE(upper.has_value());
    EXPECT_DOUBLE_EQ(upper->width, 1920.0);
}

TEST(CliArgsTest, ParseDimensionRejects) {
    EXPECT_FALSE(parse_dimension("800").has_value());
    EXPECT_FALSE(parse_dimension("800x").has_value());
    EXPECT_FALSE(parse_dimension("0x600").has_value());
    EXPECT_FALSE(parse_dimension("-800x600").has_value());
    EXPECT_FALSE(parse_dimension("wide x tall").has_value());
}

// =============================================================================
// Aspect Tests
// =============================================================================

TEST(CliArgsTest, ParseAspectFree) {
    const auto a = parse_aspect("Free");
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(is_free(*a));
}

TEST(CliArgsTest, ParseAspectRatio) {
    const auto wide = parse_aspect("16:9");
    ASSERT_TRUE(wide.has_value());
    EXPECT_DOUBLE_EQ(aspect_value(*wide).value_or(0.0), 16.0 / 9.0);

    const auto plain = parse_aspect("1.5");
    ASSERT_TRUE(plain.has_value());
    EXPECT_DOUBLE_EQ(aspect_value(*plain).value_or(0.0), 1.5);
}

TEST(CliArgsTest, ParseAspectRejects) {
    EXPECT_FALSE(parse_aspect("4:0").has_value());
    EXPECT_FALSE(parse_aspect("-1").has_value());
    EXPECT_FALSE(parse_aspect("0").has_value());
    EXPECT_FALSE(parse_aspect("square").has_value());
}

// =============================================================================
// Corner Tests
// =============================================================================

TEST(CliArgsTest, ParseCornerNames) {
    EXPECT_EQ(parse_corner("a"), Corner::A);
    EXPECT_EQ(parse_corner("TR"), Corner::B);
    EXPECT_EQ(parse_corner("c"), Corner::C);
    EXPECT_EQ(parse_corner("bl"), Corner::D);
    EXPECT_FALSE(parse_corner("e").has_value());
}

// =============================================================================
// Point Tests
// =============================================================================

TEST(CliArgsTest, ParsePoint) {
    const auto p = parse_point("-5.5, +3");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, -5.5);
    EXPECT_DOUBLE_EQ(p->y, 3.0);
}

TEST(CliArgsTest, ParsePointRejects) {
    EXPECT_FALSE(parse_point("10").has_value());
    EXPECT_FALSE(parse_point("10,").has_value());
    EXPECT_FALSE(parse_point("x,y").has_value());
}

}  // namespace cgt::cli
