/**
 * @file    crop_math.hpp
 * @brief   Scalar and vector helpers for crop geometry
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core/types.hpp>

#include <cmath>
#include <initializer_list>
#include <numbers>

namespace cgt {

using Point = cv::Point2d;
using Dimension = cv::Size2d;

// =============================================================================
// Angles
// =============================================================================

[[nodiscard]] constexpr double degrees_to_radians(double degrees) noexcept {
    return degrees * std::numbers::pi / 180.0;
}

[[nodiscard]] constexpr double radians_to_degrees(double radians) noexcept {
    return radians * 180.0 / std::numbers::pi;
}

// =============================================================================
// Scalars
// =============================================================================

/**
 * Clamp a into [min, max]
 * @throws std::invalid_argument if min > max
 */
[[nodiscard]] double clamp(double a, double min, double max);

/**
 * -1, 0 or 1. Behavior is unspecified for NaN.
 */
[[nodiscard]] constexpr int sign(double a) noexcept {
    if (a == 0.0) return 0;
    return a < 0.0 ? -1 : 1;
}

/**
 * True if a and b have the same sign. Zero matches either sign.
 */
[[nodiscard]] constexpr bool signs_match(double a, double b) noexcept {
    if (a == 0.0 || b == 0.0) return true;
    return (a < 0.0) == (b < 0.0);
}

/**
 * The value with the largest absolute magnitude.
 * On a tie the first value seen wins.
 */
[[nodiscard]] double max_magnitude(std::initializer_list<double> values) noexcept;

[[nodiscard]] inline double max_magnitude(double a, double b) noexcept {
    return max_magnitude({a, b});
}

/**
 * Relative equality within machine epsilon.
 * Not meaningful near zero or for very large magnitudes.
 */
[[nodiscard]] bool approx_equal(double a, double b) noexcept;

/**
 * 0 for NaN and +-Infinity, a otherwise
 */
[[nodiscard]] inline double zero_if_nan(double a) noexcept {
    return std::isfinite(a) ? a : 0.0;
}

// =============================================================================
// Points
// =============================================================================

[[nodiscard]] inline Point midpoint(const Point& a, const Point& b) noexcept {
    return {(a.x + b.x) / 2.0, (a.y + b.y) / 2.0};
}

[[nodiscard]] inline Point zero_if_nan(const Point& p) noexcept {
    return {zero_if_nan(p.x), zero_if_nan(p.y)};
}

}  // namespace cgt
