/**
 * @file    crop_projection.hpp
 * @brief   Rectangle projection between image space and crop-local space
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/crop_types.hpp"

#include <array>

namespace cgt {

// =============================================================================
// Corner tables
// =============================================================================

inline constexpr std::array<Corner, 4> kOppositeCorner{Corner::C, Corner::D, Corner::A, Corner::B};

// +1 for the A-C diagonal, -1 for the B-D diagonal
inline constexpr std::array<int, 4> kDiagonalSign{1, -1, 1, -1};

[[nodiscard]] constexpr Corner opposite(Corner c) noexcept {
    return kOppositeCorner[index_of(c)];
}

[[nodiscard]] constexpr int diagonal_sign(Corner c) noexcept {
    return kDiagonalSign[index_of(c)];
}

// =============================================================================
// Projection
// =============================================================================

/**
 * Image-space corners of the crop, clockwise from A.
 * Corner A is (-w/2, -h/2) in the crop frame before rotation.
 */
[[nodiscard]] Corners get_corners(const CropState& crop) noexcept;

/**
 * Coordinates of p relative to center in a frame rotated by angle
 * (translate by -center, then rotate by -angle)
 */
[[nodiscard]] Point get_inverse_corner(const Point& p, const Point& center, double angle) noexcept;

/**
 * True if p lies in [0, width - 1] x [0, height - 1]
 */
[[nodiscard]] bool is_within(const Point& p, const Dimension& image) noexcept;

}  // namespace cgt
