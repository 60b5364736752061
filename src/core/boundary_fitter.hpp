/**
 * @file    boundary_fitter.hpp
 * @brief   Fit a dragged crop corner into the image
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Given a corner p and its diagonal opposite o, moves p (and o when both
 * overflow the same side) so that p lies inside the image, keeping the
 * aspect ratio if one is set. The result is the crop spanned by the two
 * points at the given rotation.
 */

#pragma once

#include "core/crop_types.hpp"

namespace cgt {

/**
 * Signed displacement that brings p into [0, width - 1] x [0, height - 1].
 * Zero on an axis where p is already inside.
 */
[[nodiscard]] Shift shift_required(const Point& p, const Dimension& image) noexcept;

/**
 * Clamp each axis of p into the image independently
 */
[[nodiscard]] Point nearest_point_in_bounds(const Point& p, const Dimension& image);

/**
 * Crop spanned by a corner and its opposite at the given rotation.
 * Extents are always positive; a collapsed rectangle is grown to
 * kMinCropExtent about its center.
 */
[[nodiscard]] CropState set_corner(const Point& p, const Point& o, double angle,
                                   const AspectRatio& aspect);

/**
 * Fit corner p into the image
 *
 * @param p         The corner being moved (image space)
 * @param o         Its diagonal opposite (image space)
 * @param image     Image dimension
 * @param aspect    Free or fixed width / height ratio
 * @param angle     Crop rotation in radians
 * @param diagonal  +1 if p-o is the A-C diagonal, -1 for B-D
 * @return          The crop with p repositioned
 */
[[nodiscard]] CropState fit_point(Point p, Point o, const Dimension& image,
                                  const AspectRatio& aspect, double angle, int diagonal);

}  // namespace cgt
