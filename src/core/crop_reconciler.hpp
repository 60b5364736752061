/**
 * @file    crop_reconciler.hpp
 * @brief   Refit a whole crop rectangle into the image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/crop_types.hpp"

namespace cgt {

/**
 * True if all four corners of the crop lie inside the image
 */
[[nodiscard]] bool crop_fits(const CropState& crop, const Dimension& image) noexcept;

/**
 * Fit the crop into the image with the smallest change possible.
 *
 * Translate moves the crop by the largest shift any corner needs. When the
 * crop is larger than the image on an axis, or the move pushes another
 * corner out, the crop is scaled instead. Scale refits corners A, B, C, D in
 * turn against their opposite, repeating the pass until every corner is
 * inside. The crop that entered the scale stage, shrunk about its center
 * (same angle and ratio) until it fits, replaces the pass result when it is
 * larger or when the passes do not converge.
 *
 * A crop that already fits is returned unchanged.
 *
 * @param crop       Crop to fit
 * @param image      Image dimension
 * @param aspect     Aspect ratio to keep
 * @param preferred  Transformation to try first
 */
[[nodiscard]] CropState fit_crop(const CropState& crop, const Dimension& image,
                                 const AspectRatio& aspect, Transformation preferred);

}  // namespace cgt
