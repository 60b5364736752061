/**
 * @file    view_transform.hpp
 * @brief   Image <-> view space mapping
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The view transform renders the image so the crop rectangle sits level in
 * the middle of the viewport with a buffer of free space around it
 * (kCropBuffer unless the caller passes its own margin).
 */

#pragma once

#include "core/crop_config.hpp"
#include "core/crop_types.hpp"

namespace cgt {

/**
 * Transform that centers, levels and fits the crop inside the viewport.
 * Degenerate crop or viewport sizes fall back to unit scale, so the
 * result is always invertible.
 *
 * @param margin  Share of the viewport the crop may fill, see fit_margin()
 */
[[nodiscard]] Affine2D transform_to_fit(const CropState& crop, const Dimension& viewport,
                                        double margin = kFitMargin) noexcept;

/**
 * Scale factor used by transform_to_fit (0 for degenerate input)
 */
[[nodiscard]] double fit_scale(const CropState& crop, const Dimension& viewport,
                               double margin = kFitMargin) noexcept;

[[nodiscard]] inline Point image_to_canvas(const Point& p, const Affine2D& transform) noexcept {
    return transform.apply(p);
}

/**
 * @throws std::domain_error if transform is not invertible
 */
[[nodiscard]] Point canvas_to_image(const Point& p, const Affine2D& transform);

/**
 * Crop corners in view space
 */
[[nodiscard]] Corners canvas_corners(const CropState& crop, const Affine2D& transform) noexcept;

}  // namespace cgt
