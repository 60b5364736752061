/**
 * @file    crop_reset.hpp
 * @brief   Initial crop for an image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/crop_types.hpp"

namespace cgt {

/**
 * Largest level crop of the given aspect ratio, centered in the image.
 * Free aspect covers the whole image.
 *
 * @throws std::invalid_argument if a fixed ratio is not finite and positive
 */
[[nodiscard]] CropState reset_crop(const Dimension& image, const AspectRatio& aspect);

}  // namespace cgt
