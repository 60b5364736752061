/**
 * @file    crop_reset.cpp
 * @brief   Initial crop for an image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/crop_reset.hpp"

#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

namespace cgt {

CropState reset_crop(const Dimension& image, const AspectRatio& aspect) {
    CropState crop{
        .x = image.width / 2.0,
        .y = image.height / 2.0,
        .width = image.width,
        .height = image.height,
        .angle = 0.0
    };

    const auto ratio = aspect_value(aspect);
    if (!ratio) {
        return crop;
    }

    if (!std::isfinite(*ratio) || *ratio <= 0.0) {
        throw std::invalid_argument(
            fmt::format("reset_crop: invalid aspect ratio {}", *ratio));
    }

    const double image_aspect = image.width / image.height;
    if (image_aspect > *ratio) {
        // Image is wider than the crop: limited by height
        crop.height = image.height;
        crop.width = image.height * *ratio;
    } else {
        // Image is taller than the crop: limited by width
        crop.width = image.width;
        crop.height = image.width / *ratio;
    }
    return crop;
}

}  // namespace cgt
