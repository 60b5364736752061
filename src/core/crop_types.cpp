/**
 * @file    crop_types.cpp
 * @brief   Aspect ratio helpers
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/crop_types.hpp"
#include "core/crop_config.hpp"

#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

namespace cgt {

AspectRatio make_aspect(double ratio) {
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        throw std::invalid_argument(
            fmt::format("Aspect ratio must be a finite positive number, got {}", ratio));
    }
    return FixedAspect{ratio};
}

std::optional<double> aspect_value(const AspectRatio& aspect) noexcept {
    return std::visit(overloaded{
        [](const FreeAspect&) -> std::optional<double> { return std::nullopt; },
        [](const FixedAspect& fixed) -> std::optional<double> { return fixed.ratio; }
    }, aspect);
}

bool matches_aspect(const CropState& crop, const AspectRatio& aspect) noexcept {
    const auto ratio = aspect_value(aspect);
    if (!ratio) return true;
    if (crop.height <= 0.0) return false;

    return std::abs(crop.aspect() / *ratio - 1.0) <= kAspectTolerance;
}

CropState conform_to_aspect(const CropState& crop, const AspectRatio& aspect) noexcept {
    if (matches_aspect(crop, aspect)) return crop;

    const double ratio = *aspect_value(aspect);
    CropState conformed = crop;
    if (crop.aspect() > ratio) {
        conformed.width = crop.height * ratio;
    } else {
        conformed.height = crop.width / ratio;
    }
    return conformed;
}

}  // namespace cgt
