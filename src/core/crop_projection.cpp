/**
 * @file    crop_projection.cpp
 * @brief   Rectangle projection implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/crop_projection.hpp"
#include "core/crop_config.hpp"

namespace cgt {

Corners get_corners(const CropState& crop) noexcept {
    const Affine2D to_image = Affine2D::identity()
        .rotated(crop.angle)
        .translated(crop.x, crop.y);

    const double hw = crop.width / 2.0;
    const double hh = crop.height / 2.0;

    return Corners{
        to_image.apply({-hw, -hh}),
        to_image.apply({ hw, -hh}),
        to_image.apply({ hw,  hh}),
        to_image.apply({-hw,  hh})
    };
}

Point get_inverse_corner(const Point& p, const Point& center, double angle) noexcept {
    return Affine2D::identity()
        .translated(-center.x, -center.y)
        .rotated(-angle)
        .apply(p);
}

bool is_within(const Point& p, const Dimension& image) noexcept {
    return p.x >= -kBoundsEpsilon && p.x <= image.width - 1.0 + kBoundsEpsilon &&
           p.y >= -kBoundsEpsilon && p.y <= image.height - 1.0 + kBoundsEpsilon;
}

}  // namespace cgt
