/**
 * @file    view_transform.cpp
 * @brief   Image <-> view space mapping implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/view_transform.hpp"
#include "core/crop_config.hpp"
#include "core/crop_projection.hpp"

#include <algorithm>
#include <cmath>

namespace cgt {

double fit_scale(const CropState& crop, const Dimension& viewport, double margin) noexcept {
    // Before the image or the viewport is known these divide by zero
    const double scale_x = zero_if_nan(viewport.width / crop.width);
    const double scale_y = zero_if_nan(viewport.height / crop.height);
    return std::min(scale_x, scale_y) * margin;
}

Affine2D transform_to_fit(const CropState& crop, const Dimension& viewport,
                          double margin) noexcept {
    double scale = fit_scale(crop, viewport, margin);
    if (!(scale > 0.0) || !std::isfinite(scale)) {
        scale = 1.0;
    }

    const Point center = zero_if_nan(crop.center());
    const Point view_center = zero_if_nan(Point{viewport.width / 2.0, viewport.height / 2.0});

    return Affine2D::identity()
        .translated(-center.x, -center.y)   // crop center to origin
        .rotated(-zero_if_nan(crop.angle))  // level the crop
        .scaled(scale)
        .translated(view_center);           // origin to viewport center
}

Point canvas_to_image(const Point& p, const Affine2D& transform) {
    return transform.inverted().apply(p);
}

Corners canvas_corners(const CropState& crop, const Affine2D& transform) noexcept {
    Corners corners = get_corners(crop);
    for (auto& corner : corners) {
        corner = image_to_canvas(corner, transform);
    }
    return corners;
}

}  // namespace cgt
