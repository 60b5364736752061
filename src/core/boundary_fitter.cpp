/**
 * @file    boundary_fitter.cpp
 * @brief   Fit a dragged crop corner into the image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/boundary_fitter.hpp"
#include "core/crop_config.hpp"
#include "core/crop_projection.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace cgt {

namespace {

double axis_shift(double v, double extent) noexcept {
    const double max = extent - 1.0;
    if (v > max + kBoundsEpsilon) return max - v;  // too far right / down
    if (v < -kBoundsEpsilon) return -v;            // too far left / up
    return 0.0;
}

/**
 * Both points overflow the same side on this axis
 */
bool shift_together(double a, double b) noexcept {
    return a != 0.0 && b != 0.0 && signs_match(a, b);
}

/**
 * Parameter range [lower, upper] of o + t * dir that stays inside the image.
 * Axis-aligned directions are handled separately to avoid dividing by zero.
 */
std::pair<double, double> line_interval(const Point& o, const Point& dir,
                                        const Dimension& image) noexcept {
    const double t1x = -o.x / dir.x;
    const double t2x = (image.width - 1.0 - o.x) / dir.x;
    const double t1y = -o.y / dir.y;
    const double t2y = (image.height - 1.0 - o.y) / dir.y;

    if (dir.x == 0.0) {
        // vertical
        return {t1y, t2y};
    }
    if (dir.y == 0.0) {
        // horizontal
        return {t1x, t2x};
    }
    if (dir.x > 0.0 && dir.y > 0.0) {
        return {std::max(t1x, t1y), std::min(t2x, t2y)};
    }
    if (dir.x < 0.0 && dir.y > 0.0) {
        return {std::max(t2x, t1y), std::min(t1x, t2y)};
    }
    if (dir.x < 0.0 && dir.y < 0.0) {
        return {std::max(t2x, t2y), std::min(t1x, t1y)};
    }
    // dir.x > 0, dir.y < 0
    return {std::max(t1x, t2y), std::min(t2x, t1y)};
}

Point fit_on_aspect_line(const Point& p, const Point& o, const Dimension& image,
                         double ratio, double angle, int diagonal) {
    // Line through o along the rotated (ratio, diagonal) diagonal direction
    const Point dir = Affine2D::identity()
        .rotated(angle)
        .apply({ratio, static_cast<double>(diagonal)});

    const auto [lower, upper] = line_interval(o, dir, image);

    // Closest point on the line to the requested position
    const double t = (dir.x * (p.x - o.x) + dir.y * (p.y - o.y)) /
                     (dir.x * dir.x + dir.y * dir.y);

    const double t_fit = clamp(t, std::min(lower, upper), std::max(lower, upper));
    return {o.x + t_fit * dir.x, o.y + t_fit * dir.y};
}

}  // anonymous namespace

Shift shift_required(const Point& p, const Dimension& image) noexcept {
    return Shift{axis_shift(p.x, image.width), axis_shift(p.y, image.height)};
}

Point nearest_point_in_bounds(const Point& p, const Dimension& image) {
    return {
        clamp(p.x, 0.0, image.width - 1.0),
        clamp(p.y, 0.0, image.height - 1.0)
    };
}

CropState set_corner(const Point& p, const Point& o, double angle, const AspectRatio& aspect) {
    const Point center = midpoint(p, o);
    const Point local = get_inverse_corner(p, center, angle);

    CropState crop{
        .x = center.x,
        .y = center.y,
        .width = zero_if_nan(std::abs(local.x * 2.0)),
        .height = zero_if_nan(std::abs(local.y * 2.0)),
        .angle = angle
    };

    if (crop.width >= kMinCropExtent && crop.height >= kMinCropExtent) {
        return crop;
    }

    spdlog::debug("Crop collapsed to {:.4f}x{:.4f}, growing to minimum extent",
                  crop.width, crop.height);

    std::visit(overloaded{
        [&](const FreeAspect&) {
            crop.width = std::max(crop.width, kMinCropExtent);
            crop.height = std::max(crop.height, kMinCropExtent);
        },
        [&](const FixedAspect& fixed) {
            crop.height = std::max(crop.height,
                                   std::max(kMinCropExtent, kMinCropExtent / fixed.ratio));
            crop.width = crop.height * fixed.ratio;
        }
    }, aspect);

    return crop;
}

CropState fit_point(Point p, Point o, const Dimension& image,
                    const AspectRatio& aspect, double angle, int diagonal) {
    // Both corners off the same side: move them together first, otherwise
    // resizing from p would flip or flatten the rectangle
    const Shift p_shift = shift_required(p, image);
    const Shift o_shift = shift_required(o, image);

    if (shift_together(p_shift.dx, o_shift.dx)) {
        const double dx = max_magnitude(p_shift.dx, o_shift.dx);
        p.x += dx;
        o.x += dx;
    }
    if (shift_together(p_shift.dy, o_shift.dy)) {
        const double dy = max_magnitude(p_shift.dy, o_shift.dy);
        p.y += dy;
        o.y += dy;
    }

    const Point p_prime = std::visit(overloaded{
        [&](const FreeAspect&) {
            return nearest_point_in_bounds(p, image);
        },
        [&](const FixedAspect& fixed) {
            return fit_on_aspect_line(p, o, image, fixed.ratio, angle, diagonal);
        }
    }, aspect);

    return set_corner(p_prime, o, angle, aspect);
}

}  // namespace cgt
