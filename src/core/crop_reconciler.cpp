/**
 * @file    crop_reconciler.cpp
 * @brief   Refit a whole crop rectangle into the image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/crop_reconciler.hpp"
#include "core/boundary_fitter.hpp"
#include "core/crop_config.hpp"
#include "core/crop_projection.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace cgt {

namespace {

enum class FitStage {
    Translate,
    Scale,
    Done
};

struct StageResult {
    CropState crop;
    FitStage next;
};

StageResult translate_stage(const CropState& crop, const Dimension& image) {
    const Corners corners = get_corners(crop);

    Shift delta;
    for (const auto& corner : corners) {
        const Shift s = shift_required(corner, image);

        if (!signs_match(delta.dx, s.dx)) {
            // One corner needs to go left, another right: the crop is wider
            // than the image and no translation helps
            spdlog::debug("Translate impossible on x, falling back to scale");
            return {crop, FitStage::Scale};
        }
        delta.dx = max_magnitude(delta.dx, s.dx);

        if (!signs_match(delta.dy, s.dy)) {
            spdlog::debug("Translate impossible on y, falling back to scale");
            return {crop, FitStage::Scale};
        }
        delta.dy = max_magnitude(delta.dy, s.dy);
    }

    if (delta.is_zero()) {
        return {crop, FitStage::Done};
    }

    CropState moved = crop;
    moved.x += delta.dx;
    moved.y += delta.dy;

    if (!crop_fits(moved, image)) {
        // Fixing one corner pushed another one out
        spdlog::debug("Translate by ({:.3f}, {:.3f}) leaves a corner outside, falling back to scale",
                      delta.dx, delta.dy);
        return {moved, FitStage::Scale};
    }

    return {moved, FitStage::Done};
}

CropState scale_pass(const CropState& crop, const Dimension& image, const AspectRatio& aspect) {
    CropState current = crop;
    Corners corners = get_corners(current);

    for (Corner c : kAllCorners) {
        const Point& p = corner_at(corners, c);
        if (is_within(p, image)) continue;

        current = fit_point(p, corner_at(corners, opposite(c)), image, aspect,
                            crop.angle, diagonal_sign(c));
        corners = get_corners(current);
    }
    return current;
}

/**
 * Largest copy of crop (same shape and angle) that fits the image, placed as
 * close to the crop's center as the image allows
 */
CropState shrink_to_fit(const CropState& crop, const Dimension& image) {
    const double cs = std::abs(std::cos(crop.angle));
    const double sn = std::abs(std::sin(crop.angle));

    // Half extents of the rotated rectangle along the image axes
    const double ex = cs * crop.width / 2.0 + sn * crop.height / 2.0;
    const double ey = sn * crop.width / 2.0 + cs * crop.height / 2.0;

    const double max_x = image.width - 1.0;
    const double max_y = image.height - 1.0;
    if (max_x <= 0.0 || max_y <= 0.0) {
        // No crop with positive extents fits an image under two pixels
        return crop;
    }

    double k = 1.0;
    if (ex > 0.0) k = std::min(k, max_x / (2.0 * ex));
    if (ey > 0.0) k = std::min(k, max_y / (2.0 * ey));

    const double lo_x = k * ex;
    const double lo_y = k * ey;

    CropState fitted = crop;
    fitted.width = crop.width * k;
    fitted.height = crop.height * k;
    fitted.x = clamp(crop.x, lo_x, std::max(lo_x, max_x - lo_x));
    fitted.y = clamp(crop.y, lo_y, std::max(lo_y, max_y - lo_y));
    return fitted;
}

double area(const CropState& crop) noexcept {
    return crop.width * crop.height;
}

}  // anonymous namespace

bool crop_fits(const CropState& crop, const Dimension& image) noexcept {
    const Corners corners = get_corners(crop);
    return std::all_of(corners.begin(), corners.end(),
                       [&](const Point& p) { return is_within(p, image); });
}

CropState fit_crop(const CropState& crop, const Dimension& image,
                   const AspectRatio& aspect, Transformation preferred) {
    CropState current = crop;
    CropState scale_input = crop;
    FitStage stage = (preferred == Transformation::Translate) ? FitStage::Translate
                                                              : FitStage::Scale;
    int scale_passes = 0;

    while (stage != FitStage::Done) {
        switch (stage) {
            case FitStage::Translate: {
                // Only ever entered once: scale never returns to translate
                StageResult result = translate_stage(current, image);
                current = result.crop;
                scale_input = result.crop;
                stage = result.next;
                break;
            }
            case FitStage::Scale:
                if (crop_fits(current, image)) {
                    if (scale_passes > 0) {
                        // Corner passes can collapse a thin rotated crop far
                        // below what fits around its center
                        const CropState shrunk = shrink_to_fit(
                            conform_to_aspect(scale_input, aspect), image);
                        if (area(shrunk) > area(current) && crop_fits(shrunk, image)) {
                            spdlog::debug("Scale passes gave {:.3f}x{:.3f}, shrinking about "
                                          "the center keeps {:.3f}x{:.3f}", current.width,
                                          current.height, shrunk.width, shrunk.height);
                            current = shrunk;
                        }
                    }
                    stage = FitStage::Done;
                    break;
                }
                if (scale_passes++ >= kMaxScalePasses) {
                    spdlog::debug("Crop still outside image after {} scale passes, "
                                  "shrinking about its center", kMaxScalePasses);
                    current = shrink_to_fit(conform_to_aspect(scale_input, aspect), image);
                    stage = FitStage::Done;
                    break;
                }
                current = scale_pass(current, image, aspect);
                break;
            case FitStage::Done:
                break;
        }
    }

    return current;
}

}  // namespace cgt
