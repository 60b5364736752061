/**
 * @file    crop_session.cpp
 * @brief   Crop Editing Session Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/crop_session.hpp"
#include "core/boundary_fitter.hpp"
#include "core/crop_projection.hpp"
#include "core/crop_reconciler.hpp"
#include "core/crop_reset.hpp"
#include "core/view_transform.hpp"
#include "utils/crop_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cgt {

namespace {

bool is_positive(const Dimension& d) noexcept {
    return std::isfinite(d.width) && std::isfinite(d.height) &&
           d.width > 0.0 && d.height > 0.0;
}

}  // anonymous namespace

CropSession::CropSession(SessionOptions options)
    : m_options(options)
{
    if (!(m_options.crop_buffer >= 0.0 && m_options.crop_buffer < 0.5)) {
        throw std::invalid_argument(
            fmt::format("crop_buffer must be in [0, 0.5), got {}", m_options.crop_buffer));
    }
    if (!(m_options.min_crop_size >= 0.0) || !std::isfinite(m_options.min_crop_size)) {
        throw std::invalid_argument(
            fmt::format("min_crop_size must be a finite non-negative size, got {}",
                        m_options.min_crop_size));
    }
}

// =============================================================================
// Setup
// =============================================================================

bool CropSession::load_image(const Dimension& image) {
    if (!is_positive(image)) {
        spdlog::warn("Ignoring image with invalid size {}x{}", image.width, image.height);
        return false;
    }

    m_state.view.image = image;
    m_state.crop = reset_crop(image, m_state.aspect);
    spdlog::debug("Image {}x{} loaded, crop reset to {}", image.width, image.height, m_state.crop);

    refit_view();
    return true;
}

bool CropSession::set_viewport(const Dimension& viewport) {
    if (!is_positive(viewport)) {
        spdlog::warn("Ignoring viewport with invalid size {}x{}", viewport.width, viewport.height);
        return false;
    }

    m_state.view.viewport = viewport;
    refit_view();
    return true;
}

void CropSession::set_aspect(const AspectRatio& aspect) {
    m_state.aspect = aspect;
    spdlog::debug("Aspect ratio set to {}", aspect);

    if (m_state.view.image) {
        m_state.crop = reset_crop(*m_state.view.image, aspect);
        refit_view();
    }
}

void CropSession::restore(const CropState& crop) {
    if (!m_state.view.image) {
        m_state.crop = crop;
        return;
    }

    const Dimension& image = *m_state.view.image;
    if (!crop.is_valid()) {
        spdlog::warn("Restored crop {} is invalid, resetting", crop);
        m_state.crop = reset_crop(image, m_state.aspect);
    } else if (!matches_aspect(crop, m_state.aspect)) {
        const CropState conformed = conform_to_aspect(crop, m_state.aspect);
        spdlog::warn("Restored crop {} does not match aspect {}, trimmed to {}",
                     crop, m_state.aspect, conformed);
        m_state.crop = fit_crop(conformed, image, m_state.aspect, Transformation::Scale);
    } else {
        m_state.crop = fit_crop(crop, image, m_state.aspect, Transformation::Scale);
    }
    refit_view();
}

// =============================================================================
// Gestures
// =============================================================================

Point CropSession::clamp_drag_position(Corner corner, Point pos, const Point& opposite_pos) const {
    double min_x = m_options.min_crop_size;
    double min_y = m_options.min_crop_size;

    if (const auto ratio = aspect_value(m_state.aspect)) {
        if (*ratio < 1.0) {
            // Portrait: width is the short side
            min_y = min_x / *ratio;
        } else if (*ratio > 1.0) {
            // Landscape: height is the short side
            min_x = min_y * *ratio;
        }
    }

    switch (corner) {
        case Corner::B:
        case Corner::C:
            pos.x = std::max(pos.x, opposite_pos.x + min_x);
            break;
        case Corner::A:
        case Corner::D:
            pos.x = std::min(pos.x, opposite_pos.x - min_x);
            break;
    }

    switch (corner) {
        case Corner::A:
        case Corner::B:
            pos.y = std::min(pos.y, opposite_pos.y - min_y);
            break;
        case Corner::C:
        case Corner::D:
            pos.y = std::max(pos.y, opposite_pos.y + min_y);
            break;
    }

    return pos;
}

bool CropSession::drag_corner(Corner corner, const Point& canvas_pos) {
    if (!is_ready()) return false;

    const Dimension& image = *m_state.view.image;
    const Affine2D& transform = m_state.view.transform;

    const Corners corners = canvas_corners();
    const Point& opposite_pos = corner_at(corners, opposite(corner));
    const Point pos = clamp_drag_position(corner, zero_if_nan(canvas_pos), opposite_pos);

    const CropState fitted = fit_point(
        canvas_to_image(pos, transform),
        canvas_to_image(opposite_pos, transform),
        image, m_state.aspect, m_state.crop.angle, diagonal_sign(corner));

    m_state.crop = fit_crop(fitted, image, m_state.aspect, Transformation::Translate);

    // Shrinking waits for commit(); growing past the buffer refits right away
    if (needs_refit()) {
        refit_view();
    }
    return true;
}

void CropSession::commit() {
    refit_view();
}

bool CropSession::pan(const Point& canvas_delta) {
    if (!is_ready()) return false;

    const Affine2D& transform = m_state.view.transform;
    const Point screen = image_to_canvas(m_state.crop.center(), transform);
    const Point moved = canvas_to_image(
        {screen.x - zero_if_nan(canvas_delta.x), screen.y - zero_if_nan(canvas_delta.y)},
        transform);

    CropState proposed = m_state.crop;
    proposed.x = moved.x;
    proposed.y = moved.y;

    m_state.crop = fit_crop(proposed, *m_state.view.image, m_state.aspect,
                            Transformation::Translate);
    refit_view();
    return true;
}

bool CropSession::set_rotation(double radians) {
    if (!is_ready()) return false;

    CropState proposed = m_state.crop;
    proposed.angle = radians;

    // Free-form crops keep their current shape while rotating
    AspectRatio fit_aspect = m_state.aspect;
    if (is_free(fit_aspect)) {
        const double current = m_state.crop.aspect();
        if (std::isfinite(current) && current > 0.0) {
            fit_aspect = FixedAspect{current};
        }
    }

    m_state.crop = fit_crop(proposed, *m_state.view.image, fit_aspect, Transformation::Scale);
    spdlog::debug("Rotated to {:.2f} deg: {}", radians_to_degrees(radians), m_state.crop);

    refit_view();
    return true;
}

// =============================================================================
// Overlay queries
// =============================================================================

Corners CropSession::canvas_corners() const noexcept {
    return cgt::canvas_corners(m_state.crop, m_state.view.transform);
}

Corners CropSession::handle_positions() const {
    Corners corners = canvas_corners();
    if (!m_state.view.viewport) {
        for (auto& p : corners) p = zero_if_nan(p);
        return corners;
    }

    const Dimension& vp = *m_state.view.viewport;
    const double buffer = m_options.crop_buffer;
    for (auto& p : corners) {
        p.x = clamp(zero_if_nan(p.x), buffer * vp.width, (1.0 - buffer) * vp.width);
        p.y = clamp(zero_if_nan(p.y), buffer * vp.height, (1.0 - buffer) * vp.height);
    }
    return corners;
}

cv::Rect2d CropSession::overlay_rect() const noexcept {
    const Corners corners = canvas_corners();
    const Point& a = corner_at(corners, Corner::A);
    const Point& b = corner_at(corners, Corner::B);
    const Point& d = corner_at(corners, Corner::D);

    return cv::Rect2d(zero_if_nan(a.x), zero_if_nan(a.y),
                      zero_if_nan(b.x - a.x), zero_if_nan(d.y - a.y));
}

bool CropSession::needs_refit() const noexcept {
    if (!is_ready()) return false;

    const Dimension& vp = *m_state.view.viewport;
    const double buffer = m_options.crop_buffer;
    const Corners corners = canvas_corners();

    return corner_at(corners, Corner::A).x < buffer * vp.width ||
           corner_at(corners, Corner::B).x > (1.0 - buffer) * vp.width ||
           corner_at(corners, Corner::A).y < buffer * vp.height ||
           corner_at(corners, Corner::D).y > (1.0 - buffer) * vp.height;
}

void CropSession::refit_view() {
    if (!m_state.view.viewport) return;
    m_state.view.transform = transform_to_fit(m_state.crop, *m_state.view.viewport,
                                              fit_margin(m_options.crop_buffer));
}

}  // namespace cgt
