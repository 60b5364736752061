/**
 * @file    crop_session.hpp
 * @brief   Crop Editing Session
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Owns the image, viewport, aspect ratio and crop of one editing context and
 * applies editing gestures through the pure geometry engine. Positions come
 * in view (canvas) space; every result replaces the session state wholesale.
 * Gestures are ignored until both the image and the viewport are known.
 */

#pragma once

#include "core/crop_config.hpp"
#include "core/crop_types.hpp"

#include <opencv2/core/types.hpp>

namespace cgt {

/**
 * Runtime options for a session
 */
struct SessionOptions {
    double crop_buffer{kCropBuffer};     // Free fraction of the viewport on each side
    double min_crop_size{kMinCropSize};  // Minimum crop size in view pixels
};

/**
 * Complete session state
 */
struct SessionState {
    ViewState view;
    CropState crop;
    AspectRatio aspect{FreeAspect{}};
};

class CropSession {
public:
    /**
     * @throws std::invalid_argument if crop_buffer is outside [0, 0.5) or
     *         min_crop_size is negative
     */
    explicit CropSession(SessionOptions options = {});

    // ==========================================================================
    // State Access
    // ==========================================================================

    [[nodiscard]] const SessionState& state() const noexcept { return m_state; }
    [[nodiscard]] const CropState& crop() const noexcept { return m_state.crop; }
    [[nodiscard]] const Affine2D& transform() const noexcept { return m_state.view.transform; }
    [[nodiscard]] const AspectRatio& aspect() const noexcept { return m_state.aspect; }
    [[nodiscard]] const SessionOptions& options() const noexcept { return m_options; }

    /**
     * Image and viewport are both known and non-degenerate
     */
    [[nodiscard]] bool is_ready() const noexcept { return m_state.view.is_ready(); }

    // ==========================================================================
    // Setup
    // ==========================================================================

    /**
     * Set the natural image size and reset the crop
     * @return false if the dimension is not positive
     */
    bool load_image(const Dimension& image);

    /**
     * Set the display size and refit the view
     * @return false if the dimension is not positive
     */
    bool set_viewport(const Dimension& viewport);

    /**
     * Change the aspect ratio. The crop is reset when an image is loaded.
     */
    void set_aspect(const AspectRatio& aspect);

    /**
     * Replace the crop (e.g. from a saved document). An invalid crop is
     * replaced by a reset crop. A crop whose ratio disagrees with a fixed
     * aspect is trimmed to that ratio about its center; one that overflows
     * the image is scaled in.
     */
    void restore(const CropState& crop);

    // ==========================================================================
    // Gestures
    // ==========================================================================

    /**
     * Move one corner to a view-space position. The opposite corner stays
     * put unless the image bounds require otherwise.
     * @return false if the session is not ready
     */
    bool drag_corner(Corner corner, const Point& canvas_pos);

    /**
     * Finish a drag: refit the view to the current crop
     */
    void commit();

    /**
     * Drag the image under the crop by a view-space delta
     * @return false if the session is not ready
     */
    bool pan(const Point& canvas_delta);

    /**
     * Set the crop rotation in radians, shrinking the crop if needed
     * @return false if the session is not ready
     */
    bool set_rotation(double radians);

    // ==========================================================================
    // Overlay queries (view space)
    // ==========================================================================

    [[nodiscard]] Corners canvas_corners() const noexcept;

    /**
     * Corner handle positions, kept inside the buffered viewport area
     */
    [[nodiscard]] Corners handle_positions() const;

    /**
     * Level rectangle of the crop in view space, NaN-free
     */
    [[nodiscard]] cv::Rect2d overlay_rect() const noexcept;

    /**
     * The crop has grown into the buffer band and the view should be refit
     */
    [[nodiscard]] bool needs_refit() const noexcept;

private:
    SessionState m_state;
    SessionOptions m_options;

    void refit_view();
    [[nodiscard]] Point clamp_drag_position(Corner corner, Point pos, const Point& opposite_pos) const;
};

}  // namespace cgt
