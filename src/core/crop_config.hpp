/**
 * @file    crop_config.hpp
 * @brief   Crop Geometry Constants
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Tuning constants shared by the geometry engine, the crop session
 * and the document format.
 */

#pragma once

namespace cgt {

// =============================================================================
// View fitting
// =============================================================================

// Fraction of the viewport kept free on each side of the crop
inline constexpr double kCropBuffer = 0.05;

// Shrink factor applied when fitting the crop to a viewport with the given
// buffer. Must stay strictly below 1 - 2 * buffer, otherwise a crop that
// exactly fills the buffered area triggers another refit on every update.
[[nodiscard]] constexpr double fit_margin(double buffer) noexcept {
    return 1.0 - buffer * 2.0 - 0.0001;
}

inline constexpr double kFitMargin = fit_margin(kCropBuffer);

// =============================================================================
// Crop limits
// =============================================================================

// Minimum crop size in view (canvas) pixels while dragging a corner
inline constexpr double kMinCropSize = 10.0;

// Smallest extent in image pixels a fitted crop may collapse to
inline constexpr double kMinCropExtent = 1.0;

// Tolerance used for image bounds checks (image pixels)
inline constexpr double kBoundsEpsilon = 1e-6;

// Relative tolerance when comparing a crop's width / height to a fixed ratio
inline constexpr double kAspectTolerance = 1e-6;

// Upper bound on full scale passes in the reconciler before it shrinks the
// crop about its center instead
inline constexpr int kMaxScalePasses = 32;

// =============================================================================
// Persistence
// =============================================================================

inline constexpr int kDocumentVersion = 1;

}  // namespace cgt
