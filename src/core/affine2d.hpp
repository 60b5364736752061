/**
 * @file    affine2d.hpp
 * @brief   Immutable 2D affine transform
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Homogeneous 3x3 matrix with an implicit (0, 0, 1) last row.
 * Builder methods return a new transform that applies the current one
 * first and the new operation afterwards, so a chain reads in the order
 * the operations are applied to a point:
 *
 *   Affine2D{}.translated(-cx, -cy).rotated(-angle).scaled(s).translated(vx, vy)
 *
 * Rotation: a positive angle (radians) turns +x towards +y.
 */

#pragma once

#include "core/crop_math.hpp"

#include <opencv2/core.hpp>

namespace cgt {

class Affine2D {
public:
    Affine2D() noexcept : m_(cv::Matx33d::eye()) {}

    /**
     * Build from the six affine coefficients
     *   | a  c  e |
     *   | b  d  f |
     */
    Affine2D(double a, double b, double c, double d, double e, double f) noexcept
        : m_(a, c, e,
             b, d, f,
             0, 0, 1) {}

    [[nodiscard]] static Affine2D identity() noexcept { return Affine2D{}; }

    // ==========================================================================
    // Builders (append operation)
    // ==========================================================================

    [[nodiscard]] Affine2D translated(double dx, double dy) const noexcept;
    [[nodiscard]] Affine2D translated(const Point& offset) const noexcept {
        return translated(offset.x, offset.y);
    }

    [[nodiscard]] Affine2D rotated(double radians) const noexcept;

    [[nodiscard]] Affine2D scaled(double sx, double sy) const noexcept;
    [[nodiscard]] Affine2D scaled(double s) const noexcept { return scaled(s, s); }

    /**
     * Scale about a pivot point (the pivot is a fixed point of the scale)
     */
    [[nodiscard]] Affine2D scaled(double s, const Point& pivot) const noexcept;

    /**
     * Apply this transform, then next
     */
    [[nodiscard]] Affine2D then(const Affine2D& next) const noexcept;

    // ==========================================================================
    // Queries
    // ==========================================================================

    [[nodiscard]] double determinant() const noexcept;
    [[nodiscard]] bool is_invertible() const noexcept;

    /**
     * @throws std::domain_error if the matrix is singular or not finite
     */
    [[nodiscard]] Affine2D inverted() const;

    [[nodiscard]] Point apply(const Point& p) const noexcept;

    [[nodiscard]] double a() const noexcept { return m_(0, 0); }
    [[nodiscard]] double b() const noexcept { return m_(1, 0); }
    [[nodiscard]] double c() const noexcept { return m_(0, 1); }
    [[nodiscard]] double d() const noexcept { return m_(1, 1); }
    [[nodiscard]] double e() const noexcept { return m_(0, 2); }
    [[nodiscard]] double f() const noexcept { return m_(1, 2); }

    [[nodiscard]] const cv::Matx33d& matrix() const noexcept { return m_; }

private:
    explicit Affine2D(const cv::Matx33d& m) noexcept : m_(m) {}

    cv::Matx33d m_;
};

}  // namespace cgt
