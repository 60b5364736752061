/**
 * @file    affine2d.cpp
 * @brief   Immutable 2D affine transform implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/affine2d.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace cgt {

Affine2D Affine2D::translated(double dx, double dy) const noexcept {
    const cv::Matx33d t(1, 0, dx,
                        0, 1, dy,
                        0, 0, 1);
    return Affine2D{t * m_};
}

Affine2D Affine2D::rotated(double radians) const noexcept {
    const double cs = std::cos(radians);
    const double sn = std::sin(radians);
    const cv::Matx33d r(cs, -sn, 0,
                        sn,  cs, 0,
                        0,   0,  1);
    return Affine2D{r * m_};
}

Affine2D Affine2D::scaled(double sx, double sy) const noexcept {
    const cv::Matx33d s(sx, 0,  0,
                        0,  sy, 0,
                        0,  0,  1);
    return Affine2D{s * m_};
}

Affine2D Affine2D::scaled(double s, const Point& pivot) const noexcept {
    return translated(-pivot.x, -pivot.y).scaled(s).translated(pivot);
}

Affine2D Affine2D::then(const Affine2D& next) const noexcept {
    return Affine2D{next.m_ * m_};
}

double Affine2D::determinant() const noexcept {
    return m_(0, 0) * m_(1, 1) - m_(0, 1) * m_(1, 0);
}

bool Affine2D::is_invertible() const noexcept {
    const double det = determinant();
    return std::isfinite(det) &&
           std::abs(det) > std::numeric_limits<double>::min() &&
           std::isfinite(m_(0, 2)) && std::isfinite(m_(1, 2));
}

Affine2D Affine2D::inverted() const {
    if (!is_invertible()) {
        throw std::domain_error("Affine2D: matrix is not invertible");
    }

    cv::Matx33d inv = m_.inv(cv::DECOMP_LU);
    // Keep the homogeneous row exact
    inv(2, 0) = 0.0;
    inv(2, 1) = 0.0;
    inv(2, 2) = 1.0;
    return Affine2D{inv};
}

Point Affine2D::apply(const Point& p) const noexcept {
    return {
        m_(0, 0) * p.x + m_(0, 1) * p.y + m_(0, 2),
        m_(1, 0) * p.x + m_(1, 1) * p.y + m_(1, 2)
    };
}

}  // namespace cgt
