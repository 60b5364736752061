/**
 * @file    crop_math.cpp
 * @brief   Scalar helpers implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/crop_math.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace cgt {

double clamp(double a, double min, double max) {
    if (min > max) {
        throw std::invalid_argument(
            fmt::format("clamp: min ({}) is greater than max ({})", min, max));
    }
    return std::min(std::max(a, min), max);
}

double max_magnitude(std::initializer_list<double> values) noexcept {
    if (values.size() == 0) return 0.0;

    auto it = values.begin();
    double best = *it;
    for (++it; it != values.end(); ++it) {
        if (std::abs(*it) > std::abs(best)) {
            best = *it;
        }
    }
    return best;
}

bool approx_equal(double a, double b) noexcept {
    return std::abs(a - b) <
           std::abs(max_magnitude(a, b)) * std::numeric_limits<double>::epsilon();
}

}  // namespace cgt
