/**
 * @file    crop_types.hpp
 * @brief   Crop Geometry Value Types
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Plain value types exchanged between the geometry engine and its callers.
 * Every edit produces a new value; nothing here holds shared state.
 */

#pragma once

#include "core/affine2d.hpp"
#include "core/crop_math.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>

namespace cgt {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * Preferred way to bring a crop back inside the image
 */
enum class Transformation {
    Translate,  // Move the crop, keep its size
    Scale       // Resize the crop from the offending corner
};

[[nodiscard]] constexpr std::string_view to_string(Transformation t) noexcept {
    switch (t) {
        case Transformation::Translate: return "Translate";
        case Transformation::Scale:     return "Scale";
    }
    return "Unknown";
}

/**
 * Crop corners in clockwise order, named by their position before rotation.
 * A/C and B/D are the two diagonals.
 */
enum class Corner : std::size_t {
    A = 0,  // Top left
    B = 1,  // Top right
    C = 2,  // Bottom right
    D = 3   // Bottom left
};

inline constexpr std::array<Corner, 4> kAllCorners{Corner::A, Corner::B, Corner::C, Corner::D};

[[nodiscard]] constexpr std::string_view to_string(Corner c) noexcept {
    switch (c) {
        case Corner::A: return "A (top-left)";
        case Corner::B: return "B (top-right)";
        case Corner::C: return "C (bottom-right)";
        case Corner::D: return "D (bottom-left)";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::size_t index_of(Corner c) noexcept {
    return static_cast<std::size_t>(c);
}

// =============================================================================
// Aspect ratio
// =============================================================================

struct FreeAspect {
    constexpr bool operator==(const FreeAspect&) const noexcept = default;
};

struct FixedAspect {
    double ratio{1.0};  // width / height

    constexpr bool operator==(const FixedAspect&) const noexcept = default;
};

using AspectRatio = std::variant<FreeAspect, FixedAspect>;

/**
 * Create a fixed aspect ratio
 * @throws std::invalid_argument if ratio is not finite or not positive
 */
[[nodiscard]] AspectRatio make_aspect(double ratio);

/**
 * Fixed ratio value, or nullopt for free-form
 */
[[nodiscard]] std::optional<double> aspect_value(const AspectRatio& aspect) noexcept;

[[nodiscard]] inline bool is_free(const AspectRatio& aspect) noexcept {
    return std::holds_alternative<FreeAspect>(aspect);
}

// Visitor helper for AspectRatio
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// =============================================================================
// Geometry
// =============================================================================

/**
 * Crop rectangle in image pixels.
 * (x, y) is the center, angle is in radians.
 */
struct CropState {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
    double angle{0.0};

    [[nodiscard]] Point center() const noexcept { return {x, y}; }
    [[nodiscard]] Dimension size() const noexcept { return {width, height}; }

    [[nodiscard]] double aspect() const noexcept {
        return height != 0.0 ? width / height : 0.0;
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(angle) &&
               std::isfinite(width) && std::isfinite(height) &&
               width > 0.0 && height > 0.0;
    }

    bool operator==(const CropState&) const noexcept = default;
};

/**
 * True if the crop's width / height agrees with a fixed ratio (always true
 * for free-form)
 */
[[nodiscard]] bool matches_aspect(const CropState& crop, const AspectRatio& aspect) noexcept;

/**
 * Largest crop of the given ratio inside crop, sharing its center and angle.
 * Crops that already match are returned unchanged.
 */
[[nodiscard]] CropState conform_to_aspect(const CropState& crop, const AspectRatio& aspect) noexcept;

/**
 * Four crop corners indexed by Corner
 */
using Corners = std::array<Point, 4>;

[[nodiscard]] inline const Point& corner_at(const Corners& corners, Corner c) noexcept {
    return corners[index_of(c)];
}

/**
 * Displacement needed to pull a point into the image
 */
struct Shift {
    double dx{0.0};
    double dy{0.0};

    [[nodiscard]] bool is_zero() const noexcept { return dx == 0.0 && dy == 0.0; }

    bool operator==(const Shift&) const noexcept = default;
};

/**
 * Image <-> view mapping for display
 */
struct ViewState {
    Affine2D transform;
    std::optional<Dimension> viewport;  // Display surface size in view pixels
    std::optional<Dimension> image;     // Natural image size, known after load

    [[nodiscard]] bool is_ready() const noexcept {
        return viewport.has_value() && image.has_value() &&
               viewport->width > 0 && viewport->height > 0 &&
               image->width > 0 && image->height > 0;
    }
};

}  // namespace cgt
