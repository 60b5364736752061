/**
 * @file    crop_formatter.hpp
 * @brief   fmt formatters for crop geometry types
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Lets spdlog and fmt print geometry values directly:
 *
 *   spdlog::debug("Crop: {}", session.crop());
 *   fmt::print("Aspect: {}\n", session.aspect());
 */

#pragma once

#include "core/crop_types.hpp"

#include <fmt/format.h>

template <>
struct fmt::formatter<cgt::CropState> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    auto format(const cgt::CropState& c, format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{center=({:.2f}, {:.2f}), size={:.2f}x{:.2f}, angle={:.2f}deg}}",
                              c.x, c.y, c.width, c.height, cgt::radians_to_degrees(c.angle));
    }
};

template <>
struct fmt::formatter<cgt::Point> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    auto format(const cgt::Point& p, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "({:.2f}, {:.2f})", p.x, p.y);
    }
};

template <>
struct fmt::formatter<cgt::AspectRatio> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    auto format(const cgt::AspectRatio& aspect, format_context& ctx) const {
        if (const auto ratio = cgt::aspect_value(aspect)) {
            return fmt::format_to(ctx.out(), "{:.4g}", *ratio);
        }
        return fmt::format_to(ctx.out(), "free");
    }
};
