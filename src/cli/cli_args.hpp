/**
 * @file    cli_args.hpp
 * @brief   Parsers for command-line values
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/crop_types.hpp"

#include <optional>
#include <string_view>

namespace cgt::cli {

/**
 * "800x600" or "800X600"
 */
[[nodiscard]] std::optional<Dimension> parse_dimension(std::string_view text);

/**
 * "free", "16:9" or a plain ratio such as "1.5"
 */
[[nodiscard]] std::optional<AspectRatio> parse_aspect(std::string_view text);

/**
 * "a".."d" or "tl", "tr", "br", "bl" (case-insensitive)
 */
[[nodiscard]] std::optional<Corner> parse_corner(std::string_view text);

/**
 * "x,y"
 */
[[nodiscard]] std::optional<Point> parse_point(std::string_view text);

}  // namespace cgt::cli
