/**
 * @file    image_probe.hpp
 * @brief   Read the natural pixel size of an image file
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/crop_math.hpp"

#include <filesystem>
#include <optional>

namespace cgt {

/**
 * Decode an image and return its size in pixels.
 * Handles UTF-8 paths on Windows.
 *
 * @param path  Image file
 * @return      Width and height, or nullopt if the file cannot be decoded
 */
[[nodiscard]] std::optional<Dimension> probe_image_size(const std::filesystem::path& path);

}  // namespace cgt
