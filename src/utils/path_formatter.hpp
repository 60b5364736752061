/**
 * @file    path_formatter.hpp
 * @brief   Custom fmt formatter for std::filesystem::path with UTF-8 support
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * On Windows path.string() returns the local ANSI codepage while fmt and
 * spdlog expect UTF-8. u8string() is UTF-8 everywhere, but returns
 * std::u8string under C++20, hence the reinterpret_cast.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved: {}", some_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace cgt {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Convert a UTF-8 string (e.g. a command-line argument) to a path
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8_str) {
    return std::filesystem::path(
        std::u8string(reinterpret_cast<const char8_t*>(utf8_str.data()), utf8_str.size()));
}

}  // namespace cgt

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
