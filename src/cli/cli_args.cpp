/**
 * @file    cli_args.cpp
 * @brief   Parsers for command-line values
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "cli/cli_args.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <utility>

namespace cgt::cli {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<double> parse_double(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    if (text.front() == '+') text.remove_prefix(1);

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/**
 * Split "a<sep>b" into two numbers
 */
std::optional<std::pair<double, double>> parse_pair(std::string_view text, std::string_view seps) {
    const auto pos = text.find_first_of(seps);
    if (pos == std::string_view::npos) return std::nullopt;

    auto first = parse_double(text.substr(0, pos));
    auto second = parse_double(text.substr(pos + 1));
    if (!first || !second) return std::nullopt;
    return std::make_pair(*first, *second);
}

}  // anonymous namespace

std::optional<Dimension> parse_dimension(std::string_view text) {
    auto pair = parse_pair(trim(text), "xX");
    if (!pair || pair->first <= 0.0 || pair->second <= 0.0) {
        return std::nullopt;
    }
    return Dimension(pair->first, pair->second);
}

std::optional<AspectRatio> parse_aspect(std::string_view text) {
    text = trim(text);
    if (to_lower(text) == "free") {
        return AspectRatio{FreeAspect{}};
    }

    double ratio = 0.0;
    if (text.find(':') != std::string_view::npos) {
        auto pair = parse_pair(text, ":");
        if (!pair || pair->second == 0.0) return std::nullopt;
        ratio = pair->first / pair->second;
    } else {
        auto value = parse_double(text);
        if (!value) return std::nullopt;
        ratio = *value;
    }

    if (!std::isfinite(ratio) || ratio <= 0.0) {
        return std::nullopt;
    }
    return AspectRatio{FixedAspect{ratio}};
}

std::optional<Corner> parse_corner(std::string_view text) {
    const std::string name = to_lower(trim(text));
    if (name == "a" || name == "tl") return Corner::A;
    if (name == "b" || name == "tr") return Corner::B;
    if (name == "c" || name == "br") return Corner::C;
    if (name == "d" || name == "bl") return Corner::D;
    return std::nullopt;
}

std::optional<Point> parse_point(std::string_view text) {
    auto pair = parse_pair(trim(text), ",");
    if (!pair) return std::nullopt;
    return Point(pair->first, pair->second);
}

}  // namespace cgt::cli
