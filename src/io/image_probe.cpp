/**
 * @file    image_probe.cpp
 * @brief   Read the natural pixel size of an image file
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/image_probe.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace cgt {

namespace {

cv::Mat read_image(const std::filesystem::path& path) {
#ifdef _WIN32
    // imread() uses the ANSI codepage on Windows: read bytes and decode
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        spdlog::error("[probe] Failed to open file: {}", path);
        return cv::Mat();
    }

    auto size = file.tellg();
    if (size <= 0) {
        spdlog::error("[probe] Invalid file size: {}", static_cast<long long>(size));
        return cv::Mat();
    }

    file.seekg(0, std::ios::beg);
    std::vector<uchar> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        spdlog::error("[probe] Failed to read file data: {}", path);
        return cv::Mat();
    }

    return cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
#else
    return cv::imread(path.string(), cv::IMREAD_UNCHANGED);
#endif
}

}  // anonymous namespace

std::optional<Dimension> probe_image_size(const std::filesystem::path& path) {
    spdlog::debug("[probe] Reading: {}", path);

    if (!std::filesystem::exists(path)) {
        spdlog::error("[probe] File not found: {}", path);
        return std::nullopt;
    }

    try {
        cv::Mat image = read_image(path);
        if (image.empty()) {
            spdlog::error("[probe] Failed to decode image: {}", path);
            return std::nullopt;
        }

        spdlog::debug("[probe] {} is {}x{}", path.filename(), image.cols, image.rows);
        return Dimension(image.cols, image.rows);
    } catch (const cv::Exception& e) {
        spdlog::error("[probe] OpenCV error reading {}: {}", path, e.what());
        return std::nullopt;
    }
}

}  // namespace cgt
