/**
 * @file    crop_document.cpp
 * @brief   Crop document persistence (JSON)
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/crop_document.hpp"
#include "core/crop_config.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cgt {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CropState, x, y, width, height, angle)

namespace {

using json = nlohmann::json;

json dimension_to_json(const Dimension& d) {
    return json{{"width", d.width}, {"height", d.height}};
}

Dimension dimension_from_json(const json& j) {
    return Dimension(j.at("width").get<double>(), j.at("height").get<double>());
}

bool is_positive(const Dimension& d) noexcept {
    return std::isfinite(d.width) && std::isfinite(d.height) && d.width > 0 && d.height > 0;
}

json aspect_to_json(const AspectRatio& aspect) {
    return std::visit(overloaded{
        [](const FreeAspect&) { return json("free"); },
        [](const FixedAspect& fixed) { return json(fixed.ratio); }
    }, aspect);
}

/**
 * @throws std::invalid_argument for unknown strings or invalid ratios
 */
AspectRatio aspect_from_json(const json& j) {
    if (j.is_string()) {
        const auto value = j.get<std::string>();
        if (value == "free") return FreeAspect{};
        throw std::invalid_argument("unknown aspect \"" + value + "\"");
    }
    return make_aspect(j.get<double>());
}

}  // anonymous namespace

// =============================================================================
// Serialization
// =============================================================================

std::string to_json_string(const CropDocument& doc, int indent) {
    json j;
    j["version"] = kDocumentVersion;
    j["image"] = dimension_to_json(doc.image);
    if (doc.viewport) {
        j["viewport"] = dimension_to_json(*doc.viewport);
    }
    j["aspect"] = aspect_to_json(doc.aspect);
    j["crop"] = doc.crop;
    return j.dump(indent);
}

std::optional<CropDocument> parse_crop_document(std::string_view text) {
    try {
        const json j = json::parse(text.begin(), text.end());

        const int version = j.value("version", kDocumentVersion);
        if (version > kDocumentVersion) {
            spdlog::error("[document] Unsupported version {} (max {})", version, kDocumentVersion);
            return std::nullopt;
        }

        CropDocument doc;
        doc.image = dimension_from_json(j.at("image"));
        if (j.contains("viewport")) {
            doc.viewport = dimension_from_json(j.at("viewport"));
        }
        doc.aspect = j.contains("aspect") ? aspect_from_json(j.at("aspect")) : AspectRatio{FreeAspect{}};
        doc.crop = j.at("crop").get<CropState>();

        if (!is_positive(doc.image)) {
            spdlog::error("[document] Image size {}x{} is not positive",
                          doc.image.width, doc.image.height);
            return std::nullopt;
        }
        if (doc.viewport && !is_positive(*doc.viewport)) {
            spdlog::error("[document] Viewport size {}x{} is not positive",
                          doc.viewport->width, doc.viewport->height);
            return std::nullopt;
        }
        if (!doc.crop.is_valid()) {
            spdlog::error("[document] Crop has non-positive or non-finite extents");
            return std::nullopt;
        }
        if (!matches_aspect(doc.crop, doc.aspect)) {
            spdlog::error("[document] Crop ratio {:.6f} does not match aspect {:.6f}",
                          doc.crop.aspect(), aspect_value(doc.aspect).value_or(0.0));
            return std::nullopt;
        }

        return doc;

    } catch (const json::parse_error& e) {
        spdlog::error("[document] JSON parse error: {}", e.what());
        return std::nullopt;
    } catch (const json::exception& e) {
        spdlog::error("[document] Schema error: {}", e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        spdlog::error("[document] Invalid value: {}", e.what());
        return std::nullopt;
    }
}

// =============================================================================
// Files
// =============================================================================

std::optional<CropDocument> load_crop_document(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("[document] File not found: {}", path);
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[document] Failed to open: {}", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto doc = parse_crop_document(buffer.str());
    if (doc) {
        spdlog::debug("[document] Loaded {}", path);
    } else {
        spdlog::error("[document] Rejected {}", path);
    }
    return doc;
}

bool save_crop_document(const std::filesystem::path& path, const CropDocument& doc) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("[document] Failed to create: {}", path);
            return false;
        }

        file << to_json_string(doc) << '\n';
        if (!file.good()) {
            spdlog::error("[document] Write failed: {}", path);
            return false;
        }

        spdlog::debug("[document] Saved {}", path);
        return true;

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[document] Failed to save {}: {}", path, e.what());
        return false;
    }
}

// =============================================================================
// Session bridge
// =============================================================================

std::optional<CropDocument> capture_document(const CropSession& session) {
    const auto& view = session.state().view;
    if (!view.image) {
        return std::nullopt;
    }

    CropDocument doc;
    doc.image = *view.image;
    doc.viewport = view.viewport;
    doc.aspect = session.aspect();
    doc.crop = session.crop();
    return doc;
}

bool apply_document(const CropDocument& doc, CropSession& session) {
    session.set_aspect(doc.aspect);
    if (doc.viewport && !session.set_viewport(*doc.viewport)) {
        return false;
    }
    if (!session.load_image(doc.image)) {
        return false;
    }
    session.restore(doc.crop);
    return true;
}

}  // namespace cgt
