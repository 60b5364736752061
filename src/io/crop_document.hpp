/**
 * @file    crop_document.hpp
 * @brief   Crop document persistence (JSON)
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * A crop document stores everything needed to restore a crop session:
 *
 *   {
 *     "version":  1,
 *     "image":    {"width": 1000, "height": 500},
 *     "viewport": {"width": 800, "height": 600},    // optional
 *     "aspect":   "free" | 1.5,
 *     "crop":     {"x": 500, "y": 250, "width": 1000, "height": 500, "angle": 0}
 *   }
 */

#pragma once

#include "core/crop_session.hpp"
#include "core/crop_types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cgt {

struct CropDocument {
    Dimension image;
    std::optional<Dimension> viewport;
    AspectRatio aspect{FreeAspect{}};
    CropState crop;
};

// =============================================================================
// Serialization
// =============================================================================

/**
 * Serialize to JSON text
 * @param indent  Spaces per level, -1 for compact output
 */
[[nodiscard]] std::string to_json_string(const CropDocument& doc, int indent = 2);

/**
 * Parse JSON text. Errors are logged.
 * @return  The document, or nullopt on syntax, schema or value errors
 */
[[nodiscard]] std::optional<CropDocument> parse_crop_document(std::string_view text);

// =============================================================================
// Files
// =============================================================================

[[nodiscard]] std::optional<CropDocument> load_crop_document(const std::filesystem::path& path);

/**
 * Write the document, creating parent directories as needed
 * @return  true on success
 */
bool save_crop_document(const std::filesystem::path& path, const CropDocument& doc);

// =============================================================================
// Session bridge
// =============================================================================

/**
 * Snapshot a session. Returns nullopt until an image is loaded.
 */
[[nodiscard]] std::optional<CropDocument> capture_document(const CropSession& session);

/**
 * Load image, viewport, aspect and crop from a document into a session
 * @return  false if the document's image size is rejected
 */
bool apply_document(const CropDocument& doc, CropSession& session);

}  // namespace cgt
