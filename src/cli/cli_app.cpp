/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Command-line front end for the crop geometry engine.
 * Builds a crop session from an image (or a size), applies rotation,
 * corner drag and pan in that order, then prints or saves the result.
 */

// Must be defined before any Windows headers
#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

#include "cli/cli_app.hpp"
#include "cli/cli_args.hpp"
#include "core/crop_projection.hpp"
#include "core/crop_session.hpp"
#include "io/crop_document.hpp"
#include "io/image_probe.hpp"
#include "utils/crop_formatter.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace cgt::cli {

namespace {

// =============================================================================
// Options
// =============================================================================

struct Options {
    std::string image_path;
    std::string size;
    std::string viewport{"800x600"};
    std::string aspect;
    double angle_deg = 0.0;
    bool rotate = false;
    std::vector<std::string> drag;
    std::string pan;
    std::string load_path;
    std::string save_path;
    bool json = false;
    bool verbose = false;
    bool quiet = false;
};

void configure_logging(const Options& opts) {
    // stderr keeps --json output on stdout clean
    auto logger = spdlog::stderr_color_mt("cgt");
    spdlog::set_default_logger(logger);

    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

void print_error(const std::string& message) {
    fmt::print(stderr, fmt::fg(fmt::color::red), "[ERROR] ");
    fmt::print(stderr, "{}\n", message);
}

// =============================================================================
// Session setup
// =============================================================================

std::optional<Dimension> resolve_image_size(const Options& opts) {
    if (!opts.image_path.empty()) {
        const fs::path path = path_from_utf8(opts.image_path);
        auto size = probe_image_size(path);
        if (!size) {
            print_error(fmt::format("Cannot read image size from {}", path));
        }
        return size;
    }

    auto size = parse_dimension(opts.size);
    if (!size) {
        print_error(fmt::format("Invalid --size \"{}\", expected WIDTHxHEIGHT", opts.size));
    }
    return size;
}

bool setup_session(const Options& opts, CropSession& session) {
    std::optional<AspectRatio> aspect;
    if (!opts.aspect.empty()) {
        aspect = parse_aspect(opts.aspect);
        if (!aspect) {
            print_error(fmt::format("Invalid --aspect \"{}\", expected free, W:H or a ratio",
                                    opts.aspect));
            return false;
        }
    }

    if (!opts.load_path.empty()) {
        auto doc = load_crop_document(path_from_utf8(opts.load_path));
        if (!doc) {
            print_error(fmt::format("Cannot load crop document {}", opts.load_path));
            return false;
        }
        if (!doc->viewport) {
            doc->viewport = parse_dimension(opts.viewport);
        }
        if (!apply_document(*doc, session)) {
            print_error("Crop document has an invalid image or viewport size");
            return false;
        }
        spdlog::info("Loaded crop {} from {}", session.crop(), opts.load_path);
    } else {
        auto viewport = parse_dimension(opts.viewport);
        if (!viewport) {
            print_error(fmt::format("Invalid --viewport \"{}\", expected WIDTHxHEIGHT", opts.viewport));
            return false;
        }

        auto image = resolve_image_size(opts);
        if (!image) return false;

        if (aspect) session.set_aspect(*aspect);
        session.set_viewport(*viewport);
        if (!session.load_image(*image)) {
            print_error(fmt::format("Image size {}x{} is not usable", image->width, image->height));
            return false;
        }
        spdlog::info("Image {}x{}, viewport {}x{}",
                     image->width, image->height, viewport->width, viewport->height);
        return true;
    }

    // A document was loaded: an explicit aspect overrides it
    if (aspect) session.set_aspect(*aspect);
    return true;
}

// =============================================================================
// Gestures
// =============================================================================

bool apply_gestures(const Options& opts, CropSession& session) {
    if (opts.rotate) {
        session.set_rotation(degrees_to_radians(opts.angle_deg));
        spdlog::info("Rotated to {:.2f} deg", opts.angle_deg);
    }

    if (!opts.drag.empty()) {
        auto corner = parse_corner(opts.drag[0]);
        auto target = opts.drag.size() > 1 ? parse_point(opts.drag[1]) : std::nullopt;
        if (!corner || !target) {
            print_error("Invalid --drag, expected CORNER X,Y (corner: a|b|c|d|tl|tr|br|bl)");
            return false;
        }
        session.drag_corner(*corner, *target);
        session.commit();
        spdlog::info("Dragged corner {} to {}", to_string(*corner), *target);
    }

    if (!opts.pan.empty()) {
        auto delta = parse_point(opts.pan);
        if (!delta) {
            print_error(fmt::format("Invalid --pan \"{}\", expected DX,DY", opts.pan));
            return false;
        }
        session.pan(*delta);
        spdlog::info("Panned by {}", *delta);
    }
    return true;
}

// =============================================================================
// Output
// =============================================================================

void print_summary(const CropSession& session) {
    const auto& state = session.state();
    const CropState& crop = state.crop;

    fmt::print(fmt::fg(fmt::color::cyan), "Crop Geometry Tool");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n\n", CGT_VERSION);

    if (state.view.image) {
        fmt::print("  Image     : {}x{}\n", state.view.image->width, state.view.image->height);
    }
    if (state.view.viewport) {
        fmt::print("  Viewport  : {}x{}\n", state.view.viewport->width, state.view.viewport->height);
    }
    fmt::print("  Aspect    : {}\n", state.aspect);

    fmt::print(fmt::fg(fmt::color::green), "  Crop      : ");
    fmt::print("{}\n", crop);

    const Corners corners = get_corners(crop);
    const Corners handles = session.handle_positions();
    fmt::print("\n  Corner              Image                 View\n");
    for (Corner c : kAllCorners) {
        const std::string image_pt = fmt::format("{}", corner_at(corners, c));
        const std::string view_pt = fmt::format("{}", corner_at(handles, c));
        fmt::print("  {:<18}  {:<20}  {}\n", to_string(c), image_pt, view_pt);
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    CLI::App app{"Crop Geometry Tool - fit rotated crop rectangles inside an image"};
    app.footer("\nGestures are applied in order: --angle, --drag, --pan");

    app.set_version_flag("-V,--version", CGT_VERSION);

    Options opts;

    // Source
    auto* image_opt = app.add_option("-i,--image", opts.image_path, "Image file to read the size from");
    auto* size_opt = app.add_option("-s,--size", opts.size, "Image size as WIDTHxHEIGHT");
    auto* load_opt = app.add_option("-l,--load", opts.load_path, "Crop document to start from");
    image_opt->excludes(size_opt)->excludes(load_opt);
    size_opt->excludes(load_opt);

    app.add_option("--viewport", opts.viewport, "Viewport size as WIDTHxHEIGHT")
        ->capture_default_str();
    app.add_option("-a,--aspect", opts.aspect, "Aspect ratio: free, W:H or a number");

    // Gestures
    auto* angle_opt = app.add_option("--angle", opts.angle_deg, "Crop rotation in degrees");
    app.add_option("--drag", opts.drag, "Drag a corner: CORNER X,Y (view coordinates)")
        ->expected(2);
    app.add_option("--pan", opts.pan, "Pan the image under the crop: DX,DY (view pixels)");

    // Output
    app.add_option("-o,--save", opts.save_path, "Write the resulting crop document");
    app.add_flag("--json", opts.json, "Print the crop document as JSON");

    // Verbosity
    app.add_flag("-v,--verbose", opts.verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", opts.quiet, "Suppress all output except errors");

    CLI11_PARSE(app, argc, argv);

    opts.rotate = angle_opt->count() > 0;
    configure_logging(opts);

    if (opts.image_path.empty() && opts.size.empty() && opts.load_path.empty()) {
        print_error("One of --image, --size or --load is required");
        fmt::print("{}", app.help());
        return 1;
    }

    try {
        CropSession session;

        if (!setup_session(opts, session)) return 1;
        if (!apply_gestures(opts, session)) return 1;

        auto doc = capture_document(session);
        if (!doc) {
            print_error("No image loaded");
            return 1;
        }

        if (!opts.save_path.empty()) {
            const fs::path out = path_from_utf8(opts.save_path);
            if (!save_crop_document(out, *doc)) {
                print_error(fmt::format("Failed to write {}", out));
                return 1;
            }
            spdlog::info("Saved: {}", out);
        }

        if (opts.json) {
            fmt::print("{}\n", to_json_string(*doc));
        } else if (!opts.quiet) {
            print_summary(session);
        }

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace cgt::cli
