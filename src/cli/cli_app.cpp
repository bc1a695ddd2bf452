/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for Watermark Remover.
 * Accepts image files and directories (non-recursive); each cleaned image
 * is written next to its input with a suffix, or into an output directory,
 * in the same format as the input.
 */

#include "cli/cli_app.hpp"
#include "config/tool_config.hpp"
#include "core/watermark_engine.hpp"
#include "utils/file_discovery.hpp"
#include "utils/path_formatter.hpp"

#if defined(WMR_HAS_EMBEDDED_ASSETS)
#include "embedded_assets.hpp"
#endif

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace wmr::cli {

namespace {

constexpr const char* kSmallCapture = "bg_48.png";
constexpr const char* kLargeCapture = "bg_96.png";

// =============================================================================
// Engine construction
// =============================================================================

std::unique_ptr<WatermarkEngine> create_engine(const fs::path& assets_dir) {
    if (!assets_dir.empty()) {
        spdlog::debug("Loading reference captures from {}", assets_dir);
        return std::make_unique<WatermarkEngine>(assets_dir / kSmallCapture,
                                                 assets_dir / kLargeCapture);
    }

#if defined(WMR_HAS_EMBEDDED_ASSETS)
    return std::make_unique<WatermarkEngine>(
        embedded::bg_48_png, embedded::bg_48_png_size,
        embedded::bg_96_png, embedded::bg_96_png_size
    );
#else
    throw std::runtime_error(
        fmt::format("No embedded reference captures; pass --assets <dir> containing {} and {}",
                    kSmallCapture, kLargeCapture));
#endif
}

// =============================================================================
// Processing helpers
// =============================================================================

struct BatchResult {
    int success = 0;
    int failed = 0;

    void print(bool quiet) const {
        if (quiet) return;
        const int total = success + failed;
        fmt::print(success == total ? fmt::fg(fmt::color::green) : fmt::fg(fmt::color::yellow),
                   "Successfully processed {}/{} image(s)\n", success, total);
    }
};

void process_single(
    const fs::path& input,
    const fs::path& output,
    const WatermarkEngine& engine,
    const ProcessOptions& options,
    bool verbose,
    bool quiet,
    BatchResult& result
) {
    auto proc_result = process_image(input, output, engine, options);

    if (verbose && proc_result.image_size.area() > 0) {
        const auto& info = proc_result.info;
        fmt::print("Processing: {} ({}x{}, format: {})\n",
                   to_utf8(input), proc_result.image_size.width,
                   proc_result.image_size.height, to_string(proc_result.format));
        fmt::print("  Watermark: {}x{} at position ({}, {})\n",
                   info.config.size, info.config.size,
                   info.position.x, info.position.y);
    }

    if (proc_result.success) {
        result.success++;
        if (!quiet) {
            fmt::print(fmt::fg(fmt::color::green), "[OK] ");
            fmt::print("Saved: {}\n", to_utf8(output));
        }
    } else {
        result.failed++;
        fmt::print(stderr, fmt::fg(fmt::color::red), "[FAIL] ");
        fmt::print(stderr, "Error processing {}: {}\n", to_utf8(input), proc_result.message);
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

// =============================================================================
// Logging
// =============================================================================

std::shared_ptr<spdlog::logger> setup_logging(bool verbose, bool quiet, const std::string& config_level) {
    auto logger = spdlog::get("wmr");
    if (!logger) {
        logger = spdlog::stderr_color_mt("wmr");
    }
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::from_str(config_level));
    }
    return logger;
}

int run(int argc, char** argv) {
    CLI::App app{"Watermark Remover - Remove the semi-transparent corner logo "
                 "using reverse alpha blending"};
    app.footer("\nExamples:\n"
               "  watermark-remover image.png              # Writes image_clean.png\n"
               "  watermark-remover -s _nowm image.png     # Custom suffix\n"
               "  watermark-remover ./images/              # All images in a folder\n"
               "  watermark-remover -v -o out/ ./images/   # Verbose, into out/");

    app.set_version_flag("-V,--version", WMR_VERSION);

    std::vector<std::string> inputs;
    app.add_option("inputs", inputs, "Image files or directories")
        ->required();

    std::optional<std::string> suffix;
    app.add_option("-s,--suffix", suffix,
                   "Suffix appended to output filenames (default: _clean)");

    std::string output_dir;
    app.add_option("-o,--output", output_dir,
                   "Output directory (default: next to each input)");

    std::string assets_dir;
    app.add_option("--assets", assets_dir,
                   "Directory holding bg_48.png and bg_96.png reference captures");

    std::string config_path;
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);

    bool add_mode = false;
    app.add_flag("--add", add_mode, "Stamp the watermark instead of removing it");

    bool force_small = false;
    bool force_large = false;
    auto* small_flag = app.add_flag("--force-small", force_small,
                                    "Force use of 48x48 watermark regardless of image size");
    auto* large_flag = app.add_flag("--force-large", force_large,
                                    "Force use of 96x96 watermark regardless of image size");
    small_flag->excludes(large_flag);

    bool verbose = false;
    bool quiet = false;
    auto* verbose_flag = app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors")
        ->excludes(verbose_flag);

    CLI11_PARSE(app, argc, argv);

    ToolConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(path_from_utf8(config_path));
        if (!loaded) {
            fmt::print(stderr, fmt::fg(fmt::color::red),
                       "Error: invalid configuration file: {}\n", config_path);
            return 1;
        }
        config = *loaded;
    }
    if (suffix) {
        config.suffix = *suffix;
    }
    if (!assets_dir.empty()) {
        config.assets_dir = path_from_utf8(assets_dir);
    }

    setup_logging(verbose, quiet, config.log_level);

    ProcessOptions options;
    options.remove = !add_mode;
    options.encode.jpeg_quality = config.jpeg_quality;
    options.encode.png_compression = config.png_compression;
    if (force_small) {
        options.force_size = WatermarkSize::Small;
        spdlog::info("Forcing 48x48 watermark");
    } else if (force_large) {
        options.force_size = WatermarkSize::Large;
        spdlog::info("Forcing 96x96 watermark");
    }

    try {
        const auto engine = create_engine(config.assets_dir);

        std::vector<fs::path> input_paths;
        input_paths.reserve(inputs.size());
        for (const auto& arg : inputs) {
            input_paths.push_back(path_from_utf8(arg));
        }

        InputSet input_set = expand_inputs(input_paths, config.suffix);
        for (const auto& error : input_set.errors) {
            fmt::print(stderr, fmt::fg(fmt::color::red), "Error: ");
            fmt::print(stderr, "{}\n", error);
        }

        if (input_set.files.empty()) {
            return 1;
        }

        if (input_set.scanned_directory && !quiet) {
            fmt::print("Found {} image(s) to process\n", input_set.files.size());
        }

        const fs::path output_root = output_dir.empty() ? fs::path{} : path_from_utf8(output_dir);
        BatchResult result;

        for (const auto& file : input_set.files) {
            const fs::path output = resolve_output_path(file, output_root, config.suffix);
            process_single(file, output, *engine, options, verbose, quiet, result);
        }

        result.print(quiet);
        return (result.failed > 0 || !input_set.errors.empty()) ? 1 : 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace wmr::cli
