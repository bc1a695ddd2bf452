/**
 * @file    watermark_engine.cpp
 * @brief   Watermark Engine
 * @license MIT
 *
 * @details
 * Watermark Engine Implementation
 */

#include "core/watermark_engine.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace wmr {

namespace {

cv::Mat fit_capture(const cv::Mat& capture, int expected, const char* label) {
    if (capture.cols == expected && capture.rows == expected) {
        return capture;
    }

    spdlog::warn("{} capture is {}x{}, expected {}x{}. Resizing.",
                 label, capture.cols, capture.rows, expected, expected);
    cv::Mat resized;
    cv::resize(capture, resized, cv::Size(expected, expected), 0, 0, cv::INTER_AREA);
    return resized;
}

}  // anonymous namespace

// Helper function to initialize alpha maps
void WatermarkEngine::init_alpha_maps(const cv::Mat& bg_small, const cv::Mat& bg_large) {
    if (bg_small.empty() || bg_large.empty()) {
        throw std::invalid_argument("Empty background capture");
    }

    // alpha = max(B, G, R) / 255
    alpha_map_small_ = calculate_alpha_map(fit_capture(bg_small, kSmallConfig.size, "Small"));
    alpha_map_large_ = calculate_alpha_map(fit_capture(bg_large, kLargeConfig.size, "Large"));

    spdlog::debug("Alpha map small: {}x{}, large: {}x{}",
                  alpha_map_small_.cols, alpha_map_small_.rows,
                  alpha_map_large_.cols, alpha_map_large_.rows);

    // Log alpha statistics for debugging
    double min_val, max_val;
    cv::minMaxLoc(alpha_map_large_, &min_val, &max_val);
    spdlog::debug("Large alpha map range: {:.4f} - {:.4f}", min_val, max_val);
}

WatermarkEngine::WatermarkEngine(
    const std::filesystem::path& bg_small,
    const std::filesystem::path& bg_large,
    float logo_value)
    : logo_value_(logo_value) {

    init_alpha_maps(load_reference(bg_small), load_reference(bg_large));
    spdlog::debug("Loaded background captures from {} and {}", bg_small, bg_large);
}

WatermarkEngine::WatermarkEngine(
    const unsigned char* png_data_small, size_t png_size_small,
    const unsigned char* png_data_large, size_t png_size_large,
    float logo_value)
    : logo_value_(logo_value) {

    cv::Mat bg_small;
    cv::Mat bg_large;
    try {
        bg_small = decode_reference(png_data_small, png_size_small);
        bg_large = decode_reference(png_data_large, png_size_large);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(fmt::format("Failed to decode embedded background capture: {}",
                                             e.what()));
    }

    init_alpha_maps(bg_small, bg_large);
    spdlog::debug("Loaded embedded background captures");
}

WatermarkEngine::WatermarkEngine(
    const cv::Mat& bg_small,
    const cv::Mat& bg_large,
    float logo_value)
    : logo_value_(logo_value) {

    init_alpha_maps(bg_small, bg_large);
}

cv::Mat WatermarkEngine::prepare(
    const cv::Mat& image,
    std::optional<WatermarkSize> force_size,
    WatermarkSize& size,
    cv::Point& pos) const {
    if (image.depth() != CV_8U) {
        throw std::invalid_argument("Image must be 8-bit");
    }
    if (image.channels() != 1 && image.channels() != 3 && image.channels() != 4) {
        throw std::invalid_argument(
            fmt::format("Unsupported channel count: {}", image.channels()));
    }

    size = force_size.value_or(get_watermark_size(image.cols, image.rows));
    pos = calculate_position(image.cols, image.rows, config_for(size)).tl();

    // All work happens on a copy
    return image.clone();
}

cv::Mat WatermarkEngine::remove_watermark(
    const cv::Mat& image,
    std::optional<WatermarkSize> force_size) const {
    WatermarkSize size;
    cv::Point pos;
    cv::Mat result = prepare(image, force_size, size, pos);
    const AlphaMap& alpha_map = get_alpha_map(size);

    spdlog::debug("Removing watermark at ({}, {}) with {}x{} alpha map (size: {})",
                  pos.x, pos.y, alpha_map.cols, alpha_map.rows, to_string(size));

    // Apply reverse alpha blending
    remove_watermark_alpha_blend(result, alpha_map, pos, logo_value_);
    return result;
}

cv::Mat WatermarkEngine::add_watermark(
    const cv::Mat& image,
    std::optional<WatermarkSize> force_size) const {
    WatermarkSize size;
    cv::Point pos;
    cv::Mat result = prepare(image, force_size, size, pos);
    const AlphaMap& alpha_map = get_alpha_map(size);

    spdlog::debug("Adding watermark at ({}, {}) with {}x{} alpha map (size: {})",
                  pos.x, pos.y, alpha_map.cols, alpha_map.rows, to_string(size));

    // Apply alpha blending
    add_watermark_alpha_blend(result, alpha_map, pos, logo_value_);
    return result;
}

const AlphaMap& WatermarkEngine::get_alpha_map(WatermarkSize size) const {
    return (size == WatermarkSize::Small) ? alpha_map_small_ : alpha_map_large_;
}

ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const WatermarkEngine& engine,
    const ProcessOptions& options) {

    ProcessResult result{};

    try {
        result.format = detect_format(input_path);

        cv::Mat image = read_image(input_path);
        if (image.empty()) {
            result.message = "Failed to decode image";
            return result;
        }

        result.image_size = image.size();
        if (options.force_size) {
            const WatermarkConfig config = config_for(*options.force_size);
            result.info = WatermarkInfo{
                .config = config,
                .position = calculate_position(image.cols, image.rows, config)
            };
        } else {
            result.info = get_watermark_info(image.cols, image.rows);
        }

        spdlog::debug("Processing: {} ({}x{}, format: {})",
                      input_path.filename(), image.cols, image.rows,
                      to_string(result.format));

        cv::Mat output = options.remove
            ? engine.remove_watermark(image, options.force_size)
            : engine.add_watermark(image, options.force_size);

        // Create output directory if needed
        auto output_dir = output_path.parent_path();
        if (!output_dir.empty() && !std::filesystem::exists(output_dir)) {
            std::filesystem::create_directories(output_dir);
        }

        if (!write_image(output_path, output, result.format, options.encode)) {
            result.message = "Failed to write image";
            return result;
        }

        result.success = true;
        result.message = options.remove ? "Watermark removed" : "Watermark added";
        return result;

    } catch (const std::exception& e) {
        result.message = std::string("Error: ") + e.what();
        spdlog::error("Error processing {}: {}", input_path, e.what());
        return result;
    }
}

} // namespace wmr
