/**
 * @file    watermark_engine.hpp
 * @brief   Watermark Engine
 * @license MIT
 *
 * @details
 * Holds the alpha maps computed once from the two reference captures and
 * applies reverse alpha blending to the watermark region of each image.
 *
 * Math:
 *   The logo is added as:  result = alpha * logo + (1 - alpha) * original
 *   To remove it:          original = (result - alpha * 255) / (1 - alpha)
 *
 * The engine is immutable after construction. One instance can be shared
 * by any number of threads, each processing its own image.
 */

#pragma once

#include "core/alpha_map.hpp"
#include "core/image_io.hpp"
#include "core/watermark_geometry.hpp"
#include "core/blend_modes.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace wmr {

/**
 * Main watermark engine class
 */
class WatermarkEngine {
public:
    /**
     * Initialize the engine with reference captures from files
     *
     * @param bg_small    Path to the 48x48 capture
     * @param bg_large    Path to the 96x96 capture
     * @param logo_value  The logo brightness (default: 255.0 = white)
     * @throws std::runtime_error  If either capture cannot be decoded
     */
    WatermarkEngine(
        const std::filesystem::path& bg_small,
        const std::filesystem::path& bg_large,
        float logo_value = kLogoValue
    );

    /**
     * Initialize the engine with encoded captures held in memory
     * (embedded assets)
     *
     * @throws std::runtime_error  If either capture cannot be decoded
     */
    WatermarkEngine(
        const unsigned char* png_data_small, size_t png_size_small,
        const unsigned char* png_data_large, size_t png_size_large,
        float logo_value = kLogoValue
    );

    /**
     * Initialize the engine with already decoded captures
     *
     * Captures that are not 48x48 / 96x96 are resized.
     *
     * @throws std::invalid_argument  If either capture is empty
     */
    WatermarkEngine(
        const cv::Mat& bg_small,
        const cv::Mat& bg_large,
        float logo_value = kLogoValue
    );

    /**
     * Remove the watermark from a copy of the image
     *
     * Everything outside the watermark rectangle, and the opacity channel
     * everywhere, is bit-identical to the input.
     *
     * @param image       8-bit image with 1, 3 or 4 channels (not modified)
     * @param force_size  Force a specific watermark size (auto-detect if nullopt)
     * @return            The restored image
     * @throws std::invalid_argument  Unsupported depth or channel count
     */
    [[nodiscard]] cv::Mat remove_watermark(
        const cv::Mat& image,
        std::optional<WatermarkSize> force_size = std::nullopt
    ) const;

    /**
     * Stamp the watermark onto a copy of the image
     */
    [[nodiscard]] cv::Mat add_watermark(
        const cv::Mat& image,
        std::optional<WatermarkSize> force_size = std::nullopt
    ) const;

    /**
     * Get the alpha map for a specific size
     */
    const AlphaMap& get_alpha_map(WatermarkSize size) const;

    float logo_value() const noexcept { return logo_value_; }

private:
    AlphaMap alpha_map_small_;   // 48x48 alpha map (CV_32FC1, 0.0-1.0)
    AlphaMap alpha_map_large_;   // 96x96 alpha map (CV_32FC1, 0.0-1.0)
    float logo_value_;           // Logo brightness (255 = white)

    // Helper to initialize alpha maps from decoded captures
    void init_alpha_maps(const cv::Mat& bg_small, const cv::Mat& bg_large);

    // Copy the image and locate the watermark for it
    cv::Mat prepare(const cv::Mat& image,
                    std::optional<WatermarkSize> force_size,
                    WatermarkSize& size,
                    cv::Point& pos) const;
};

/**
 * Options for processing a single file
 */
struct ProcessOptions {
    bool remove = true;                          // Remove (true) or add (false)
    std::optional<WatermarkSize> force_size;     // Auto-detect if nullopt
    EncodeOptions encode;
};

/**
 * Result of processing an image
 */
struct ProcessResult {
    bool success = false;        // Whether processing succeeded
    std::string message;         // Status message
    ImageFormat format = ImageFormat::Unknown;
    cv::Size image_size;
    WatermarkInfo info{};        // Geometry used
};

/**
 * Process a single image file
 *
 * The output is encoded in the same format as the input. Failures are
 * reported in the result, never thrown.
 *
 * @param input_path   Input image path
 * @param output_path  Output image path
 * @param engine       The watermark engine to use
 * @param options      Processing options
 * @return             Processing result
 */
ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const WatermarkEngine& engine,
    const ProcessOptions& options = {}
);

} // namespace wmr
