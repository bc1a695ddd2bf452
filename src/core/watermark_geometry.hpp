/**
 * @file    watermark_geometry.hpp
 * @brief   Watermark size presets and placement
 * @license MIT
 *
 * @details
 * The watermark is always stamped in the bottom-right corner, in one of
 * two fixed presets chosen from the image dimensions alone:
 *
 *   - W > 1024 AND H > 1024: 96x96 logo, 64px from the right/bottom edges
 *   - Otherwise:             48x48 logo, 32px from the right/bottom edges
 *
 * Only one dimension exceeding 1024 still selects the small preset, and
 * 1024x1024 itself is small.
 */

#pragma once

#include <opencv2/core.hpp>

namespace wmr {

inline constexpr int kLargeThreshold = 1024;

/**
 * Watermark size mode based on image dimensions
 */
enum class WatermarkSize {
    Small,   // 48x48, 32px margin
    Large,   // 96x96, 64px margin
};

/**
 * Watermark size/margin pair
 */
struct WatermarkConfig {
    int size;     // Logo width and height (48 or 96)
    int margin;   // Distance from the right and bottom edges (32 or 64)

    bool operator==(const WatermarkConfig&) const = default;
};

inline constexpr WatermarkConfig kSmallConfig{.size = 48, .margin = 32};
inline constexpr WatermarkConfig kLargeConfig{.size = 96, .margin = 64};

/**
 * Detected geometry, for reporting without performing removal
 */
struct WatermarkInfo {
    WatermarkConfig config;
    cv::Rect position;
};

/**
 * Preset for a size mode
 */
constexpr WatermarkConfig config_for(WatermarkSize size) noexcept {
    return size == WatermarkSize::Large ? kLargeConfig : kSmallConfig;
}

/**
 * Determine watermark size mode from image dimensions
 */
WatermarkSize get_watermark_size(int image_width, int image_height) noexcept;

/**
 * Get the watermark configuration for an image size
 */
WatermarkConfig detect_config(int image_width, int image_height) noexcept;

/**
 * Watermark rectangle anchored to the bottom-right corner
 *
 * No clamping is performed: for images smaller than margin + size the
 * rectangle starts at negative coordinates, and callers skip whatever
 * falls outside the image.
 */
cv::Rect calculate_position(int image_width, int image_height,
                            const WatermarkConfig& config) noexcept;

/**
 * detect_config() and calculate_position() in one call
 */
WatermarkInfo get_watermark_info(int image_width, int image_height) noexcept;

const char* to_string(WatermarkSize size) noexcept;

}  // namespace wmr
