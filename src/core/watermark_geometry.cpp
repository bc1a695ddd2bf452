/**
 * @file    watermark_geometry.cpp
 * @brief   Watermark size presets and placement
 * @license MIT
 */

#include "core/watermark_geometry.hpp"

namespace wmr {

WatermarkSize get_watermark_size(int image_width, int image_height) noexcept {
    // Large only when BOTH dimensions > 1024
    if (image_width > kLargeThreshold && image_height > kLargeThreshold) {
        return WatermarkSize::Large;
    }
    return WatermarkSize::Small;
}

WatermarkConfig detect_config(int image_width, int image_height) noexcept {
    return config_for(get_watermark_size(image_width, image_height));
}

cv::Rect calculate_position(int image_width, int image_height,
                            const WatermarkConfig& config) noexcept {
    const int x = image_width - config.margin - config.size;
    const int y = image_height - config.margin - config.size;
    return cv::Rect(x, y, config.size, config.size);
}

WatermarkInfo get_watermark_info(int image_width, int image_height) noexcept {
    const WatermarkConfig config = detect_config(image_width, image_height);
    return WatermarkInfo{
        .config = config,
        .position = calculate_position(image_width, image_height, config)
    };
}

const char* to_string(WatermarkSize size) noexcept {
    return size == WatermarkSize::Small ? "Small" : "Large";
}

}  // namespace wmr
