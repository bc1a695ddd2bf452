/**
 * @file    alpha_map.cpp
 * @brief   Alpha map extraction from reference watermark captures
 * @license MIT
 */

#include "core/alpha_map.hpp"
#include "core/image_io.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace wmr {

AlphaMap calculate_alpha_map(const cv::Mat& bg) {
    if (bg.empty()) {
        throw std::invalid_argument("Empty reference capture");
    }

    cv::Mat src = bg;
    if (src.depth() == CV_16U) {
        src = to_8bit(src);
    } else if (src.depth() != CV_8U) {
        throw std::invalid_argument("Reference capture must be 8-bit or 16-bit");
    }

    const int channels = src.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw std::invalid_argument("Reference capture must have 1, 3 or 4 channels");
    }

    // Only colour channels carry logo brightness
    const int colour_channels = std::min(channels, 3);

    AlphaMap alpha_map(src.rows, src.cols, CV_32FC1);

    for (int y = 0; y < src.rows; ++y) {
        const uchar* row = src.ptr<uchar>(y);
        float* out = alpha_map.ptr<float>(y);

        for (int x = 0; x < src.cols; ++x) {
            const uchar* px = row + x * channels;

            uchar max_channel = px[0];
            for (int c = 1; c < colour_channels; ++c) {
                max_channel = std::max(max_channel, px[c]);
            }

            out[x] = static_cast<float>(max_channel) / 255.0f;
        }
    }

    return alpha_map;
}

cv::Mat decode_reference(const unsigned char* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw std::runtime_error("Reference capture data is empty");
    }

    std::vector<unsigned char> buffer(data, data + size);
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::runtime_error("Failed to decode reference capture");
    }

    spdlog::debug("Decoded reference capture: {}x{}", image.cols, image.rows);
    return image;
}

cv::Mat load_reference(const std::filesystem::path& path) {
    cv::Mat image = read_image(path);
    if (image.empty()) {
        throw std::runtime_error("Failed to load reference capture: " + to_utf8(path));
    }
    return image;
}

}  // namespace wmr
