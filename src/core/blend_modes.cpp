/**
 * @file    blend_modes.cpp
 * @brief   Forward and reverse alpha blending of the watermark logo
 * @license MIT
 */

#include "core/blend_modes.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wmr {

namespace {

void check_blend_inputs(const cv::Mat& image, const AlphaMap& alpha_map) {
    if (image.depth() != CV_8U) {
        throw std::invalid_argument("Blending requires an 8-bit image");
    }
    const int channels = image.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw std::invalid_argument("Blending requires 1, 3 or 4 channels");
    }
    if (alpha_map.type() != CV_32FC1) {
        throw std::invalid_argument("Alpha map must be CV_32FC1");
    }
}

/**
 * Visit every in-bounds watermark pixel whose alpha passes the threshold.
 * fn(pixel, alpha) receives the first byte of the pixel and the raw alpha.
 */
template <typename Fn>
void for_each_watermark_pixel(cv::Mat& image, const AlphaMap& alpha_map,
                              const cv::Point& pos, Fn&& fn) {
    const int channels = image.channels();

    // Intersect the watermark rectangle with the image
    const int row_begin = std::max(0, -pos.y);
    const int row_end = std::min(alpha_map.rows, image.rows - pos.y);
    const int col_begin = std::max(0, -pos.x);
    const int col_end = std::min(alpha_map.cols, image.cols - pos.x);

    for (int row = row_begin; row < row_end; ++row) {
        const float* alpha_row = alpha_map.ptr<float>(row);
        uchar* image_row = image.ptr<uchar>(pos.y + row);

        for (int col = col_begin; col < col_end; ++col) {
            const float alpha = alpha_row[col];
            if (alpha < kAlphaThreshold) {
                continue;
            }
            fn(image_row + (pos.x + col) * channels, alpha);
        }
    }
}

}  // anonymous namespace

void remove_watermark_alpha_blend(cv::Mat& image,
                                  const AlphaMap& alpha_map,
                                  const cv::Point& pos,
                                  float logo_value) {
    check_blend_inputs(image, alpha_map);

    const int colour_channels = std::min(image.channels(), 3);

    for_each_watermark_pixel(image, alpha_map, pos, [&](uchar* px, float raw_alpha) {
        const double alpha = std::min(raw_alpha, kMaxAlpha);
        const double one_minus_alpha = 1.0 - alpha;
        const double logo = alpha * logo_value;

        for (int c = 0; c < colour_channels; ++c) {
            const double original = (static_cast<double>(px[c]) - logo) / one_minus_alpha;
            px[c] = static_cast<uchar>(clamp_value(original, 0.0, 255.0));
        }
    });
}

void add_watermark_alpha_blend(cv::Mat& image,
                               const AlphaMap& alpha_map,
                               const cv::Point& pos,
                               float logo_value) {
    check_blend_inputs(image, alpha_map);

    const int colour_channels = std::min(image.channels(), 3);

    for_each_watermark_pixel(image, alpha_map, pos, [&](uchar* px, float raw_alpha) {
        const double alpha = std::min(raw_alpha, 1.0f);
        const double logo = alpha * logo_value;

        for (int c = 0; c < colour_channels; ++c) {
            const double blended = logo + (1.0 - alpha) * static_cast<double>(px[c]);
            px[c] = static_cast<uchar>(std::lround(clamp_value(blended, 0.0, 255.0)));
        }
    });
}

}  // namespace wmr
