/**
 * @file    blend_modes.hpp
 * @brief   Forward and reverse alpha blending of the watermark logo
 * @license MIT
 *
 * @details
 * The watermark is applied with standard alpha compositing:
 *
 *   watermarked = alpha * logo + (1 - alpha) * original
 *
 * which is inverted to recover the original pixel:
 *
 *   original = (watermarked - alpha * logo) / (1 - alpha)
 *
 * Both directions operate in-place on 8-bit 1, 3 or 4-channel buffers.
 * Only colour channels are touched; channel 3 (opacity) is never written.
 * Watermark pixels that land outside the image are skipped.
 */

#pragma once

#include "core/alpha_map.hpp"

#include <opencv2/core.hpp>

namespace wmr {

// Alphas below this are treated as fully transparent and skipped
inline constexpr float kAlphaThreshold = 0.002f;

// Alphas are clamped to this so that (1 - alpha) never approaches zero
inline constexpr float kMaxAlpha = 0.99f;

// The logo is pure white
inline constexpr float kLogoValue = 255.0f;

/**
 * Restrict a value to [min_value, max_value]
 */
constexpr double clamp_value(double value, double min_value, double max_value) noexcept {
    if (value < min_value) return min_value;
    if (value > max_value) return max_value;
    return value;
}

/**
 * Reverse blend: remove the logo from the region at pos
 *
 * Restored values are clamped to [0, 255] and truncated on write-back.
 *
 * @param image       8-bit image (1, 3 or 4 channels), modified in-place
 * @param alpha_map   Alpha map (CV_32FC1)
 * @param pos         Top-left corner of the watermark, may be negative
 * @param logo_value  Logo brightness
 */
void remove_watermark_alpha_blend(cv::Mat& image,
                                  const AlphaMap& alpha_map,
                                  const cv::Point& pos,
                                  float logo_value = kLogoValue);

/**
 * Forward blend: stamp the logo onto the region at pos
 *
 * Composited values are rounded and clamped to [0, 255].
 */
void add_watermark_alpha_blend(cv::Mat& image,
                               const AlphaMap& alpha_map,
                               const cv::Point& pos,
                               float logo_value = kLogoValue);

}  // namespace wmr
