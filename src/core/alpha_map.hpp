/**
 * @file    alpha_map.hpp
 * @brief   Alpha map extraction from reference watermark captures
 * @license MIT
 *
 * @details
 * A reference capture is the watermark logo rendered over a pure black
 * background. Because the logo is white, the brightness of every captured
 * pixel equals the logo's opacity at that pixel:
 *
 *   black (0,0,0)       -> alpha 0.0 (fully transparent)
 *   white (255,255,255) -> alpha 1.0 (fully opaque)
 *
 * max(R, G, B) is used rather than the average so that a single channel
 * carrying the logo brightness dominates slight colour fringing.
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <filesystem>
#include <vector>

namespace wmr {

/**
 * Per-pixel opacity of a reference watermark.
 *
 * CV_32FC1, continuous, row-major with a top-left origin.
 * Every value lies in [0.0, 1.0].
 */
using AlphaMap = cv::Mat;

/**
 * Extract an alpha map from a reference capture
 *
 * Output dimensions match the capture exactly; no coordinate translation
 * is applied. Alpha channels of 4-channel captures are ignored.
 * 16-bit captures are reduced to 8-bit by dropping the low byte.
 *
 * @param bg  Reference capture (1, 3 or 4 channels, 8 or 16-bit)
 * @return    Alpha map (CV_32FC1, 0.0-1.0)
 * @throws std::invalid_argument  Empty capture or unsupported depth
 */
AlphaMap calculate_alpha_map(const cv::Mat& bg);

/**
 * Decode an encoded reference capture (PNG, etc.) from memory
 *
 * @throws std::runtime_error  If the data is not a decodable image
 */
cv::Mat decode_reference(const unsigned char* data, size_t size);

/**
 * Load a reference capture from disk
 *
 * @throws std::runtime_error  If the file is missing or cannot be decoded
 */
cv::Mat load_reference(const std::filesystem::path& path);

}  // namespace wmr
