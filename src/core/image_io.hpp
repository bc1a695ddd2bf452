/**
 * @file    image_io.hpp
 * @brief   Format-preserving image decode/encode
 * @license MIT
 *
 * @details
 * Images are decoded with their alpha channel intact and written back in
 * the format they were read from: a PNG stays a lossless PNG, a JPEG stays
 * a JPEG. The format is taken from the file signature rather than the
 * extension so a mislabelled file still round-trips correctly.
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace wmr {

enum class ImageFormat {
    Png,
    Jpeg,
    WebP,
    Bmp,
    Unknown
};

/**
 * Encoder settings
 */
struct EncodeOptions {
    int jpeg_quality = 95;      // 1-100
    int png_compression = 6;    // 0-9
};

const char* to_string(ImageFormat format) noexcept;

/**
 * File extension (with leading dot) used for a format; PNG for Unknown
 */
const char* extension_for(ImageFormat format) noexcept;

/**
 * Identify an encoded image from its leading bytes
 */
ImageFormat detect_format(const std::vector<unsigned char>& header);

/**
 * Identify an image file from its leading bytes
 *
 * @return  ImageFormat::Unknown if the file cannot be read
 */
ImageFormat detect_format(const std::filesystem::path& path);

/**
 * Reduce a 16-bit image to 8-bit by dropping the low byte
 * 8-bit images are returned as-is.
 */
cv::Mat to_8bit(const cv::Mat& image);

/**
 * Read an image keeping its alpha channel
 *
 * 16-bit images are reduced to 8-bit.
 *
 * @return  Decoded image, or an empty Mat on failure (logged)
 */
cv::Mat read_image(const std::filesystem::path& path);

/**
 * Write an image in the given format
 *
 * Formats without an alpha channel (JPEG, BMP) drop it before encoding.
 * Unknown formats are encoded as PNG.
 *
 * @return  true on success, false on failure (logged)
 */
bool write_image(const std::filesystem::path& path,
                 const cv::Mat& image,
                 ImageFormat format,
                 const EncodeOptions& options = {});

}  // namespace wmr
