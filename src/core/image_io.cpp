/**
 * @file    image_io.cpp
 * @brief   Format-preserving image decode/encode
 * @license MIT
 */

#include "core/image_io.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace wmr {

namespace {

bool starts_with(const std::vector<unsigned char>& data,
                 const unsigned char* prefix, size_t size, size_t offset = 0) {
    if (data.size() < offset + size) {
        return false;
    }
    return std::memcmp(data.data() + offset, prefix, size) == 0;
}

std::vector<int> encode_params(ImageFormat format, const EncodeOptions& options) {
    switch (format) {
        case ImageFormat::Jpeg:
            return {cv::IMWRITE_JPEG_QUALITY, options.jpeg_quality};
        case ImageFormat::WebP:
            return {cv::IMWRITE_WEBP_QUALITY, 101};  // > 100 selects lossless
        case ImageFormat::Bmp:
            return {};
        case ImageFormat::Png:
        case ImageFormat::Unknown:
            break;
    }
    return {cv::IMWRITE_PNG_COMPRESSION, options.png_compression};
}

}  // anonymous namespace

const char* to_string(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Png:     return "png";
        case ImageFormat::Jpeg:    return "jpeg";
        case ImageFormat::WebP:    return "webp";
        case ImageFormat::Bmp:     return "bmp";
        case ImageFormat::Unknown: return "unknown";
    }
    return "unknown";
}

const char* extension_for(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg: return ".jpg";
        case ImageFormat::WebP: return ".webp";
        case ImageFormat::Bmp:  return ".bmp";
        case ImageFormat::Png:
        case ImageFormat::Unknown:
            break;
    }
    return ".png";
}

ImageFormat detect_format(const std::vector<unsigned char>& header) {
    static constexpr unsigned char kPng[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    static constexpr unsigned char kJpeg[] = {0xFF, 0xD8, 0xFF};
    static constexpr unsigned char kRiff[] = {'R', 'I', 'F', 'F'};
    static constexpr unsigned char kWebp[] = {'W', 'E', 'B', 'P'};
    static constexpr unsigned char kBmp[] = {'B', 'M'};

    if (starts_with(header, kPng, sizeof(kPng))) return ImageFormat::Png;
    if (starts_with(header, kJpeg, sizeof(kJpeg))) return ImageFormat::Jpeg;
    if (starts_with(header, kRiff, sizeof(kRiff)) &&
        starts_with(header, kWebp, sizeof(kWebp), 8)) {
        return ImageFormat::WebP;
    }
    if (starts_with(header, kBmp, sizeof(kBmp))) return ImageFormat::Bmp;
    return ImageFormat::Unknown;
}

ImageFormat detect_format(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::debug("[detect_format] Cannot open: {}", path);
        return ImageFormat::Unknown;
    }

    std::vector<unsigned char> header(12);
    file.read(reinterpret_cast<char*>(header.data()),
              static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(file.gcount()));
    return detect_format(header);
}

cv::Mat to_8bit(const cv::Mat& image) {
    if (image.depth() != CV_16U) {
        return image;
    }

    cv::Mat result(image.size(), CV_MAKETYPE(CV_8U, image.channels()));
    const int values_per_row = image.cols * image.channels();

    for (int y = 0; y < image.rows; ++y) {
        const uint16_t* src = image.ptr<uint16_t>(y);
        uchar* dst = result.ptr<uchar>(y);
        for (int i = 0; i < values_per_row; ++i) {
            dst[i] = static_cast<uchar>(src[i] >> 8);
        }
    }
    return result;
}

cv::Mat read_image(const std::filesystem::path& path) {
    spdlog::debug("[read_image] Reading: {}", path);

    // Read as binary and decode so non-ASCII paths work everywhere
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        spdlog::error("[read_image] Failed to open file: {}", path);
        return cv::Mat();
    }

    const auto size = file.tellg();
    if (size <= 0) {
        spdlog::error("[read_image] Invalid file size: {}", static_cast<long long>(size));
        return cv::Mat();
    }
    file.seekg(0, std::ios::beg);

    std::vector<uchar> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        spdlog::error("[read_image] Failed to read file data: {}", path);
        return cv::Mat();
    }

    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        spdlog::error("[read_image] Decode failed for: {}", path);
        return image;
    }

    spdlog::debug("[read_image] Decoded image: {}x{}, {} channel(s)",
                  image.cols, image.rows, image.channels());
    return to_8bit(image);
}

bool write_image(const std::filesystem::path& path,
                 const cv::Mat& image,
                 ImageFormat format,
                 const EncodeOptions& options) {
    spdlog::debug("[write_image] Writing: {} ({}x{}, {})",
                  path, image.cols, image.rows, to_string(format));

    cv::Mat output = image;
    if ((format == ImageFormat::Jpeg || format == ImageFormat::Bmp) && image.channels() == 4) {
        cv::cvtColor(image, output, cv::COLOR_BGRA2BGR);
    }

    std::vector<uchar> buffer;
    try {
        if (!cv::imencode(extension_for(format), output, buffer,
                          encode_params(format, options))) {
            spdlog::error("[write_image] Encode failed for: {}", path);
            return false;
        }
    } catch (const cv::Exception& e) {
        spdlog::error("[write_image] Encode failed for {}: {}", path, e.what());
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("[write_image] Failed to create file: {}", path);
        return false;
    }

    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    if (!file.good()) {
        spdlog::error("[write_image] Write failed for: {}", path);
        return false;
    }

    spdlog::debug("[write_image] Wrote {} bytes", buffer.size());
    return true;
}

}  // namespace wmr
