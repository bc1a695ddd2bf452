/**
 * @file    path_formatter.hpp
 * @brief   Custom fmt formatter for std::filesystem::path with UTF-8 support
 * @license MIT
 *
 * @details
 * path.string() is not guaranteed to be UTF-8 (Windows returns the ANSI
 * code page), while spdlog/fmt expect UTF-8. path.u8string() always is:
 *   - C++20: returns std::u8string (char8_t), needs a reinterpret_cast
 *   - C++17: returns std::string
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Processing: {}", some_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace wmr {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Convert path filename to UTF-8 encoded std::string
 */
inline std::string filename_utf8(const std::filesystem::path& path) {
    return to_utf8(path.filename());
}

/**
 * Convert UTF-8 string (e.g. a command-line argument) to filesystem path
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8_str) {
    return std::filesystem::path(
        std::u8string(reinterpret_cast<const char8_t*>(utf8_str.data()), utf8_str.size()));
}

}  // namespace wmr

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
