/**
 * @file    tool_config.hpp
 * @brief   Tool configuration loaded from an optional JSON file
 * @license MIT
 *
 * @details
 * Example:
 *   {
 *     "suffix": "_clean",
 *     "jpeg_quality": 95,
 *     "png_compression": 6,
 *     "assets_dir": "/usr/share/watermark-remover",
 *     "log_level": "info"
 *   }
 *
 * Every key is optional. Command-line flags override file values.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace wmr {

struct ToolConfig {
    std::string suffix = "_clean";
    int jpeg_quality = 95;            // 1-100
    int png_compression = 6;          // 0-9
    std::filesystem::path assets_dir; // Empty: use embedded captures
    std::string log_level = "info";   // spdlog level name
};

/**
 * Parse configuration from JSON text
 *
 * Unknown keys are ignored, missing keys keep their defaults and
 * out-of-range integers are clamped (with a warning). Non-integer numbers
 * and unknown log level names are rejected.
 *
 * @return  Configuration, or std::nullopt on a parse or type error (logged)
 */
std::optional<ToolConfig> parse_config(const std::string& json_text);

/**
 * Load configuration from a JSON file
 *
 * @return  Configuration, or std::nullopt if the file is missing or invalid
 */
std::optional<ToolConfig> load_config(const std::filesystem::path& path);

}  // namespace wmr
