/**
 * @file    tool_config.cpp
 * @brief   Tool configuration - JSON loading
 * @license MIT
 */

#include "config/tool_config.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace wmr {

namespace {

std::optional<int> clamped_int(const nlohmann::json& j, const char* key, int current,
                               int lo, int hi) {
    if (!j.contains(key)) {
        return current;
    }

    const nlohmann::json& node = j.at(key);
    if (!node.is_number_integer()) {
        spdlog::error("[config] {} must be an integer, got {}", key, node.dump());
        return std::nullopt;
    }

    // Unsigned values above INT64_MAX saturate instead of wrapping
    const std::int64_t value = node.is_number_unsigned() &&
                                       node.get<std::uint64_t>() >
                                           static_cast<std::uint64_t>(INT64_MAX)
                                   ? INT64_MAX
                                   : node.get<std::int64_t>();
    const std::int64_t clamped = std::clamp<std::int64_t>(value, lo, hi);
    if (clamped != value) {
        spdlog::warn("[config] {}={} out of range [{}, {}], using {}",
                     key, node.dump(), lo, hi, clamped);
    }
    return static_cast<int>(clamped);
}

bool is_known_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

}  // anonymous namespace

std::optional<ToolConfig> parse_config(const std::string& json_text) {
    try {
        const nlohmann::json j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            spdlog::error("[config] Top-level JSON value must be an object");
            return std::nullopt;
        }

        ToolConfig config;
        if (j.contains("suffix")) {
            config.suffix = j.at("suffix").get<std::string>();
        }
        if (j.contains("assets_dir")) {
            config.assets_dir = path_from_utf8(j.at("assets_dir").get<std::string>());
        }
        if (j.contains("log_level")) {
            config.log_level = j.at("log_level").get<std::string>();
            if (!is_known_log_level(config.log_level)) {
                spdlog::error("[config] Unknown log_level \"{}\" (expected trace, debug, "
                              "info, warning, error, critical or off)", config.log_level);
                return std::nullopt;
            }
        }

        const auto jpeg_quality = clamped_int(j, "jpeg_quality", config.jpeg_quality, 1, 100);
        const auto png_compression = clamped_int(j, "png_compression", config.png_compression, 0, 9);
        if (!jpeg_quality || !png_compression) {
            return std::nullopt;
        }
        config.jpeg_quality = *jpeg_quality;
        config.png_compression = *png_compression;

        return config;

    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("[config] JSON parse error: {}", e.what());
        return std::nullopt;
    } catch (const nlohmann::json::type_error& e) {
        spdlog::error("[config] Invalid value type: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ToolConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[config] Failed to open: {}", path);
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto config = parse_config(contents.str());
    if (config) {
        spdlog::debug("[config] Loaded {}", path);
    }
    return config;
}

}  // namespace wmr
