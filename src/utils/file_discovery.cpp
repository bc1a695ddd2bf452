/**
 * @file    file_discovery.cpp
 * @brief   Input file discovery and output path naming
 * @license MIT
 */

#include "utils/file_discovery.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace wmr {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // anonymous namespace

bool is_supported_image(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" ||
           ext == ".webp" || ext == ".bmp";
}

std::vector<fs::path> find_image_files(const fs::path& dir, std::string_view suffix) {
    const std::string lower_suffix = to_lower(std::string(suffix));
    std::vector<fs::path> files;

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (!is_supported_image(entry.path())) continue;

        const std::string name = to_lower(filename_utf8(entry.path()));
        if (!lower_suffix.empty() && name.find(lower_suffix) != std::string::npos) {
            spdlog::debug("Skipping already processed file: {}", entry.path().filename());
            continue;
        }

        files.push_back(entry.path());
    }

    std::sort(files.begin(), files.end());
    return files;
}

fs::path generate_output_path(const fs::path& input, std::string_view suffix) {
    fs::path output = input.parent_path();
    output /= path_from_utf8(to_utf8(input.stem()) + std::string(suffix) + to_utf8(input.extension()));
    return output;
}

fs::path resolve_output_path(const fs::path& input,
                             const fs::path& output_dir,
                             std::string_view suffix) {
    if (output_dir.empty()) {
        return generate_output_path(input, suffix);
    }
    return output_dir / input.filename();
}

InputSet expand_inputs(const std::vector<fs::path>& inputs, std::string_view suffix) {
    InputSet result;

    for (const auto& input : inputs) {
        std::error_code ec;
        if (!fs::exists(input, ec)) {
            result.errors.push_back(fmt::format("Path not found: {}", input));
            continue;
        }

        if (!fs::is_directory(input, ec)) {
            result.files.push_back(input);
            continue;
        }

        result.scanned_directory = true;
        try {
            auto found = find_image_files(input, suffix);
            if (found.empty()) {
                result.errors.push_back(fmt::format("No image files found in directory: {}", input));
                continue;
            }
            spdlog::debug("Found {} image(s) in {}", found.size(), input);
            result.files.insert(result.files.end(), found.begin(), found.end());
        } catch (const fs::filesystem_error& e) {
            result.errors.push_back(fmt::format("Error scanning directory {}: {}", input, e.what()));
        }
    }

    return result;
}

}  // namespace wmr
