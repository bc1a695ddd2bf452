/**
 * @file    file_discovery.hpp
 * @brief   Input file discovery and output path naming
 * @license MIT
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wmr {

/**
 * Check for a supported image extension (case-insensitive)
 * .png, .jpg, .jpeg, .webp, .bmp
 */
bool is_supported_image(const std::filesystem::path& path);

/**
 * Scan a directory (non-recursive) for supported images
 *
 * Files whose name already contains the output suffix are skipped so that
 * previously cleaned images are not processed again.
 *
 * @param dir     Directory to scan
 * @param suffix  Output suffix (e.g. "_clean"); empty disables the filter
 * @return        Matching files, sorted by name
 * @throws std::filesystem::filesystem_error  If the directory cannot be read
 */
std::vector<std::filesystem::path> find_image_files(
    const std::filesystem::path& dir,
    std::string_view suffix
);

/**
 * Insert a suffix before the extension
 *
 * "/path/to/image.png" + "_clean" -> "/path/to/image_clean.png"
 */
std::filesystem::path generate_output_path(
    const std::filesystem::path& input,
    std::string_view suffix
);

/**
 * Output location for an input
 *
 * With an output directory the file keeps its name there; otherwise the
 * suffix is appended next to the input.
 */
std::filesystem::path resolve_output_path(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::string_view suffix
);

/**
 * Expanded command-line inputs
 */
struct InputSet {
    std::vector<std::filesystem::path> files;
    std::vector<std::string> errors;      // One message per unusable argument
    bool scanned_directory = false;       // At least one argument was a directory
};

/**
 * Expand files and directories given on the command line
 *
 * Directories expand through find_image_files(); an empty directory or a
 * missing path is reported in errors.
 */
InputSet expand_inputs(
    const std::vector<std::filesystem::path>& inputs,
    std::string_view suffix
);

}  // namespace wmr
