/**
 * @file    cli_app.hpp
 * @brief   CLI Application
 * @license MIT
 */

#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace wmr::cli {

/**
 * Install the "wmr" logger (colour, stderr) as the default logger
 *
 * Level: err when quiet, debug when verbose, otherwise config_level.
 */
std::shared_ptr<spdlog::logger> setup_logging(bool verbose, bool quiet,
                                              const std::string& config_level);

/**
 * Run the command-line tool
 *
 * @return  Process exit code: 0 when every image succeeded, 1 otherwise
 */
int run(int argc, char** argv);

}  // namespace wmr::cli
