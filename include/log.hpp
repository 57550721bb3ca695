/**
 * @file log.hpp
 * @brief Logging utilities for workflowharvest.
 *
 * Declares logger initialization, category loggers, and per-category level
 * overrides shared by the crawler, the history walker and the CLI.
 */

#ifndef WORKFLOWHARVEST_LOG_HPP
#define WORKFLOWHARVEST_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace wfh {

/**
 * Initialize the global logger with a console sink and an optional rotating
 * file sink.
 *
 * @param level Logging verbosity level applied to the default logger.
 * @param pattern Log message pattern. An empty string keeps the spdlog
 *        default.
 * @param file Optional log file path. When empty no file sink is attached.
 * @param rotate_files Number of rotated files to retain when @p file is set;
 *        zero selects a plain append-only file sink.
 * @param compress_rotations Whether rotated log files are gzip compressed.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a category.
 *
 * Category loggers are registered as `wfh.<category>` and share the sinks of
 * the default logger so every message ends up in the same destinations.
 *
 * @param category Category name, e.g. `crawler` or `github.client`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Components call this lazily so that library code used from tests logs
 * without an explicit init_logger() call.
 */
void ensure_default_logger();

} // namespace wfh

#endif // WORKFLOWHARVEST_LOG_HPP
