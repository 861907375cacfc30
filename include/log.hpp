/**
 * @file log.hpp
 * @brief Logging utilities for ghvault.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration shared by the backup engine and the command line front-end.
 */

#ifndef GHVAULT_LOG_HPP
#define GHVAULT_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace ghv {

/**
 * Initialize the global logger with a console sink and an optional rotating
 * file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when @p file
 *        is provided (0 writes a single, non-rotating file).
 * @param compress_rotations Whether rotated log files are gzip compressed.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations while allowing per-category level overrides.
 *
 * @param category Category name, registered as `ghvault.<category>`.
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

/// Create the default logger on demand when it was never initialised.
void ensure_default_logger();

} // namespace ghv

#endif // GHVAULT_LOG_HPP
