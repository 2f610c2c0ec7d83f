/**
 * @file log.hpp
 * @brief Logging utilities for gh-top-projects.
 *
 * Declares logger initialization and the per-category loggers used by each
 * component.
 */

#ifndef GH_TOP_PROJECTS_LOG_HPP
#define GH_TOP_PROJECTS_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace ghtp {

/**
 * Initialize the global logger with a stderr sink and an optional rotating
 * file sink.
 *
 * Standard output is reserved for the run summary, so the console sink
 * always writes to stderr.
 *
 * @param level Logging verbosity level applied to the default logger and
 *        every category logger created so far.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided (0 writes a single, truncated file).
 * @param compress_rotations Whether rotated log files are gzip compressed.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger and are registered
 * under `ghtp.<category>`.
 *
 * @param category Category name, e.g. `github.client`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/// Create the default logger on demand when init_logger() was never called.
void ensure_default_logger();

} // namespace ghtp

#endif // GH_TOP_PROJECTS_LOG_HPP
