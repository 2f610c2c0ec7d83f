/**
 * @file time.hpp
 * @brief Duration parsing and timestamp formatting helpers.
 *
 * Durations such as "90d" or "1w3d" configure the recent-commit window;
 * timestamps are rendered as ISO-8601 UTC for the GitHub `since` parameter
 * and for rate-limit reports.
 */
#ifndef GH_TOP_PROJECTS_UTIL_TIME_HPP
#define GH_TOP_PROJECTS_UTIL_TIME_HPP

#include <chrono>
#include <string>

namespace ghtp {

/**
 * Parse a human-readable duration string (e.g. "10s", "5m", "2h", "90d",
 * "1w", "1h30m") into seconds. Units may be combined and a bare number is
 * interpreted as seconds.
 *
 * @param str Duration string; an empty string yields zero seconds.
 * @return Parsed duration in seconds.
 * @throws std::runtime_error On an invalid format or unit suffix, or when the
 *         total does not fit in a `long` number of seconds.
 */
std::chrono::seconds parse_duration(const std::string &str);

/// Render a duration compactly, e.g. `1h 2m 3s`, `45s`, `0s`.
std::string format_duration(std::chrono::seconds value);

/// Format a time point as `YYYY-MM-DDTHH:MM:SSZ`.
std::string format_iso8601_utc(std::chrono::system_clock::time_point tp);

} // namespace ghtp

#endif // GH_TOP_PROJECTS_UTIL_TIME_HPP
