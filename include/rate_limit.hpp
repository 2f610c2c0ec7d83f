#ifndef GH_TOP_PROJECTS_RATE_LIMIT_HPP
#define GH_TOP_PROJECTS_RATE_LIMIT_HPP

#include "http_client.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ghtp {

/// Snapshot of the GitHub request quota.
struct RateLimitStatus {
  long limit{0};                                  ///< Requests per window
  long remaining{0};                              ///< Requests left
  long used{0};                                   ///< Requests consumed
  std::chrono::system_clock::time_point reset_at; ///< Window reset time
};

/**
 * Extract quota information from `X-RateLimit-*` response headers.
 *
 * Header names are matched case-insensitively. `used` falls back to
 * `limit - remaining` when the header is absent.
 *
 * @return Status when at least the remaining and limit headers are present.
 */
std::optional<RateLimitStatus>
parse_rate_limit_headers(const std::vector<std::string> &headers);

/**
 * Parse the body of the `/rate_limit` endpoint, preferring
 * `resources.core` over the legacy top-level `rate` object.
 *
 * @return Status, or `std::nullopt` when the payload is malformed.
 */
std::optional<RateLimitStatus> parse_rate_limit_body(const std::string &body);

/// Human-readable one line report, e.g.
/// `Rate limit: 4990/5000 remaining, resets at 2026-10-19T12:00:00Z (in 12m)`.
std::string format_rate_limit(const RateLimitStatus &status,
                              std::chrono::system_clock::time_point now =
                                  std::chrono::system_clock::now());

/**
 * Observes quota headers after every request and logs a report at info
 * level.
 *
 * The monitor never delays or retries requests; once the quota runs out the
 * following requests fail and each caller handles that through its own
 * error path.
 */
class RateLimitMonitor {
public:
  /// Record the quota reported by @p response, if any.
  void observe(const HttpResponse &response);

  /// Last status seen in a response, if any response carried one.
  const std::optional<RateLimitStatus> &last() const { return last_; }

  /// Number of responses inspected so far.
  std::size_t observed() const { return observed_; }

private:
  std::optional<RateLimitStatus> last_;
  std::size_t observed_{0};
  bool exhausted_warned_{false};
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_RATE_LIMIT_HPP
