/**
 * @file errors.hpp
 * @brief Typed exceptions raised by the HTTP and GitHub layers.
 */

#ifndef GH_TOP_PROJECTS_ERRORS_HPP
#define GH_TOP_PROJECTS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ghtp {

/// Transport level failure (DNS, connect, TLS, timeout) reported by libcurl.
class TransientNetworkError : public std::runtime_error {
public:
  explicit TransientNetworkError(const std::string &msg, bool timed_out = false)
      : std::runtime_error(msg), timed_out_(timed_out) {}

  /// True when the request exceeded its configured timeout.
  bool timed_out() const noexcept { return timed_out_; }

private:
  bool timed_out_;
};

/// HTTP response with a status outside the 2xx range.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &msg)
      : std::runtime_error(msg), status(status_code) {}

  int status; ///< HTTP status code returned by the server
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_ERRORS_HPP
