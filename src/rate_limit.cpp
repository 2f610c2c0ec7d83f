#include "rate_limit.hpp"
#include "log.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> rate_limit_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("rate_limit");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

/// Numeric value of header @p name (lowercase), if present and parseable.
std::optional<long> header_value(const std::vector<std::string> &headers,
                                 const std::string &name) {
  for (const auto &h : headers) {
    auto colon = h.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (to_lower_copy(h.substr(0, colon)) != name) {
      continue;
    }
    try {
      return std::stol(h.substr(colon + 1));
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::chrono::system_clock::time_point from_epoch(long seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

std::optional<RateLimitStatus>
parse_rate_limit_headers(const std::vector<std::string> &headers) {
  auto remaining = header_value(headers, "x-ratelimit-remaining");
  auto limit = header_value(headers, "x-ratelimit-limit");
  if (!remaining || !limit) {
    return std::nullopt;
  }
  RateLimitStatus status;
  status.remaining = *remaining;
  status.limit = *limit;
  status.used = header_value(headers, "x-ratelimit-used")
                    .value_or(status.limit - status.remaining);
  status.reset_at =
      from_epoch(header_value(headers, "x-ratelimit-reset").value_or(0));
  return status;
}

std::optional<RateLimitStatus> parse_rate_limit_body(const std::string &body) {
  try {
    nlohmann::json j = nlohmann::json::parse(body);
    const nlohmann::json *core = nullptr;
    if (j.contains("resources") && j["resources"].is_object()) {
      const auto &resources = j["resources"];
      if (resources.contains("core") && resources["core"].is_object()) {
        core = &resources["core"];
      }
    }
    if (!core && j.contains("rate") && j["rate"].is_object()) {
      core = &j["rate"];
    }
    if (!core) {
      rate_limit_log()->warn("Unexpected rate limit payload");
      return std::nullopt;
    }
    RateLimitStatus status;
    status.limit = core->value("limit", 0L);
    status.remaining = core->value("remaining", 0L);
    status.used = core->value("used", status.limit - status.remaining);
    status.reset_at = from_epoch(core->value("reset", 0L));
    return status;
  } catch (const std::exception &e) {
    rate_limit_log()->warn("Failed to parse rate limit response: {}",
                           e.what());
    return std::nullopt;
  }
}

std::string format_rate_limit(const RateLimitStatus &status,
                              std::chrono::system_clock::time_point now) {
  std::ostringstream oss;
  oss << "Rate limit: " << status.remaining << "/" << status.limit
      << " remaining";
  if (status.reset_at.time_since_epoch().count() > 0) {
    auto wait = std::chrono::duration_cast<std::chrono::seconds>(
        status.reset_at - now);
    oss << ", resets at " << format_iso8601_utc(status.reset_at) << " (in "
        << format_duration(wait) << ")";
  }
  return oss.str();
}

void RateLimitMonitor::observe(const HttpResponse &response) {
  ++observed_;
  auto status = parse_rate_limit_headers(response.headers);
  if (!status) {
    return;
  }
  last_ = status;
  rate_limit_log()->info(format_rate_limit(*status));
  if (status->remaining > 0) {
    exhausted_warned_ = false;
  } else if (!exhausted_warned_) {
    rate_limit_log()->warn("Rate limit exhausted; requests will fail until "
                           "{}",
                           format_iso8601_utc(status->reset_at));
    exhausted_warned_ = true;
  }
}

} // namespace ghtp
