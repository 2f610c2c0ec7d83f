/**
 * @file github_client.cpp
 * @brief Implementation of the GitHub REST API client.
 *
 * Wraps repository search, the contributor and commit sub-resources, and
 * the rate limit endpoint on top of an HttpClient.
 */

#include "github_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/time.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

/// Append a query parameter, choosing `?` or `&` as needed.
std::string with_param(const std::string &url, const std::string &name,
                       const std::string &value) {
  char sep = url.find('?') == std::string::npos ? '?' : '&';
  return url + sep + name + "=" + url_encode(value);
}

/**
 * Describe a failed response using GitHub's `message` field when the body
 * carries one.
 */
std::string api_error_message(const HttpResponse &res) {
  std::string message;
  try {
    auto j = nlohmann::json::parse(res.body);
    if (j.is_object() && j.contains("message") && j["message"].is_string()) {
      message = j["message"].get<std::string>();
    }
  } catch (const nlohmann::json::exception &) {
    message = res.body.substr(0, 200);
  }
  std::string out = "HTTP " + std::to_string(res.status_code);
  if (!message.empty()) {
    out += " - " + message;
  }
  return out;
}

void require_ok(const HttpResponse &res, const std::string &url) {
  if (res.ok()) {
    return;
  }
  std::string msg = api_error_message(res);
  github_client_log()->debug("GET {} failed: {}", url, msg);
  throw HttpStatusError(static_cast<int>(res.status_code), msg);
}

} // namespace

GitHubClient::GitHubClient(std::string token, std::unique_ptr<HttpClient> http,
                           std::string api_base, int timeout_ms)
    : token_(std::move(token)),
      http_(http ? std::move(http)
                 : std::make_unique<CurlHttpClient>(timeout_ms)),
      api_base_(std::move(api_base)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

std::vector<std::string> GitHubClient::request_headers() const {
  std::vector<std::string> headers;
  if (!token_.empty()) {
    headers.push_back("Authorization: token " + token_);
  }
  headers.push_back("Accept: application/vnd.github+json");
  return headers;
}

/**
 * Issue a GET request and let the rate limit monitor inspect the response.
 */
HttpResponse GitHubClient::get(const std::string &url) {
  ++requests_;
  HttpResponse res = http_->get(url, request_headers());
  monitor_.observe(res);
  return res;
}

SearchPage GitHubClient::search_repositories(const SearchFilter &filter,
                                             int page, int per_page) {
  std::string url = search_url(api_base_, filter, page, per_page);
  github_client_log()->debug("Searching page {}: {}", page,
                             build_search_query(filter));
  HttpResponse res = get(url);
  require_ok(res, url);
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(res.body);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Failed to parse search response: ") +
                             e.what());
  }
  if (!j.is_object() || !j.contains("items") || !j["items"].is_array()) {
    throw std::runtime_error("Search response has no items array");
  }
  SearchPage out;
  out.total_count = j.value("total_count", 0L);
  out.incomplete_results = j.value("incomplete_results", false);
  out.items.reserve(j["items"].size());
  for (const auto &item : j["items"]) {
    try {
      out.items.push_back(repository_summary_from_json(item));
    } catch (const nlohmann::json::exception &e) {
      github_client_log()->warn("Skipping malformed search item: {}",
                                e.what());
    }
  }
  if (out.incomplete_results) {
    github_client_log()->warn("Search page {} reported incomplete results",
                              page);
  }
  return out;
}

long GitHubClient::count_repositories(const SearchFilter &filter) {
  return search_repositories(filter, 1, 1).total_count;
}

long GitHubClient::count_array(const std::string &url, const char *what) {
  HttpResponse res = get(url);
  require_ok(res, url);
  if (res.status_code == 204 || res.body.empty()) {
    return 0;
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(res.body);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Failed to parse ") + what +
                             " list: " + e.what());
  }
  if (!j.is_array()) {
    throw std::runtime_error(std::string("Expected a JSON array of ") + what);
  }
  return static_cast<long>(j.size());
}

long GitHubClient::contributor_count(const std::string &contributors_url) {
  if (contributors_url.empty()) {
    throw std::runtime_error("Repository has no contributors_url");
  }
  return count_array(with_param(contributors_url, "per_page", "100"),
                     "contributors");
}

long GitHubClient::commit_count_since(
    const std::string &commits_url,
    std::chrono::system_clock::time_point since) {
  if (commits_url.empty()) {
    throw std::runtime_error("Repository has no commits_url");
  }
  std::string url = with_param(commits_url, "since", format_iso8601_utc(since));
  return count_array(with_param(url, "per_page", "100"), "commits");
}

std::optional<RateLimitStatus> GitHubClient::rate_limit_status() {
  std::string url = api_base_ + "/rate_limit";
  HttpResponse res;
  try {
    res = get(url);
  } catch (const std::exception &e) {
    github_client_log()->warn("Failed to query rate limit: {}", e.what());
    return std::nullopt;
  }
  if (!res.ok()) {
    github_client_log()->warn("Rate limit endpoint returned {}",
                              api_error_message(res));
    return std::nullopt;
  }
  return parse_rate_limit_body(res.body);
}

} // namespace ghtp
