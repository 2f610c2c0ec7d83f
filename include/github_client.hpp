#ifndef GH_TOP_PROJECTS_GITHUB_CLIENT_HPP
#define GH_TOP_PROJECTS_GITHUB_CLIENT_HPP

#include "http_client.hpp"
#include "rate_limit.hpp"
#include "repository.hpp"
#include "search_query.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ghtp {

/// One page of repository search results.
struct SearchPage {
  long total_count{0};                  ///< Total matches for the query
  bool incomplete_results{false};       ///< Search timed out server side
  std::vector<RepositorySummary> items; ///< Items on this page
};

/**
 * Minimal GitHub REST API client covering repository search, the
 * contributor and commit sub-resources, and the rate limit endpoint.
 *
 * Every response passes through a RateLimitMonitor. Requests are never
 * retried or delayed.
 */
class GitHubClient {
public:
  /**
   * Construct a GitHub API client.
   *
   * @param token Personal access token sent as `Authorization: token ...`.
   *        An empty token issues anonymous requests.
   * @param http Optional HTTP client implementation. A default CURL-backed
   *        implementation is constructed when `nullptr` is supplied.
   * @param api_base Base URL for the GitHub API endpoints.
   * @param timeout_ms HTTP request timeout in milliseconds for the internally
   *        created HTTP client.
   */
  explicit GitHubClient(std::string token,
                        std::unique_ptr<HttpClient> http = nullptr,
                        std::string api_base = "https://api.github.com",
                        int timeout_ms = 10000);

  /**
   * Fetch one page of repositories matching @p filter, sorted by stars in
   * descending order.
   *
   * @param filter Search criteria.
   * @param page One-based page number.
   * @param per_page Page size (max 100).
   * @return Parsed page including the total match count.
   * @throws HttpStatusError On a non-2xx response; the message carries the
   *         API's error text.
   * @throws TransientNetworkError On transport failures.
   * @throws std::runtime_error When the body is not a search result.
   */
  SearchPage search_repositories(const SearchFilter &filter, int page,
                                 int per_page = kSearchPageSize);

  /**
   * Total number of repositories matching @p filter using a one item page.
   *
   * @throws Same as search_repositories().
   */
  long count_repositories(const SearchFilter &filter);

  /**
   * Size of the first page (up to 100) of the contributors list.
   *
   * An HTTP 204 response, returned for empty repositories, counts as zero.
   *
   * @param contributors_url `contributors_url` locator of a repository.
   * @throws HttpStatusError, TransientNetworkError, std::runtime_error.
   */
  long contributor_count(const std::string &contributors_url);

  /**
   * Size of the first page (up to 100) of commits made on or after
   * @p since.
   *
   * @param commits_url `commits_url` locator of a repository without its
   *        URI template suffix.
   * @param since Lower bound sent as the ISO-8601 `since` parameter.
   * @throws HttpStatusError, TransientNetworkError, std::runtime_error.
   */
  long commit_count_since(const std::string &commits_url,
                          std::chrono::system_clock::time_point since);

  /**
   * Retrieve the current quota from the `/rate_limit` endpoint.
   *
   * @return Populated status snapshot when the endpoint succeeds;
   *         `std::nullopt` if the probe fails or returns malformed data.
   */
  std::optional<RateLimitStatus> rate_limit_status();

  /// Quota observed from response headers so far.
  const RateLimitMonitor &rate_limit_monitor() const { return monitor_; }

  /// Number of HTTP requests issued by this client.
  std::size_t request_count() const { return requests_; }

  /// Base URL for API requests.
  const std::string &api_base() const { return api_base_; }

private:
  std::vector<std::string> request_headers() const;
  HttpResponse get(const std::string &url);
  long count_array(const std::string &url, const char *what);

  std::string token_;
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  RateLimitMonitor monitor_;
  std::size_t requests_{0};
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_GITHUB_CLIENT_HPP
