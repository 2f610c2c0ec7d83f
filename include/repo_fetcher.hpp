#ifndef GH_TOP_PROJECTS_REPO_FETCHER_HPP
#define GH_TOP_PROJECTS_REPO_FETCHER_HPP

#include "github_client.hpp"
#include "progress.hpp"
#include "repository.hpp"
#include "search_query.hpp"
#include <string>
#include <vector>

namespace ghtp {

/// Outcome of a paginated search.
struct FetchResult {
  std::vector<RepositorySummary> repositories; ///< In descending star order
  long total_count{0};  ///< Matches reported by the first page
  int pages{0};         ///< Search pages received
  bool complete{true};  ///< False when an error ended the search early
  std::string error;    ///< Reason for stopping early, if any
};

/**
 * Walks the search result pages for a filter and accumulates the
 * repositories.
 *
 * Paging stops on a short page, once `total_count` items (at most
 * kSearchResultCap) were collected, at the configured page cap, or at the
 * first error. Results beyond `total_count` are dropped. Errors do not throw;
 * the repositories gathered before the failure are returned with
 * `complete == false`.
 */
class RepositoryFetcher {
public:
  /**
   * @param client GitHub client used for the search requests.
   * @param progress Optional reporter notified after every page.
   * @param max_pages Maximum pages to request (0 = unlimited).
   */
  explicit RepositoryFetcher(GitHubClient &client,
                             ProgressReporter *progress = nullptr,
                             int max_pages = 0);

  /// Fetch every page of results for @p filter.
  FetchResult fetch_all(const SearchFilter &filter);

private:
  GitHubClient &client_;
  ProgressReporter *progress_;
  int max_pages_;
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_REPO_FETCHER_HPP
