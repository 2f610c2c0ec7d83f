/**
 * @file enricher.hpp
 * @brief Per-repository contributor and recent-commit lookups.
 */

#ifndef GH_TOP_PROJECTS_ENRICHER_HPP
#define GH_TOP_PROJECTS_ENRICHER_HPP

#include "github_client.hpp"
#include "progress.hpp"
#include "repository.hpp"
#include <chrono>
#include <functional>
#include <vector>

namespace ghtp {

/// Default trailing window for the recent commit count.
constexpr std::chrono::hours kDefaultCommitWindow{24 * 90};

/// Longest accepted commit window (100 years).
constexpr std::chrono::hours kMaxCommitWindow{24 * 365 * 100};

/**
 * Check that a commit window is positive and at most kMaxCommitWindow.
 *
 * @throws std::invalid_argument Otherwise.
 */
void validate_commit_window(std::chrono::seconds window);

/**
 * Adds contributor and recent-commit counts to search results.
 *
 * Each repository costs two requests, issued one after the other. A failed
 * lookup becomes a CountResult failure, is logged, and never stops the run.
 * Neither lookup is paginated, so repositories with more than 100
 * contributors or recent commits report 100.
 */
class DetailEnricher {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  /**
   * @param client GitHub client used for the sub-resource requests.
   * @param commit_window Trailing window counted as "recent".
   * @param now Clock used to compute the `since` bound.
   * @throws std::invalid_argument When @p commit_window is out of range.
   */
  explicit DetailEnricher(
      GitHubClient &client,
      std::chrono::seconds commit_window = kDefaultCommitWindow,
      Clock now = [] { return std::chrono::system_clock::now(); });

  /// Enrich a single repository.
  RepositoryDetail enrich(const RepositorySummary &repo);

  /**
   * Enrich every repository in order.
   *
   * @param repos Search results.
   * @param progress Optional reporter notified before each repository.
   * @return Details in the same order as @p repos.
   */
  std::vector<RepositoryDetail>
  enrich_all(const std::vector<RepositorySummary> &repos,
             ProgressReporter *progress = nullptr);

  /// Lookups that failed so far.
  std::size_t failures() const { return failures_; }

private:
  CountResult lookup_contributors(const RepositorySummary &repo);
  CountResult lookup_recent_commits(const RepositorySummary &repo);

  GitHubClient &client_;
  std::chrono::seconds commit_window_;
  Clock now_;
  std::size_t failures_{0};
};

/// Wrap summaries in details without performing any lookups.
std::vector<RepositoryDetail>
without_enrichment(const std::vector<RepositorySummary> &repos);

} // namespace ghtp

#endif // GH_TOP_PROJECTS_ENRICHER_HPP
