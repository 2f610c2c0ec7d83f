/**
 * @file repository.hpp
 * @brief Repository records produced by the search and enrichment phases.
 */

#ifndef GH_TOP_PROJECTS_REPOSITORY_HPP
#define GH_TOP_PROJECTS_REPOSITORY_HPP

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <utility>

namespace ghtp {

/// One item of a repository search result.
struct RepositorySummary {
  std::string name;                       ///< Repository name
  std::string full_name;                  ///< `owner/name`
  long stars{0};                          ///< stargazers_count
  long forks{0};                          ///< forks_count
  std::string url;                        ///< html_url
  std::optional<std::string> description; ///< May be null in the API
  bool archived{false};                   ///< Repository is read-only
  std::string contributors_url;           ///< Contributors sub-resource
  std::string commits_url;                ///< Commits sub-resource, no `{/sha}`
};

/**
 * Build a summary from one element of the search `items` array.
 *
 * @throws nlohmann::json::exception When required fields are missing or have
 *         the wrong type.
 */
RepositorySummary repository_summary_from_json(const nlohmann::json &item);

/**
 * Outcome of one enrichment lookup: either a count or the reason it could
 * not be determined.
 *
 * A default constructed result means the lookup was never requested.
 */
class CountResult {
public:
  CountResult() = default;

  static CountResult success(long count) {
    CountResult r;
    r.count_ = count;
    return r;
  }

  static CountResult failure(std::string reason) {
    CountResult r;
    r.error_ = std::move(reason);
    return r;
  }

  bool ok() const { return count_.has_value(); }
  bool failed() const { return !error_.empty(); }

  /// Count when known; failures and unrequested lookups collapse to 0.
  long value_or_zero() const { return count_.value_or(0); }

  const std::optional<long> &count() const { return count_; }
  const std::string &error() const { return error_; }

private:
  std::optional<long> count_;
  std::string error_;
};

/// Search result merged with its enrichment lookups.
struct RepositoryDetail {
  RepositorySummary summary;
  CountResult contributors;
  CountResult recent_commits;

  long contributor_count() const { return contributors.value_or_zero(); }
  long recent_commit_count() const { return recent_commits.value_or_zero(); }
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_REPOSITORY_HPP
