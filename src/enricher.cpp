#include "enricher.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> enricher_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("enricher");
  }();
  return logger;
}

/// Short failure reason, marking timeouts explicitly.
std::string describe_failure(const std::exception &e) {
  if (auto net = dynamic_cast<const TransientNetworkError *>(&e)) {
    if (net->timed_out()) {
      return std::string("timeout: ") + e.what();
    }
  }
  return e.what();
}

} // namespace

void validate_commit_window(std::chrono::seconds window) {
  if (window.count() <= 0) {
    throw std::invalid_argument("commit window must be positive");
  }
  if (window > kMaxCommitWindow) {
    throw std::invalid_argument("commit window of " +
                                std::to_string(window.count()) +
                                "s exceeds 100 years");
  }
}

DetailEnricher::DetailEnricher(GitHubClient &client,
                               std::chrono::seconds commit_window, Clock now)
    : client_(client), commit_window_(commit_window), now_(std::move(now)) {
  validate_commit_window(commit_window_);
}

CountResult DetailEnricher::lookup_contributors(const RepositorySummary &repo) {
  try {
    return CountResult::success(client_.contributor_count(repo.contributors_url));
  } catch (const std::exception &e) {
    ++failures_;
    std::string reason = describe_failure(e);
    enricher_log()->error("Error fetching contributors for {}: {}",
                          repo.full_name, reason);
    return CountResult::failure(std::move(reason));
  }
}

CountResult
DetailEnricher::lookup_recent_commits(const RepositorySummary &repo) {
  auto since = now_() - commit_window_;
  try {
    return CountResult::success(
        client_.commit_count_since(repo.commits_url, since));
  } catch (const std::exception &e) {
    ++failures_;
    std::string reason = describe_failure(e);
    enricher_log()->error("Error fetching commits for {}: {}", repo.full_name,
                          reason);
    return CountResult::failure(std::move(reason));
  }
}

RepositoryDetail DetailEnricher::enrich(const RepositorySummary &repo) {
  RepositoryDetail detail;
  detail.summary = repo;
  detail.contributors = lookup_contributors(repo);
  detail.recent_commits = lookup_recent_commits(repo);
  enricher_log()->debug("{}: {} contributors, {} recent commits",
                        repo.full_name, detail.contributor_count(),
                        detail.recent_commit_count());
  return detail;
}

std::vector<RepositoryDetail>
DetailEnricher::enrich_all(const std::vector<RepositorySummary> &repos,
                           ProgressReporter *progress) {
  std::vector<RepositoryDetail> details;
  details.reserve(repos.size());
  for (std::size_t i = 0; i < repos.size(); ++i) {
    if (progress) {
      progress->enriching(i + 1, repos.size(), repos[i].full_name);
    }
    details.push_back(enrich(repos[i]));
  }
  if (progress) {
    progress->finish();
  }
  enricher_log()->info("Enriched {} repositories ({} failed lookups)",
                       details.size(), failures_);
  return details;
}

std::vector<RepositoryDetail>
without_enrichment(const std::vector<RepositorySummary> &repos) {
  std::vector<RepositoryDetail> details;
  details.reserve(repos.size());
  for (const auto &repo : repos) {
    RepositoryDetail detail;
    detail.summary = repo;
    details.push_back(std::move(detail));
  }
  return details;
}

} // namespace ghtp
