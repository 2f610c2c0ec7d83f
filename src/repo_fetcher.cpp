#include "repo_fetcher.hpp"
#include "log.hpp"
#include <algorithm>
#include <iterator>
#include <memory>
#include <spdlog/spdlog.h>

namespace ghtp {

namespace {
std::shared_ptr<spdlog::logger> fetcher_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("fetcher");
  }();
  return logger;
}
} // namespace

RepositoryFetcher::RepositoryFetcher(GitHubClient &client,
                                     ProgressReporter *progress, int max_pages)
    : client_(client), progress_(progress), max_pages_(max_pages) {}

FetchResult RepositoryFetcher::fetch_all(const SearchFilter &filter) {
  FetchResult result;
  fetcher_log()->info("Searching repositories: {}",
                      build_search_query(filter));
  for (int page = 1;; ++page) {
    if (max_pages_ > 0 && page > max_pages_) {
      fetcher_log()->info("Stopping after page limit of {}", max_pages_);
      break;
    }
    SearchPage batch;
    try {
      batch = client_.search_repositories(filter, page, kSearchPageSize);
    } catch (const std::exception &e) {
      fetcher_log()->error("Search page {} failed: {}", page, e.what());
      result.complete = false;
      result.error = e.what();
      break;
    }
    ++result.pages;
    if (page == 1) {
      result.total_count = batch.total_count;
    }
    const std::size_t received = batch.items.size();
    result.repositories.insert(result.repositories.end(),
                               std::make_move_iterator(batch.items.begin()),
                               std::make_move_iterator(batch.items.end()));
    fetcher_log()->debug("Page {} returned {} repositories", page, received);
    if (progress_) {
      progress_->page_fetched(page, result.repositories.size(),
                              result.total_count);
    }
    if (received < static_cast<std::size_t>(kSearchPageSize)) {
      break;
    }
    if (static_cast<long>(result.repositories.size()) >=
        std::min(result.total_count, kSearchResultCap)) {
      break;
    }
  }
  // The match count may shrink between pages.
  if (static_cast<long>(result.repositories.size()) > result.total_count) {
    fetcher_log()->debug("Dropping {} results beyond total_count {}",
                         result.repositories.size() -
                             static_cast<std::size_t>(result.total_count),
                         result.total_count);
    result.repositories.resize(static_cast<std::size_t>(result.total_count));
  }
  if (progress_) {
    progress_->finish();
  }
  fetcher_log()->info("Fetched {} of {} repositories in {} page(s)",
                      result.repositories.size(), result.total_count,
                      result.pages);
  return result;
}

} // namespace ghtp
