/**
 * @file progress.hpp
 * @brief Progress reporting seam between the fetch/enrich phases and the
 *        console.
 */

#ifndef GH_TOP_PROJECTS_PROGRESS_HPP
#define GH_TOP_PROJECTS_PROGRESS_HPP

#include <cstddef>
#include <ostream>
#include <string>

namespace ghtp {

/** Receives progress events from the fetcher and enricher. */
class ProgressReporter {
public:
  virtual ~ProgressReporter() = default;

  /**
   * A search page was received.
   *
   * @param page One-based page number.
   * @param fetched Repositories accumulated so far.
   * @param total Total matches reported by the search.
   */
  virtual void page_fetched(int page, std::size_t fetched, long total) = 0;

  /**
   * Enrichment of one repository is about to start.
   *
   * @param index One-based position of the repository.
   * @param count Number of repositories being enriched.
   * @param name Repository identifier.
   */
  virtual void enriching(std::size_t index, std::size_t count,
                         const std::string &name) = 0;

  /// The current phase finished; terminate any in-place status line.
  virtual void finish() = 0;
};

/// Reporter that discards every event.
class NullProgressReporter : public ProgressReporter {
public:
  void page_fetched(int, std::size_t, long) override {}
  void enriching(std::size_t, std::size_t, const std::string &) override {}
  void finish() override {}
};

/**
 * Reporter that rewrites a single console line using carriage returns.
 */
class ConsoleProgressReporter : public ProgressReporter {
public:
  explicit ConsoleProgressReporter(std::ostream &out) : out_(out) {}

  void page_fetched(int page, std::size_t fetched, long total) override;
  void enriching(std::size_t index, std::size_t count,
                 const std::string &name) override;
  void finish() override;

private:
  void rewrite(const std::string &line);

  std::ostream &out_;
  std::size_t last_width_{0};
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_PROGRESS_HPP
