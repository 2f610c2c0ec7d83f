/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for gh-top-projects.
 */

#ifndef GH_TOP_PROJECTS_CLI_HPP
#define GH_TOP_PROJECTS_CLI_HPP

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace ghtp {

/**
 * Signals that CLI parsing requested an immediate exit (help, version or a
 * parse error already reported by CLI11).
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Fields with an `_explicit` companion have a configuration file
 * counterpart; the flag records whether the command line set the value so
 * it can take precedence over the file.
 */
struct CliOptions {
  // Search
  std::string language; ///< Primary language filter
  int min_stars{0};     ///< Inclusive lower star bound
  int max_stars{0};     ///< Inclusive upper star bound
  int min_forks{0};     ///< Minimum fork count
  bool count_only{false}; ///< Print the total match count and exit

  // Output
  std::string output; ///< Output path; empty derives one from the filter
  bool enrich{true};
  bool enrich_explicit{false};
  std::vector<std::string> columns; ///< Column names in export order
  bool columns_explicit{false};
  std::string format{"csv"}; ///< `csv` or `tsv`
  bool format_explicit{false};
  std::chrono::seconds commit_window{std::chrono::hours{24 * 90}};
  bool commit_window_explicit{false};
  int max_pages{0}; ///< 0 = unlimited
  bool max_pages_explicit{false};

  // Authentication
  std::string token;      ///< Resolved token (CLI, token file or env)
  std::string token_file; ///< File the token was read from, if any

  // Network
  std::string api_base; ///< Empty keeps the configured base
  int http_timeout{10}; ///< Seconds per request
  bool http_timeout_explicit{false};
  std::string http_proxy;
  std::string https_proxy;

  // General and logging
  bool verbose{false};
  std::string config_file;
  std::string log_level{"info"};
  bool log_level_explicit{false};
  std::string log_file;
  int log_rotate{3};
  bool log_rotate_explicit{false};
  bool log_compress{false};
  bool log_compress_explicit{false};
};

/**
 * Parse command line arguments.
 *
 * When neither `--token` nor `--token-file` is given the `GITHUB_TOKEN`
 * environment variable supplies the token.
 *
 * @throws CliParseExit For `--help`, `--version` and CLI11 parse errors.
 * The search filter (language and star or fork bounds) is passed through
 * unchecked; `--max-stars` below `--min-stars` simply matches nothing.
 *
 * @throws std::invalid_argument For unknown column names or a commit window
 *         that is not positive or exceeds `kMaxCommitWindow`.
 * @throws std::runtime_error When a duration or token file cannot be read.
 */
CliOptions parse_cli(int argc, char **argv);

/**
 * Default output file name for a search, e.g. `rust-repos-1000-5000.csv`.
 *
 * The language is lowercased and characters outside `[a-z0-9+#._-]` are
 * replaced by `-`.
 */
std::string default_output_path(const std::string &language, long min_stars,
                                 long max_stars,
                                 const std::string &extension = "csv");

} // namespace ghtp

#endif // GH_TOP_PROJECTS_CLI_HPP
