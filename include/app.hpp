/**
 * @file app.hpp
 * @brief Application driver for gh-top-projects.
 *
 * Declares the App class, which parses the command line, merges the
 * configuration file, initializes logging and then runs the search, enrich
 * and export phases.
 */

#ifndef GH_TOP_PROJECTS_APP_HPP
#define GH_TOP_PROJECTS_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include <iostream>
#include <memory>
#include <ostream>
#include <string>

namespace ghtp {

class GitHubClient;

/**
 * Linear driver: parse arguments, optionally report the match count and
 * stop, fetch all pages, enrich, export and report the remaining quota.
 */
class App {
public:
  /**
   * @param http HTTP client used for every request. A CurlHttpClient
   *        configured from the options is created when `nullptr`.
   * @param out Stream receiving the run summary.
   * @param err Stream receiving single-line progress updates.
   */
  explicit App(std::unique_ptr<HttpClient> http = nullptr,
               std::ostream &out = std::cout, std::ostream &err = std::cerr);

  /**
   * Run the application with the given command line arguments.
   *
   * @return 0 on success (including empty and partial results and count
   *         mode), 1 on argument, configuration and export errors, or the
   *         CLI11 exit code for help and parse errors.
   */
  int run(int argc, char **argv);

  /// Parsed command line options merged with the configuration file.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration.
  const Config &config() const { return config_; }

  /// Output path used by the last run.
  const std::string &output_path() const { return output_path_; }

private:
  void merge_config();
  void init_logging();
  std::unique_ptr<HttpClient> make_http_client();
  int execute();
  void report_rate_limit(GitHubClient &client);

  std::unique_ptr<HttpClient> http_;
  std::ostream &out_;
  std::ostream &err_;
  CliOptions options_;
  Config config_;
  std::string output_path_;
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_APP_HPP
