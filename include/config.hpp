#ifndef GH_TOP_PROJECTS_CONFIG_HPP
#define GH_TOP_PROJECTS_CONFIG_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace ghtp {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout (values below 1 are clamped to 1).
  void set_http_timeout(int t) { http_timeout_ = t < 1 ? 1 : t; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set HTTP proxy URL.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set HTTPS proxy URL.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Maximum search pages to request (0 = unlimited).
  int max_pages() const { return max_pages_; }

  /// Set the search page cap.
  void set_max_pages(int pages) { max_pages_ = pages < 0 ? 0 : pages; }

  /// Trailing window counted as recent commits.
  std::chrono::seconds commit_window() const { return commit_window_; }

  /// Set the recent commit window.
  void set_commit_window(std::chrono::seconds window) {
    commit_window_ = window;
  }

  /// Whether contributor and commit lookups run.
  bool enrich() const { return enrich_; }

  /// Enable or disable enrichment.
  void set_enrich(bool enrich) { enrich_ = enrich; }

  /// Export column names; empty selects the defaults.
  const std::vector<std::string> &columns() const { return columns_; }

  /// Set export column names.
  void set_columns(const std::vector<std::string> &columns) {
    columns_ = columns;
  }

  /// Export format name (`csv` or `tsv`).
  const std::string &format() const { return format_; }

  /// Set export format name.
  void set_format(const std::string &format) { format_ = format; }

  /// GitHub token from the configuration file.
  const std::string &token() const { return token_; }

  /// Set GitHub token.
  void set_token(const std::string &token) { token_ = token; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern for spdlog sinks.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set rotated log file count.
  void set_log_rotate(int files) { log_rotate_ = files < 0 ? 0 : files; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated logs.
  void set_log_compress(bool compress) { log_compress_ = compress; }

  /**
   * Apply values from a JSON document.
   *
   * Keys may appear at the root or inside the `network`, `search`,
   * `export`, `logging` and `auth` sections.
   *
   * @throws nlohmann::json::exception When a value has the wrong type.
   * @throws std::runtime_error When a duration cannot be parsed.
   */
  void load_json(const nlohmann::json &j);

  /// Create a configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a YAML, TOML, or JSON file chosen by extension.
   *
   * @throws std::runtime_error On unreadable files or unknown extensions.
   */
  static Config from_file(const std::string &path);

private:
  std::string api_base_ = "https://api.github.com";
  int http_timeout_ = 10;
  std::string http_proxy_;
  std::string https_proxy_;
  int max_pages_ = 0;
  std::chrono::seconds commit_window_{std::chrono::hours{24 * 90}};
  bool enrich_ = true;
  std::vector<std::string> columns_;
  std::string format_ = "csv";
  std::string token_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_CONFIG_HPP
