#include "app.hpp"
#include "enricher.hpp"
#include "exporter.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "rate_limit.hpp"
#include "repo_fetcher.hpp"
#include "search_query.hpp"
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace ghtp {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

App::App(std::unique_ptr<HttpClient> http, std::ostream &out,
         std::ostream &err)
    : http_(std::move(http)), out_(out), err_(err) {}

/**
 * Execute the application flow.
 *
 * Parsing and configuration errors end the run with exit code 1 before any
 * request is made.
 */
int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    merge_config();
  } catch (const std::exception &e) {
    app_log()->error("Invalid configuration: {}", e.what());
    return 1;
  }
  init_logging();
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
  return execute();
}

/// Fill options the command line left unset from the configuration file.
void App::merge_config() {
  if (options_.token.empty()) {
    options_.token = config_.token();
  }
  if (options_.api_base.empty()) {
    options_.api_base = config_.api_base();
  }
  if (!options_.http_timeout_explicit) {
    options_.http_timeout = config_.http_timeout();
  }
  if (options_.http_proxy.empty()) {
    options_.http_proxy = config_.http_proxy();
  }
  if (options_.https_proxy.empty()) {
    options_.https_proxy = config_.https_proxy();
  }
  if (!options_.max_pages_explicit) {
    options_.max_pages = config_.max_pages();
  }
  if (!options_.commit_window_explicit) {
    options_.commit_window = config_.commit_window();
  }
  if (!options_.enrich_explicit) {
    options_.enrich = config_.enrich();
  }
  if (!options_.columns_explicit) {
    options_.columns = config_.columns();
  }
  if (!options_.format_explicit) {
    options_.format = config_.format();
  }
  // Validate before any request is made.
  export_format_from_string(options_.format);
  for (const auto &name : options_.columns) {
    column_from_string(name);
  }
  validate_commit_window(options_.commit_window);
  if (!options_.log_level_explicit && !options_.verbose) {
    options_.log_level = config_.log_level();
  }
  if (options_.log_file.empty()) {
    options_.log_file = config_.log_file();
  }
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_compress_explicit) {
    options_.log_compress = config_.log_compress();
  }
}

void App::init_logging() {
  std::string level_str = options_.log_level;
  if (options_.verbose && !options_.log_level_explicit) {
    level_str = "debug";
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Unknown log level '{}', using info", level_str);
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), options_.log_file,
              static_cast<std::size_t>(options_.log_rotate),
              options_.log_compress);
}

std::unique_ptr<HttpClient> App::make_http_client() {
  if (http_) {
    return std::move(http_);
  }
  return std::make_unique<CurlHttpClient>(
      static_cast<long>(options_.http_timeout) * 1000, options_.http_proxy,
      options_.https_proxy);
}

void App::report_rate_limit(GitHubClient &client) {
  auto status = client.rate_limit_status();
  if (!status) {
    status = client.rate_limit_monitor().last();
  }
  if (status) {
    out_ << format_rate_limit(*status) << "\n";
  } else {
    app_log()->warn("Rate limit status unavailable");
  }
}

int App::execute() {
  SearchFilter filter;
  filter.language = options_.language;
  filter.min_stars = options_.min_stars;
  filter.max_stars = options_.max_stars;
  filter.min_forks = options_.min_forks;

  if (options_.token.empty()) {
    app_log()->warn("No GitHub token configured; using the anonymous quota");
  }
  GitHubClient client(options_.token, make_http_client(), options_.api_base,
                      options_.http_timeout * 1000);
  app_log()->info("Searching: {}", build_search_query(filter));

  if (options_.count_only) {
    try {
      long total = client.count_repositories(filter);
      out_ << "Total repositories matching query: " << total << "\n";
    } catch (const std::exception &e) {
      app_log()->error("Count query failed: {}", e.what());
    }
    return 0;
  }

  ConsoleProgressReporter progress(err_);
  RepositoryFetcher fetcher(client, &progress, options_.max_pages);
  FetchResult fetched = fetcher.fetch_all(filter);
  if (!fetched.complete) {
    app_log()->warn("Search stopped early after {} page(s): {}",
                    fetched.pages, fetched.error);
  }
  if (fetched.repositories.empty()) {
    out_ << "No repositories found.\n";
    return 0;
  }
  out_ << "Fetched " << fetched.repositories.size() << " of "
       << fetched.total_count << " repositories.\n";

  std::vector<RepositoryDetail> details;
  std::size_t failed_lookups = 0;
  if (options_.enrich) {
    DetailEnricher enricher(client, options_.commit_window);
    details = enricher.enrich_all(fetched.repositories, &progress);
    failed_lookups = enricher.failures();
  } else {
    details = without_enrichment(fetched.repositories);
  }

  ExportFormat format = export_format_from_string(options_.format);
  std::vector<Column> columns = options_.columns.empty()
                                    ? default_columns(options_.enrich)
                                    : parse_columns(options_.columns);
  output_path_ = options_.output.empty()
                     ? default_output_path(options_.language,
                                           options_.min_stars,
                                           options_.max_stars,
                                           export_format_extension(format))
                     : options_.output;
  try {
    TableExporter(columns, format).write(output_path_, details);
  } catch (const std::exception &e) {
    app_log()->error("Export failed: {}", e.what());
    return 1;
  }
  out_ << "Saved " << details.size() << " repositories to " << output_path_
       << ".\n";
  if (failed_lookups > 0) {
    out_ << failed_lookups
         << " enrichment lookup(s) failed; their counts were written as 0.\n";
  }
  report_rate_limit(client);
  app_log()->info("Run finished with {} request(s)", client.request_count());
  return 0;
}

} // namespace ghtp
