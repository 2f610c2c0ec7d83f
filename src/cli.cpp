#include "cli.hpp"
#include "enricher.hpp"
#include "exporter.hpp"
#include "log.hpp"
#include "token_loader.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

/// Read an environment variable, returning an empty string when unset.
std::string get_env_var(const char *name) {
#ifdef _WIN32
  char *buf = nullptr;
  size_t sz = 0;
  if (_dupenv_s(&buf, &sz, name) == 0 && buf) {
    std::string value(buf);
    std::free(buf);
    return value;
  }
  return {};
#else
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
#endif
}

bool given(const CLI::Option *option) {
  return option != nullptr && option->count() > 0U;
}

} // namespace

std::string default_output_path(const std::string &language, long min_stars,
                                long max_stars, const std::string &extension) {
  std::string slug;
  slug.reserve(language.size());
  for (unsigned char c : language) {
    char lower = static_cast<char>(std::tolower(c));
    bool keep = std::isalnum(c) || lower == '+' || lower == '#' ||
                lower == '.' || lower == '_' || lower == '-';
    slug += keep ? lower : '-';
  }
  return slug + "-repos-" + std::to_string(min_stars) + "-" +
         std::to_string(max_stars) + "." + extension;
}

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Search GitHub for the most starred repositories of a "
               "language and export them as a table"};
  CliOptions options;
  std::string commit_window_str;

  app.add_option("-l,--language", options.language,
                 "Primary repository language (e.g. rust, python)")
      ->required()
      ->group("Search");
  app.add_option("--min-stars", options.min_stars,
                 "Minimum star count (inclusive)")
      ->required()
      ->group("Search");
  app.add_option("--max-stars", options.max_stars,
                 "Maximum star count (inclusive)")
      ->required()
      ->group("Search");
  app.add_option("--min-forks", options.min_forks, "Minimum fork count")
      ->default_val("0")
      ->group("Search");
  app.add_flag("--count", options.count_only,
               "Print the number of matching repositories and exit")
      ->group("Search");

  app.add_option("-o,--output", options.output,
                 "Output file (default: <language>-repos-<min>-<max>.csv)")
      ->type_name("PATH")
      ->group("Output");
  auto *no_enrich_flag =
      app.add_flag("--no-enrich",
                   "Skip contributor and recent commit lookups")
          ->group("Output");
  auto *columns_option =
      app.add_option("--columns", options.columns,
                     "Comma separated export columns (name, stars, forks, "
                     "url, description, archived, contributors, "
                     "recent_commits)")
          ->delimiter(',')
          ->type_name("LIST")
          ->group("Output");
  auto *format_option =
      app.add_option("--format", options.format, "Output format")
          ->transform(CLI::IsMember({"csv", "tsv"}, CLI::ignore_case))
          ->group("Output");
  auto *commit_window_option =
      app.add_option("--commit-window", commit_window_str,
                     "Window counted as recent commits (e.g. 90d, 2w)")
          ->type_name("DURATION")
          ->group("Output");
  auto *max_pages_option =
      app.add_option("--max-pages", options.max_pages,
                     "Maximum search pages to request (0 = unlimited)")
          ->check(CLI::NonNegativeNumber)
          ->group("Output");

  auto *token_option =
      app.add_option("--token", options.token,
                     "GitHub token (default: GITHUB_TOKEN)")
          ->type_name("TOKEN")
          ->group("Authentication");
  app.add_option("--token-file", options.token_file,
                 "JSON, YAML or TOML file holding the GitHub token")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->excludes(token_option)
      ->group("Authentication");

  app.add_option("-A,--api-base", options.api_base,
                 "Base URL for the GitHub API")
      ->type_name("URL")
      ->group("Network");
  auto *timeout_option =
      app.add_option("-t,--http-timeout", options.http_timeout,
                     "HTTP timeout per request in seconds")
          ->check(CLI::PositiveNumber)
          ->type_name("SECONDS")
          ->group("Network");
  app.add_option("--http-proxy", options.http_proxy,
                 "Proxy URL for HTTP requests")
      ->type_name("URL")
      ->group("Network");
  app.add_option("--https-proxy", options.https_proxy,
                 "Proxy URL for HTTPS requests")
      ->type_name("URL")
      ->group("Network");

  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, JSON or TOML)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "gh-top-projects " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  auto *log_level_option =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning",
                                 "error", "critical", "off"}))
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  auto *log_rotate_option =
      app.add_option("--log-rotate", options.log_rotate,
                     "Number of rotated log files to retain (0 disables "
                     "rotation)")
          ->check(CLI::NonNegativeNumber)
          ->type_name("N")
          ->group("Logging");
  auto *log_compress_flag =
      app.add_flag("--log-compress", options.log_compress,
                   "Compress rotated log files with gzip")
          ->group("Logging");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  // Search values are passed through unchecked.
  options.enrich = !given(no_enrich_flag);
  options.enrich_explicit = given(no_enrich_flag);
  options.columns_explicit = given(columns_option);
  if (options.columns_explicit) {
    for (const auto &name : options.columns) {
      column_from_string(name);
    }
  }
  options.format_explicit = given(format_option);
  options.max_pages_explicit = given(max_pages_option);
  options.http_timeout_explicit = given(timeout_option);
  options.log_level_explicit = given(log_level_option);
  options.log_rotate_explicit = given(log_rotate_option);
  options.log_compress_explicit = given(log_compress_flag);
  if (given(commit_window_option)) {
    options.commit_window = parse_duration(commit_window_str);
    validate_commit_window(options.commit_window);
    options.commit_window_explicit = true;
  }

  if (!options.token_file.empty()) {
    options.token = load_token_from_file(options.token_file);
    cli_log()->debug("Using token from {}", options.token_file);
  }
  if (options.token.empty()) {
    options.token = get_env_var("GITHUB_TOKEN");
    if (!options.token.empty()) {
      cli_log()->debug("Using token from GITHUB_TOKEN");
    }
  }
  return options;
}

} // namespace ghtp
