#include "repository.hpp"
#include <nlohmann/json.hpp>

namespace ghtp {

namespace {

/// Drop a trailing URI template such as `{/sha}` from an API locator.
std::string strip_uri_template(std::string url) {
  auto brace = url.find('{');
  if (brace != std::string::npos) {
    url.erase(brace);
  }
  return url;
}

} // namespace

RepositorySummary repository_summary_from_json(const nlohmann::json &item) {
  RepositorySummary repo;
  repo.name = item.at("name").get<std::string>();
  repo.full_name = item.value("full_name", repo.name);
  repo.stars = item.at("stargazers_count").get<long>();
  repo.forks = item.at("forks_count").get<long>();
  repo.url = item.at("html_url").get<std::string>();
  if (item.contains("description") && item["description"].is_string()) {
    repo.description = item["description"].get<std::string>();
  }
  repo.archived = item.value("archived", false);
  repo.contributors_url = item.value("contributors_url", std::string{});
  repo.commits_url =
      strip_uri_template(item.value("commits_url", std::string{}));
  return repo;
}

} // namespace ghtp
