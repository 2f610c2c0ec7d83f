#include "repository.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace ghtp;

TEST_CASE("repository summary from search item") {
  auto item = nlohmann::json::parse(R"({
    "name": "ripgrep",
    "full_name": "BurntSushi/ripgrep",
    "stargazers_count": 4800,
    "forks_count": 210,
    "html_url": "https://github.com/BurntSushi/ripgrep",
    "description": "line-oriented search",
    "archived": true,
    "contributors_url": "https://api.github.com/repos/BurntSushi/ripgrep/contributors",
    "commits_url": "https://api.github.com/repos/BurntSushi/ripgrep/commits{/sha}"
  })");
  auto repo = repository_summary_from_json(item);
  REQUIRE(repo.name == "ripgrep");
  REQUIRE(repo.full_name == "BurntSushi/ripgrep");
  REQUIRE(repo.stars == 4800);
  REQUIRE(repo.forks == 210);
  REQUIRE(repo.url == "https://github.com/BurntSushi/ripgrep");
  REQUIRE(repo.description == std::optional<std::string>("line-oriented search"));
  REQUIRE(repo.archived);
  REQUIRE(repo.commits_url ==
          "https://api.github.com/repos/BurntSushi/ripgrep/commits");
}

TEST_CASE("repository summary tolerates null description") {
  auto item = nlohmann::json::parse(R"({
    "name": "x", "stargazers_count": 1, "forks_count": 0,
    "html_url": "https://github.com/o/x", "description": null
  })");
  auto repo = repository_summary_from_json(item);
  REQUIRE(!repo.description.has_value());
  REQUIRE(repo.full_name == "x");
  REQUIRE(!repo.archived);
  REQUIRE(repo.contributors_url.empty());
}

TEST_CASE("repository summary requires core fields") {
  auto item = nlohmann::json::parse(R"({"name": "x", "forks_count": 0})");
  REQUIRE_THROWS_AS(repository_summary_from_json(item),
                    nlohmann::json::exception);
}

TEST_CASE("count result distinguishes failure from zero") {
  CountResult unset;
  REQUIRE(!unset.ok());
  REQUIRE(!unset.failed());
  REQUIRE(unset.value_or_zero() == 0);

  auto zero = CountResult::success(0);
  REQUIRE(zero.ok());
  REQUIRE(!zero.failed());

  auto failed = CountResult::failure("HTTP 500");
  REQUIRE(!failed.ok());
  REQUIRE(failed.failed());
  REQUIRE(failed.error() == "HTTP 500");
  REQUIRE(failed.value_or_zero() == 0);

  RepositoryDetail detail;
  detail.contributors = CountResult::success(42);
  detail.recent_commits = failed;
  REQUIRE(detail.contributor_count() == 42);
  REQUIRE(detail.recent_commit_count() == 0);
}
