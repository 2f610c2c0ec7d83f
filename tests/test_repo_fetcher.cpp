#include "github_client.hpp"
#include "progress.hpp"
#include "repo_fetcher.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace ghtp;

namespace {

/// Serves `total` repositories in descending star order, page by page.
class FakeSearchServer : public HttpClient {
public:
  explicit FakeSearchServer(long total) : total_(total) {}

  long reported_total{-1}; ///< Overrides total_count when non-negative
  int fail_on_page{0};
  std::vector<std::string> urls;

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    (void)headers;
    urls.push_back(url);
    int page = param(url, "&page=");
    int per_page = param(url, "&per_page=");
    HttpResponse res;
    if (page == fail_on_page) {
      res.status_code = 503;
      res.body = R"({"message":"Service Unavailable"})";
      return res;
    }
    nlohmann::json items = nlohmann::json::array();
    long start = static_cast<long>(page - 1) * per_page;
    for (long i = start; i < total_ && i < start + per_page; ++i) {
      items.push_back({{"name", "repo" + std::to_string(i)},
                       {"full_name", "owner/repo" + std::to_string(i)},
                       {"stargazers_count", 100000 - i},
                       {"forks_count", i},
                       {"html_url", "https://github.com/owner/repo" +
                                        std::to_string(i)}});
    }
    nlohmann::json body = {
        {"total_count", reported_total >= 0 ? reported_total : total_},
        {"incomplete_results", false},
        {"items", items}};
    res.status_code = 200;
    res.body = body.dump();
    return res;
  }

private:
  static int param(const std::string &url, const std::string &key) {
    auto pos = url.find(key);
    if (pos == std::string::npos) {
      return 0;
    }
    return std::stoi(url.substr(pos + key.size()));
  }

  long total_;
};

class RecordingProgress : public ProgressReporter {
public:
  std::vector<std::size_t> fetched;
  int finished{0};

  void page_fetched(int, std::size_t count, long) override {
    fetched.push_back(count);
  }
  void enriching(std::size_t, std::size_t, const std::string &) override {}
  void finish() override { ++finished; }
};

const SearchFilter kFilter{"rust", 1000, 5000, 0};

} // namespace

TEST_CASE("fetcher walks every page") {
  auto server = std::make_unique<FakeSearchServer>(250);
  auto *raw = server.get();
  GitHubClient client("tok", std::move(server));
  RecordingProgress progress;
  RepositoryFetcher fetcher(client, &progress);

  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(result.complete);
  REQUIRE(result.total_count == 250);
  REQUIRE(result.pages == 3);
  REQUIRE(raw->urls.size() == 3);
  REQUIRE(result.repositories.size() == 250);
  REQUIRE(result.repositories.front().name == "repo0");
  REQUIRE(result.repositories.back().name == "repo249");
  for (std::size_t i = 1; i < result.repositories.size(); ++i) {
    REQUIRE(result.repositories[i - 1].stars >= result.repositories[i].stars);
  }
  REQUIRE(progress.fetched == std::vector<std::size_t>{100, 200, 250});
  REQUIRE(progress.finished == 1);
}

TEST_CASE("fetcher issues ceil(N/100) requests") {
  for (long total : {1L, 99L, 100L, 101L, 200L, 999L, 1000L}) {
    auto server = std::make_unique<FakeSearchServer>(total);
    auto *raw = server.get();
    GitHubClient client("tok", std::move(server));
    RepositoryFetcher fetcher(client);
    auto result = fetcher.fetch_all(kFilter);
    REQUIRE(raw->urls.size() == static_cast<std::size_t>((total + 99) / 100));
    REQUIRE(static_cast<long>(result.repositories.size()) == total);
  }
}

TEST_CASE("fetcher stops at the search result cap") {
  auto server = std::make_unique<FakeSearchServer>(2500);
  auto *raw = server.get();
  GitHubClient client("tok", std::move(server));
  RepositoryFetcher fetcher(client);
  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(raw->urls.size() == 10);
  REQUIRE(result.repositories.size() == 1000);
  REQUIRE(result.total_count == 2500);
  REQUIRE(result.complete);
}

TEST_CASE("fetched count never exceeds total_count") {
  auto server = std::make_unique<FakeSearchServer>(300);
  server->reported_total = 120;
  GitHubClient client("tok", std::move(server));
  RepositoryFetcher fetcher(client);
  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(result.total_count == 120);
  REQUIRE(result.repositories.size() == 120);
}

TEST_CASE("fetcher returns partial results after an error") {
  auto server = std::make_unique<FakeSearchServer>(250);
  server->fail_on_page = 2;
  auto *raw = server.get();
  GitHubClient client("tok", std::move(server));
  RepositoryFetcher fetcher(client);
  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(!result.complete);
  REQUIRE(result.pages == 1);
  REQUIRE(raw->urls.size() == 2);
  REQUIRE(result.repositories.size() == 100);
  REQUIRE(result.error.find("Service Unavailable") != std::string::npos);
}

TEST_CASE("fetcher error on the first page yields nothing") {
  auto server = std::make_unique<FakeSearchServer>(50);
  server->fail_on_page = 1;
  GitHubClient client("tok", std::move(server));
  RepositoryFetcher fetcher(client);
  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(!result.complete);
  REQUIRE(result.repositories.empty());
  REQUIRE(result.total_count == 0);
}

TEST_CASE("fetcher handles empty results") {
  auto server = std::make_unique<FakeSearchServer>(0);
  auto *raw = server.get();
  GitHubClient client("tok", std::move(server));
  RepositoryFetcher fetcher(client);
  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(result.complete);
  REQUIRE(result.repositories.empty());
  REQUIRE(raw->urls.size() == 1);
}

TEST_CASE("fetcher honours the page limit") {
  auto server = std::make_unique<FakeSearchServer>(450);
  auto *raw = server.get();
  GitHubClient client("tok", std::move(server));
  RepositoryFetcher fetcher(client, nullptr, 2);
  auto result = fetcher.fetch_all(kFilter);
  REQUIRE(raw->urls.size() == 2);
  REQUIRE(result.repositories.size() == 200);
  REQUIRE(result.complete);
}
