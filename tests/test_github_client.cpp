#include "errors.hpp"
#include "github_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace ghtp;

namespace {

class MockHttpClient : public HttpClient {
public:
  HttpResponse response;
  std::vector<std::string> urls;
  std::vector<std::string> last_headers;

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    urls.push_back(url);
    last_headers = headers;
    return response;
  }
};

class TimeoutHttpClient : public HttpClient {
public:
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    (void)headers;
    throw TransientNetworkError("curl GET " + url + " failed: Timeout", true);
  }
};

HttpResponse make_response(long status, std::string body,
                           std::vector<std::string> headers = {}) {
  HttpResponse res;
  res.status_code = status;
  res.body = std::move(body);
  res.headers = std::move(headers);
  return res;
}

bool has_header(const std::vector<std::string> &headers,
                const std::string &header) {
  for (const auto &h : headers) {
    if (h == header) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("search parses items and total count") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  raw->response = make_response(200, R"({
    "total_count": 2, "incomplete_results": false,
    "items": [
      {"name": "a", "full_name": "o/a", "stargazers_count": 20,
       "forks_count": 2, "html_url": "https://github.com/o/a"},
      {"name": "broken"},
      {"name": "b", "full_name": "o/b", "stargazers_count": 10,
       "forks_count": 1, "html_url": "https://github.com/o/b"}
    ]})");
  GitHubClient client("tok", std::move(mock), "https://api.example.com/");
  REQUIRE(client.api_base() == "https://api.example.com");

  auto page = client.search_repositories({"rust", 1, 100, 0}, 2, 100);
  REQUIRE(page.total_count == 2);
  REQUIRE(page.items.size() == 2);
  REQUIRE(page.items[0].name == "a");
  REQUIRE(page.items[1].name == "b");
  REQUIRE(raw->urls.size() == 1);
  REQUIRE(raw->urls[0].rfind("https://api.example.com/search/repositories?q=",
                             0) == 0);
  REQUIRE(raw->urls[0].find("&page=2") != std::string::npos);
  REQUIRE(has_header(raw->last_headers, "Authorization: token tok"));
  REQUIRE(has_header(raw->last_headers,
                     "Accept: application/vnd.github+json"));
  REQUIRE(client.request_count() == 1);
}

TEST_CASE("anonymous client sends no authorization header") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  raw->response = make_response(200, R"({"total_count": 7, "items": []})");
  GitHubClient client("", std::move(mock));
  REQUIRE(client.count_repositories({"go", 1, 2, 0}) == 7);
  REQUIRE(raw->urls[0].find("per_page=1&") != std::string::npos);
  for (const auto &h : raw->last_headers) {
    REQUIRE(h.rfind("Authorization", 0) == std::string::npos);
  }
}

TEST_CASE("search errors carry the status and API message") {
  auto mock = std::make_unique<MockHttpClient>();
  mock->response = make_response(
      422, R"({"message":"Validation Failed","errors":[]})");
  GitHubClient client("tok", std::move(mock));
  try {
    client.search_repositories({"rust", 1, 2, 0}, 1);
    FAIL("expected HttpStatusError");
  } catch (const HttpStatusError &e) {
    REQUIRE(e.status == 422);
    REQUIRE(std::string(e.what()).find("Validation Failed") !=
            std::string::npos);
  }
}

TEST_CASE("search rejects malformed bodies") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  raw->response = make_response(200, "not json");
  GitHubClient client("tok", std::move(mock));
  REQUIRE_THROWS_AS(client.search_repositories({"rust", 1, 2, 0}, 1),
                    std::runtime_error);
  raw->response = make_response(200, R"({"total_count": 1})");
  REQUIRE_THROWS_AS(client.search_repositories({"rust", 1, 2, 0}, 1),
                    std::runtime_error);
}

TEST_CASE("contributor count uses the first page") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  raw->response = make_response(200, R"([{"login":"a"},{"login":"b"}])");
  GitHubClient client("tok", std::move(mock));
  REQUIRE(client.contributor_count(
              "https://api.github.com/repos/o/a/contributors") == 2);
  REQUIRE(raw->urls.back() ==
          "https://api.github.com/repos/o/a/contributors?per_page=100");

  raw->response = make_response(204, "");
  REQUIRE(client.contributor_count(
              "https://api.github.com/repos/o/a/contributors") == 0);

  raw->response = make_response(200, R"({"message":"oops"})");
  REQUIRE_THROWS_AS(client.contributor_count(
                        "https://api.github.com/repos/o/a/contributors"),
                    std::runtime_error);
}

TEST_CASE("commit count sends the since bound") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  raw->response = make_response(200, R"([{"sha":"1"},{"sha":"2"},{"sha":"3"}])");
  GitHubClient client("tok", std::move(mock));
  std::chrono::system_clock::time_point since{
      std::chrono::seconds(1700000000)};
  REQUIRE(client.commit_count_since(
              "https://api.github.com/repos/o/a/commits", since) == 3);
  const auto &url = raw->urls.back();
  REQUIRE(url.rfind("https://api.github.com/repos/o/a/commits?since=", 0) ==
          0);
  REQUIRE(url.find("2023-11-14T22%3A13%3A20Z") != std::string::npos);
  REQUIRE(url.find("&per_page=100") != std::string::npos);

  raw->response = make_response(409, R"({"message":"Git Repository is empty."})");
  REQUIRE_THROWS_AS(client.commit_count_since(
                        "https://api.github.com/repos/o/a/commits", since),
                    HttpStatusError);
}

TEST_CASE("missing locators fail without a request") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  GitHubClient client("tok", std::move(mock));
  REQUIRE_THROWS_AS(client.contributor_count(""), std::runtime_error);
  REQUIRE_THROWS_AS(
      client.commit_count_since("", std::chrono::system_clock::now()),
      std::runtime_error);
  REQUIRE(raw->urls.empty());
}

TEST_CASE("transport errors propagate") {
  GitHubClient client("tok", std::make_unique<TimeoutHttpClient>());
  try {
    client.contributor_count("https://api.github.com/repos/o/a/contributors");
    FAIL("expected TransientNetworkError");
  } catch (const TransientNetworkError &e) {
    REQUIRE(e.timed_out());
  }
}

TEST_CASE("rate limit endpoint and header monitor") {
  auto mock = std::make_unique<MockHttpClient>();
  auto *raw = mock.get();
  raw->response = make_response(
      200, R"({"resources":{"core":{"limit":5000,"remaining":4321,"reset":1700000000}}})",
      {"X-RateLimit-Limit: 5000", "X-RateLimit-Remaining: 4321"});
  GitHubClient client("tok", std::move(mock));
  auto status = client.rate_limit_status();
  REQUIRE(status);
  REQUIRE(status->remaining == 4321);
  REQUIRE(raw->urls.back() == "https://api.github.com/rate_limit");
  REQUIRE(client.rate_limit_monitor().last());
  REQUIRE(client.rate_limit_monitor().last()->limit == 5000);

  raw->response = make_response(500, "boom");
  REQUIRE(!client.rate_limit_status());
}
