#include "search_query.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace ghtp;

TEST_CASE("search query qualifiers") {
  SearchFilter filter{"rust", 1000, 5000, 0};
  REQUIRE(build_search_query(filter) ==
          "language:rust stars:1000..5000 forks:>=0");

  filter.min_forks = 25;
  REQUIRE(build_search_query(filter) ==
          "language:rust stars:1000..5000 forks:>=25");
}

TEST_CASE("search parameters sort by stars descending") {
  SearchFilter filter{"go", 10, 20, 1};
  auto params = search_parameters(filter, 4, 100);
  REQUIRE(params.size() == 5);
  REQUIRE(params[0].first == "q");
  REQUIRE(params[0].second == "language:go stars:10..20 forks:>=1");
  REQUIRE(params[1] == std::make_pair(std::string("sort"), std::string("stars")));
  REQUIRE(params[2] == std::make_pair(std::string("order"), std::string("desc")));
  REQUIRE(params[3] == std::make_pair(std::string("per_page"), std::string("100")));
  REQUIRE(params[4] == std::make_pair(std::string("page"), std::string("4")));
}

TEST_CASE("search url encodes the query") {
  SearchFilter filter{"c++", 1, 2, 0};
  std::string url = search_url("https://api.github.com", filter, 3, 100);
  REQUIRE(url.rfind("https://api.github.com/search/repositories?q=", 0) == 0);
  REQUIRE(url.find(' ') == std::string::npos);
  REQUIRE(url.find("c%2B%2B") != std::string::npos);
  REQUIRE(url.find("&sort=stars&order=desc&per_page=100&page=3") !=
          std::string::npos);
}
