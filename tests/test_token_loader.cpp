#include "token_loader.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ghtp;

namespace {
void write_file(const std::string &path, const std::string &content) {
  std::ofstream f(path);
  f << content;
}
} // namespace

TEST_CASE("token files in every format") {
  write_file("tokens_test.json", R"({"token": " t1 ", "tokens": ["t2", ""]})");
  REQUIRE(load_tokens_from_file("tokens_test.json") ==
          std::vector<std::string>{"t1", "t2"});
  std::remove("tokens_test.json");

  write_file("tokens_test.yaml", "- y1\n- y2\n");
  REQUIRE(load_tokens_from_file("tokens_test.yaml") ==
          std::vector<std::string>{"y1", "y2"});
  std::remove("tokens_test.yaml");

  write_file("tokens_test.yml", "token: single\n");
  REQUIRE(load_token_from_file("tokens_test.yml") == "single");
  std::remove("tokens_test.yml");

  write_file("tokens_test.toml", "tokens = [\"a\", \"b\"]\n");
  REQUIRE(load_token_from_file("tokens_test.toml") == "a");
  std::remove("tokens_test.toml");

  write_file("tokens_test_str.json", R"("plain")");
  REQUIRE(load_token_from_file("tokens_test_str.json") == "plain");
  std::remove("tokens_test_str.json");
}

TEST_CASE("token file errors") {
  REQUIRE_THROWS_AS(load_tokens_from_file("tokens_without_extension"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(load_tokens_from_file("tokens.txt"), std::runtime_error);

  write_file("tokens_empty.json", "[]");
  REQUIRE(load_tokens_from_file("tokens_empty.json").empty());
  REQUIRE_THROWS_AS(load_token_from_file("tokens_empty.json"),
                    std::runtime_error);
  std::remove("tokens_empty.json");

  write_file("tokens_bad.toml", "tokens = [1, 2]\n");
  REQUIRE_THROWS_AS(load_tokens_from_file("tokens_bad.toml"),
                    std::runtime_error);
  std::remove("tokens_bad.toml");
}
