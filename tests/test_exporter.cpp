#include "exporter.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ghtp;

namespace {

RepositoryDetail make_detail(const std::string &name, long stars,
                             std::optional<std::string> description) {
  RepositoryDetail d;
  d.summary.name = name;
  d.summary.full_name = "o/" + name;
  d.summary.stars = stars;
  d.summary.forks = stars / 10;
  d.summary.url = "https://github.com/o/" + name;
  d.summary.description = std::move(description);
  return d;
}

std::string read_file(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("exporter writes the basic columns") {
  std::vector<RepositoryDetail> rows = {
      make_detail("alpha", 5000, std::string("Fast, simple")),
      make_detail("beta", 1200, std::nullopt)};
  std::ostringstream out;
  TableExporter(default_columns(false)).write(out, rows);
  REQUIRE(out.str() == "name,stars,forks,url,description\r\n"
                       "alpha,5000,500,https://github.com/o/alpha,\"Fast, "
                       "simple\"\r\n"
                       "beta,1200,120,https://github.com/o/beta,\r\n");
}

TEST_CASE("exporter quotes embedded quotes and newlines") {
  std::vector<RepositoryDetail> rows = {
      make_detail("q", 1, std::string("say \"hi\"\nnow"))};
  std::ostringstream out;
  TableExporter({Column::Name, Column::Description}).write(out, rows);
  REQUIRE(out.str() == "name,description\r\nq,\"say \"\"hi\"\"\nnow\"\r\n");
}

TEST_CASE("exporter writes enrichment columns") {
  auto detail = make_detail("a", 10, std::nullopt);
  detail.summary.archived = true;
  detail.contributors = CountResult::success(12);
  detail.recent_commits = CountResult::failure("timeout: slow");
  std::ostringstream out;
  TableExporter(default_columns(true)).write(out, {detail});
  REQUIRE(out.str() ==
          "name,stars,forks,url,description,archived,contributors,"
          "recent_commits\r\n"
          "a,10,1,https://github.com/o/a,,true,12,0\r\n");
}

TEST_CASE("tsv output only quotes tabs") {
  std::ostringstream out;
  TableExporter({Column::Name, Column::Description}, ExportFormat::Tsv)
      .write(out, {make_detail("t", 1, std::string("a,b\tc"))});
  REQUIRE(out.str() == "name\tdescription\r\nt\t\"a,b\tc\"\r\n");
}

TEST_CASE("column and format parsing") {
  REQUIRE(parse_columns("name, Stars ,recent_commits") ==
          std::vector<Column>{Column::Name, Column::Stars,
                              Column::RecentCommits});
  REQUIRE(parse_columns(std::vector<std::string>{"url", "ARCHIVED"}) ==
          std::vector<Column>{Column::Url, Column::Archived});
  REQUIRE_THROWS_AS(parse_columns("name,watchers"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_columns(" , "), std::invalid_argument);
  REQUIRE(std::string(column_name(Column::Contributors)) == "contributors");
  REQUIRE(export_format_from_string("TSV") == ExportFormat::Tsv);
  REQUIRE(std::string(export_format_extension(ExportFormat::Csv)) == "csv");
  REQUIRE_THROWS_AS(export_format_from_string("xlsx"), std::invalid_argument);
}

TEST_CASE("repeat export is byte identical and overwrites") {
  const std::string path = "test_exporter_out.csv";
  std::remove(path.c_str());
  {
    std::ofstream stale(path);
    stale << "stale content that is longer than the export\n"
             "more stale lines\nand more\nand more\nand more\n";
  }
  std::vector<RepositoryDetail> rows = {
      make_detail("one", 3, std::string("x")),
      make_detail("two", 2, std::string("line\r\nbreak"))};
  TableExporter exporter(default_columns(true));
  exporter.write(path, rows);
  std::string first = read_file(path);
  exporter.write(path, rows);
  std::string second = read_file(path);
  REQUIRE(first == second);
  REQUIRE(first.find("stale") == std::string::npos);
  REQUIRE(first.rfind("name,stars", 0) == 0);
  REQUIRE(first.find("\"line\r\nbreak\",false,0,0\r\n") != std::string::npos);
  REQUIRE(first.substr(first.size() - 2) == "\r\n");
  std::remove(path.c_str());
}

TEST_CASE("export to an unwritable path throws") {
  TableExporter exporter(default_columns(false));
  REQUIRE_THROWS_AS(
      exporter.write("no_such_dir_for_export/out.csv",
                     {make_detail("a", 1, std::nullopt)}),
      std::runtime_error);
}
