#include "exporter.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> exporter_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("exporter");
  }();
  return logger;
}

constexpr const char *kRecordEnd = "\r\n";

constexpr std::array<std::pair<Column, const char *>, 8> kColumnNames = {{
    {Column::Name, "name"},
    {Column::Stars, "stars"},
    {Column::Forks, "forks"},
    {Column::Url, "url"},
    {Column::Description, "description"},
    {Column::Archived, "archived"},
    {Column::Contributors, "contributors"},
    {Column::RecentCommits, "recent_commits"},
}};

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

} // namespace

const char *column_name(Column column) {
  for (const auto &[c, name] : kColumnNames) {
    if (c == column) {
      return name;
    }
  }
  return "";
}

Column column_from_string(const std::string &name) {
  std::string lower = to_lower_copy(trim(name));
  for (const auto &[c, column_text] : kColumnNames) {
    if (lower == column_text) {
      return c;
    }
  }
  throw std::invalid_argument("unknown column '" + name + "'");
}

std::vector<Column> parse_columns(const std::string &list) {
  std::vector<Column> columns;
  std::stringstream ss(list);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (trim(part).empty()) {
      continue;
    }
    columns.push_back(column_from_string(part));
  }
  if (columns.empty()) {
    throw std::invalid_argument("column list is empty");
  }
  return columns;
}

std::vector<Column> parse_columns(const std::vector<std::string> &names) {
  std::vector<Column> columns;
  columns.reserve(names.size());
  for (const auto &name : names) {
    columns.push_back(column_from_string(name));
  }
  if (columns.empty()) {
    throw std::invalid_argument("column list is empty");
  }
  return columns;
}

std::vector<Column> default_columns(bool enriched) {
  std::vector<Column> columns = {Column::Name, Column::Stars, Column::Forks,
                                 Column::Url, Column::Description};
  if (enriched) {
    columns.push_back(Column::Archived);
    columns.push_back(Column::Contributors);
    columns.push_back(Column::RecentCommits);
  }
  return columns;
}

ExportFormat export_format_from_string(const std::string &value) {
  std::string lower = to_lower_copy(value);
  if (lower == "csv") {
    return ExportFormat::Csv;
  }
  if (lower == "tsv") {
    return ExportFormat::Tsv;
  }
  throw std::invalid_argument("unsupported export format '" + value + "'");
}

const char *export_format_extension(ExportFormat format) {
  return format == ExportFormat::Tsv ? "tsv" : "csv";
}

TableExporter::TableExporter(std::vector<Column> columns, ExportFormat format)
    : columns_(std::move(columns)),
      delimiter_(format == ExportFormat::Tsv ? '\t' : ',') {}

std::string TableExporter::escape(std::string_view field) const {
  bool needs_wrap = field.find(delimiter_) != std::string_view::npos ||
                    field.find('"') != std::string_view::npos ||
                    field.find('\n') != std::string_view::npos ||
                    field.find('\r') != std::string_view::npos;
  if (!needs_wrap) {
    return std::string(field);
  }
  std::string escaped = "\"";
  escaped.reserve(field.size() + 2);
  for (char c : field) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  escaped += '"';
  return escaped;
}

std::string TableExporter::cell(const RepositoryDetail &row,
                                Column column) const {
  const auto &repo = row.summary;
  switch (column) {
  case Column::Name:
    return repo.name;
  case Column::Stars:
    return std::to_string(repo.stars);
  case Column::Forks:
    return std::to_string(repo.forks);
  case Column::Url:
    return repo.url;
  case Column::Description:
    return repo.description.value_or("");
  case Column::Archived:
    return repo.archived ? "true" : "false";
  case Column::Contributors:
    return std::to_string(row.contributor_count());
  case Column::RecentCommits:
    return std::to_string(row.recent_commit_count());
  }
  return {};
}

void TableExporter::write(std::ostream &out,
                          const std::vector<RepositoryDetail> &rows) const {
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (i != 0) {
      out << delimiter_;
    }
    out << column_name(columns_[i]);
  }
  out << kRecordEnd;
  for (const auto &row : rows) {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i != 0) {
        out << delimiter_;
      }
      out << escape(cell(row, columns_[i]));
    }
    out << kRecordEnd;
  }
}

void TableExporter::write(const std::string &path,
                          const std::vector<RepositoryDetail> &rows) const {
  exporter_log()->debug("Exporting {} rows to {}", rows.size(), path);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    exporter_log()->error("Failed to open {} for writing", path);
    throw std::runtime_error("Failed to open output file '" + path + "'");
  }
  write(out, rows);
  out.flush();
  if (!out) {
    exporter_log()->error("Failed to write {}", path);
    throw std::runtime_error("Failed to write output file '" + path + "'");
  }
  exporter_log()->info("Wrote {} rows to {}", rows.size(), path);
}

} // namespace ghtp
