/**
 * @file exporter.hpp
 * @brief Delimited tabular export of repository details.
 *
 * Declares the column and format configuration and the TableExporter that
 * writes one header row plus one row per repository.
 */

#ifndef GH_TOP_PROJECTS_EXPORTER_HPP
#define GH_TOP_PROJECTS_EXPORTER_HPP

#include "repository.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ghtp {

/// Exportable column.
enum class Column {
  Name,
  Stars,
  Forks,
  Url,
  Description,
  Archived,
  Contributors,
  RecentCommits
};

/// Header text of a column, e.g. `recent_commits`.
const char *column_name(Column column);

/**
 * Parse a column name (case-insensitive).
 *
 * @throws std::invalid_argument For unknown names.
 */
Column column_from_string(const std::string &name);

/**
 * Parse a comma separated column list such as `name,stars,url`.
 *
 * @throws std::invalid_argument For unknown or empty lists.
 */
std::vector<Column> parse_columns(const std::string &list);

/// Parse a list of column names.
std::vector<Column> parse_columns(const std::vector<std::string> &names);

/**
 * Default column set: name, stars, forks, url, description, followed by
 * archived, contributors and recent_commits when enrichment ran.
 */
std::vector<Column> default_columns(bool enriched);

/// Output file flavour.
enum class ExportFormat { Csv, Tsv };

/**
 * Parse `csv` or `tsv` (case-insensitive).
 *
 * @throws std::invalid_argument For other values.
 */
ExportFormat export_format_from_string(const std::string &value);

/// File extension without the dot.
const char *export_format_extension(ExportFormat format);

/**
 * Writes repository details as a delimited table.
 *
 * Records end in CRLF. Fields containing the delimiter, a double quote, CR
 * or LF are quoted with embedded quotes doubled. Output is deterministic: the same input
 * always yields the same bytes.
 */
class TableExporter {
public:
  explicit TableExporter(std::vector<Column> columns,
                         ExportFormat format = ExportFormat::Csv);

  /**
   * Write the table to @p path, replacing any existing file.
   *
   * @throws std::runtime_error When the file cannot be opened or written.
   */
  void write(const std::string &path,
             const std::vector<RepositoryDetail> &rows) const;

  /// Write the table to an already open stream.
  void write(std::ostream &out,
             const std::vector<RepositoryDetail> &rows) const;

  const std::vector<Column> &columns() const { return columns_; }
  char delimiter() const { return delimiter_; }

private:
  std::string escape(std::string_view field) const;
  std::string cell(const RepositoryDetail &row, Column column) const;

  std::vector<Column> columns_;
  char delimiter_;
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_EXPORTER_HPP
