#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace budgetam::ingest {

/// One worksheet row: cell text in column order. Absent cells are empty strings.
struct RawRow {
  std::vector<std::string> cells;  // NOLINT(readability-identifier-naming)

  /// Cell text, or an empty string past the end of the row.
  [[nodiscard]] const std::string& cell(std::size_t column) const;
};

/// First worksheet of a workbook, with no header row.
struct Sheet {
  std::string name;           // NOLINT(readability-identifier-naming)
  std::vector<RawRow> rows;   // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::size_t row_count() const noexcept { return rows.size(); }

  /// Row `index` cut or padded to exactly `width` trimmed cells.
  /// Rows past the end of the sheet read as all-empty.
  [[nodiscard]] RawRow row(std::size_t index, std::size_t width) const;
};

}  // namespace budgetam::ingest
