#pragma once

#include "budgetam/parsing/row_type.h"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace budgetam::parsing {

struct ParseWarning {
  std::size_t row{0};   // zero-based sheet row
  std::string message;  // NOLINT(readability-identifier-naming)
};

// ParseDiagnostics collects recoverable problems and row statistics for one parse.
// The caller owns it and decides whether and where to print it.
class ParseDiagnostics {
 public:
  void warn(const std::size_t row, std::string message) {
    warnings_.push_back(ParseWarning{row, std::move(message)});
  }

  // Classified row, counted under its type and the state it moved the parser into.
  void note_row(const RowType type, const ProcessingState state) {
    ++row_types_[type];
    ++state_rows_[state];
  }

  void note_skipped_row() noexcept { ++skipped_rows_; }
  // Hierarchy row seen before the grand total.
  void note_ignored_row() noexcept { ++ignored_rows_; }

  [[nodiscard]] const std::vector<ParseWarning>& warnings() const noexcept { return warnings_; }
  [[nodiscard]] std::size_t skipped_rows() const noexcept { return skipped_rows_; }
  [[nodiscard]] std::size_t ignored_rows() const noexcept { return ignored_rows_; }
  [[nodiscard]] bool empty() const noexcept { return warnings_.empty(); }

  [[nodiscard]] std::size_t row_type_count(const RowType type) const {
    const auto it = row_types_.find(type);
    return it == row_types_.end() ? 0 : it->second;
  }

  [[nodiscard]] std::size_t state_row_count(const ProcessingState state) const {
    const auto it = state_rows_.find(state);
    return it == state_rows_.end() ? 0 : it->second;
  }

 private:
  std::vector<ParseWarning> warnings_;
  std::map<RowType, std::size_t> row_types_;
  std::map<ProcessingState, std::size_t> state_rows_;
  std::size_t skipped_rows_{0};
  std::size_t ignored_rows_{0};
};

}  // namespace budgetam::parsing
