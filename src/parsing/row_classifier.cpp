#include "budgetam/parsing/row_classifier.h"

#include "budgetam/core/normalization.h"
#include "budgetam/parsing/column_schema.h"

namespace budgetam::parsing {

namespace {

using core::is_blank;
using core::is_numeric;

bool blank(const ingest::RawRow& row, const std::size_t column) {
  return is_blank(row.cell(column));
}

bool set(const ingest::RawRow& row, const std::size_t column) {
  return !is_blank(row.cell(column));
}

bool numeric(const ingest::RawRow& row, const std::size_t column) {
  return is_numeric(row.cell(column));
}

bool all_blank(const ingest::RawRow& row, const std::size_t first, const std::size_t last) {
  for (std::size_t column = first; column <= last; ++column) {
    if (!blank(row, column)) {
      return false;
    }
  }
  return true;
}

bool all_numeric(const ingest::RawRow& row, const std::size_t first, const std::size_t last) {
  for (std::size_t column = first; column <= last; ++column) {
    if (!numeric(row, column)) {
      return false;
    }
  }
  return true;
}

bool is_marker(const ingest::RawRow& row, const std::size_t column,
               const std::string_view marker) {
  return core::normalize_label(row.cell(column)) == marker;
}

bool any_marker(const ingest::RawRow& row, const std::size_t last,
                const std::string_view marker) {
  for (std::size_t column = 0; column <= last; ++column) {
    if (is_marker(row, column, marker)) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool is_subprogram_code_cell(const std::string_view text) {
  const auto dash = text.find('-');
  if (dash == std::string_view::npos) {
    return is_numeric(text);
  }
  // Exactly two parts; a second dash makes the code malformed.
  const std::string_view head = text.substr(0, dash);
  const std::string_view tail = text.substr(dash + 1);
  return tail.find('-') == std::string_view::npos && is_numeric(head) && is_numeric(tail);
}

RowType ClassicRowClassifier::classify(const ingest::RawRow& row) const {
  if (all_blank(row, 0, 3)) {
    return RowType::kEmpty;
  }
  if (is_marker(row, 2, kGrandTotalMarker)) {
    return RowType::kGrandTotal;
  }
  if (any_marker(row, 2, kSubprogramSectionMarker)) {
    return RowType::kSubprogramMarker;
  }
  if (blank(row, 0) && blank(row, 1) && set(row, 2) && numeric(row, 3)) {
    return RowType::kStateBodyHeader;
  }
  if (numeric(row, 0) && blank(row, 1) && set(row, 2) && numeric(row, 3)) {
    return RowType::kProgramHeader;
  }
  if (blank(row, 0) && set(row, 1) && set(row, 2) && numeric(row, 3) &&
      is_subprogram_code_cell(core::trim(row.cell(1)))) {
    return RowType::kSubprogramHeader;
  }
  if (blank(row, 0) && blank(row, 1) && set(row, 2) && blank(row, 3)) {
    return RowType::kDetailLine;
  }
  return RowType::kUnknown;
}

RowType Budget2025RowClassifier::classify(const ingest::RawRow& row) const {
  if (all_blank(row, 0, 6)) {
    return RowType::kEmpty;
  }
  if (is_marker(row, 0, kGrandTotalMarker)) {
    return RowType::kGrandTotal;
  }
  if (set(row, 0) && numeric(row, 6)) {
    return RowType::kStateBodyHeader;
  }
  if (blank(row, 0) && numeric(row, 1) && blank(row, 2) && set(row, 3) && set(row, 4) &&
      numeric(row, 6)) {
    return RowType::kProgramHeader;
  }
  if (blank(row, 0) && blank(row, 1) && row.cell(2).find('-') != std::string::npos &&
      set(row, 3) && set(row, 4) && set(row, 5) && set(row, 6)) {
    return RowType::kSubprogramHeader;
  }
  if (all_blank(row, 0, 2) && set(row, 3) && blank(row, 6)) {
    return RowType::kDetailLine;
  }
  return RowType::kUnknown;
}

RowType MtepRowClassifier::classify(const ingest::RawRow& row) const {
  if (all_blank(row, 0, 4)) {
    return RowType::kEmpty;
  }
  if (any_marker(row, 2, kGrandTotalMarker)) {
    return RowType::kGrandTotal;
  }
  if (blank(row, 0) && set(row, 1) && all_numeric(row, 2, 4)) {
    return RowType::kStateBodyHeader;
  }
  if (numeric(row, 0) && set(row, 1) && all_numeric(row, 2, 4)) {
    return RowType::kProgramHeader;
  }
  if (blank(row, 0) && set(row, 1) && all_blank(row, 2, 4)) {
    return RowType::kDetailLine;
  }
  return RowType::kUnknown;
}

std::unique_ptr<IRowClassifier> make_row_classifier(const domain::Layout layout,
                                                    const domain::SourceType type) {
  switch (layout) {
    case domain::Layout::kBudget2025:
      return std::make_unique<Budget2025RowClassifier>();
    case domain::Layout::kMtep:
      return std::make_unique<MtepRowClassifier>();
    case domain::Layout::kClassic:
      break;
  }
  return std::make_unique<ClassicRowClassifier>(row_width(layout, type));
}

}  // namespace budgetam::parsing
