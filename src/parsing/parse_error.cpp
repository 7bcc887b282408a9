#include "budgetam/parsing/parse_error.h"

#include <utility>

namespace budgetam::parsing {

std::string_view parse_error_kind_name(const ParseErrorKind kind) noexcept {
  switch (kind) {
    case ParseErrorKind::kMissingGrandTotal:
      return "MissingGrandTotal";
    case ParseErrorKind::kGrandTotalNotNumeric:
      return "GrandTotalNotNumeric";
    case ParseErrorKind::kDetailLabelMismatch:
      return "DetailLabelMismatch";
  }
  return "MissingGrandTotal";
}

ParseError missing_grand_total_error() {
  ParseError error;
  error.kind = ParseErrorKind::kMissingGrandTotal;
  error.message = "Grand total row not found";
  return error;
}

ParseError grand_total_not_numeric_error(const std::size_t row, std::string found) {
  ParseError error;
  error.kind = ParseErrorKind::kGrandTotalNotNumeric;
  error.row = row;
  error.message = "Row " + std::to_string(row + 1) + ": grand total amount is not numeric: '" +
                  found + "'";
  error.found = std::move(found);
  return error;
}

ParseError detail_label_mismatch_error(const std::size_t row, std::string expected,
                                       std::string found) {
  ParseError error;
  error.kind = ParseErrorKind::kDetailLabelMismatch;
  error.row = row;
  error.message = "Row " + std::to_string(row + 1) + ": expected label containing '" + expected +
                  "', found '" + found + "'";
  error.expected = std::move(expected);
  error.found = std::move(found);
  return error;
}

}  // namespace budgetam::parsing
