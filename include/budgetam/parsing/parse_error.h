#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace budgetam::parsing {

enum class ParseErrorKind {
  kMissingGrandTotal,
  kGrandTotalNotNumeric,
  kDetailLabelMismatch,
};

// ParseError is fatal to the workbook being parsed, and to nothing else.
struct ParseError {
  ParseErrorKind kind{ParseErrorKind::kMissingGrandTotal};
  std::size_t row{0};    // zero-based; unused for kMissingGrandTotal
  std::string expected;  // label substring (kDetailLabelMismatch)
  std::string found;     // offending cell text
  std::string message;   // human-readable, one-based row numbers
};

[[nodiscard]] std::string_view parse_error_kind_name(ParseErrorKind kind) noexcept;

[[nodiscard]] ParseError missing_grand_total_error();
[[nodiscard]] ParseError grand_total_not_numeric_error(std::size_t row, std::string found);
[[nodiscard]] ParseError detail_label_mismatch_error(std::size_t row, std::string expected,
                                                     std::string found);

}  // namespace budgetam::parsing
