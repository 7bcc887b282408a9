#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace budgetam::core {

// Deterministic, locale-independent text utilities for workbook cells.
// Workbook text is UTF-8; marker and label tokens are Armenian, so lowercasing
// covers ASCII A-Z and the Armenian capitals U+0531..U+0556 explicitly instead of
// relying on std::tolower and the process locale.

// trim removes leading and trailing whitespace (ASCII space/tab/newline, and NBSP U+00A0)
std::string trim(std::string_view input);

// utf8_lower lowercases ASCII and Armenian capital letters; all other bytes are preserved.
std::string utf8_lower(std::string_view input);

// normalize_label prepares a cell for marker/label comparison:
// trim, lowercase, drop spaces and the punctuation that trails labels in
// real workbooks (: . ՝ ։ - — – _).
// "Ընդամենը՝" and "ԸՆԴԱՄԵՆԸ :" both normalize to "ընդամենը".
std::string normalize_label(std::string_view input);

// is_blank is true when the cell holds only whitespace.
bool is_blank(std::string_view input);

// is_numeric is true iff the whole (trimmed) cell parses as a floating-point number.
// "12", "-3.5", "1e3" are numeric; "", "-", "12abc", "1-2" are not.
bool is_numeric(std::string_view input);

// parse_number returns the value of a numeric cell, nullopt otherwise.
std::optional<double> parse_number(std::string_view input);

// parse_amount returns the numeric value of a cell, or 0.0 for blank/non-numeric content.
double parse_amount(std::string_view input);

// parse_fraction converts a percentage cell ("71.2" or "71.2%") to a fraction (0.712).
// Non-numeric content such as "-" is tolerated as 0.0.
double parse_fraction(std::string_view input);

// parse_integer accepts an optionally signed run of decimal digits (surrounding
// whitespace allowed). "3.0" and "3a" are rejected.
std::optional<int> parse_integer(std::string_view input);

// parse_code reads a hierarchy code cell. The value must be finite, integral and fit
// in an int: "12" and "3.0" give 12 and 3; "3.5", "nan", "inf" and "1e10" give nullopt.
std::optional<int> parse_code(std::string_view input);

}  // namespace budgetam::core
