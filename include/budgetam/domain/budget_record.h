#pragma once

#include "budgetam/domain/amounts.h"
#include "budgetam/domain/source_type.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace budgetam::domain {

// FlattenedRecord is one output row: a subprogram together with the totals of the
// program and state body it belongs to (denormalized). For the medium-term plan,
// which has no subprogram level, one record is emitted per program and the
// subprogram fields stay empty.
//
// Records are built once by the parser and never modified afterwards.
struct FlattenedRecord {
  std::string state_body;                 // NOLINT(readability-identifier-naming)
  int program_code{0};                    // NOLINT(readability-identifier-naming)
  std::optional<int> program_code_ext;    // 2025 layout only ("<ext>-<code>")
  std::string program_name;               // NOLINT(readability-identifier-naming)
  std::string program_goal;               // NOLINT(readability-identifier-naming)
  std::string program_result_desc;        // NOLINT(readability-identifier-naming)
  std::optional<int> subprogram_code;     // nullopt only for the medium-term plan
  std::string subprogram_name;            // NOLINT(readability-identifier-naming)
  std::string subprogram_desc;            // NOLINT(readability-identifier-naming)
  std::string subprogram_type;            // NOLINT(readability-identifier-naming)
  LevelAmounts state_body_amounts;        // NOLINT(readability-identifier-naming)
  LevelAmounts program_amounts;           // NOLINT(readability-identifier-naming)
  LevelAmounts subprogram_amounts;        // NOLINT(readability-identifier-naming)
};

// Amounts of a record at one of the three row levels (kOverall is not valid here).
[[nodiscard]] const LevelAmounts& amounts_at(const FlattenedRecord& record, Level level);

// "<state_body> | <program_code> | <subprogram_code>", used in validation messages.
[[nodiscard]] std::string record_locator(const FlattenedRecord& record);

// OverallTotals holds the grand-total row: one value per field of the source kind,
// plus the forecast years for the medium-term plan.
struct OverallTotals {
  LevelAmounts amounts;         // NOLINT(readability-identifier-naming)
  std::vector<int> plan_years;  // [year, year+1, year+2] for MTEP, empty otherwise
};

// Output column order, fixed per layout:
//   classic    - 9 identifier columns, then state body / program / subprogram fields
//                each in workbook column order
//   2025       - 13 columns with program_code_ext and interleaved totals
//   MTEP       - 5 identifier columns, then state body and program per-year totals
[[nodiscard]] std::vector<std::string> output_columns(SourceType type, Layout layout);

// Cell text of a record for an output column name; empty for null values.
// Numbers use the shortest representation that round-trips ("150000", "0.712").
[[nodiscard]] std::string record_cell(const FlattenedRecord& record, const std::string& column);

[[nodiscard]] std::string format_number(double value);

// Overall JSON: {"overall_<field>": number|null, ..., "plan_years": [...]} (plan_years for MTEP).
[[nodiscard]] nlohmann::json overall_to_json(const OverallTotals& overall);

// Fields missing from the JSON are left null; plan_years is optional.
[[nodiscard]] OverallTotals overall_from_json(const nlohmann::json& j, SourceKind kind);

// Serialized JSON. Invalid UTF-8 in workbook text becomes U+FFFD instead of throwing.
[[nodiscard]] std::string json_text(const nlohmann::json& j, int indent = -1);

// Amount JSON for one level: {"<field>": number|null, ...}
[[nodiscard]] nlohmann::json amounts_to_json(const LevelAmounts& amounts);
[[nodiscard]] LevelAmounts amounts_from_json(const nlohmann::json& j, SourceKind kind);

}  // namespace budgetam::domain
