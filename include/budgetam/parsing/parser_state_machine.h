#pragma once

#include "budgetam/core/result.h"
#include "budgetam/domain/budget_record.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/ingest/sheet.h"
#include "budgetam/parsing/detail_collector.h"
#include "budgetam/parsing/parse_diagnostics.h"
#include "budgetam/parsing/parse_error.h"
#include "budgetam/parsing/record_builder.h"
#include "budgetam/parsing/row_classifier.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace budgetam::parsing {

struct ParseOptions {
  domain::SourceType source_type{domain::SourceType::kBudgetLaw};
  int year{0};  // NOLINT(readability-identifier-naming)
};

struct ParseOutput {
  std::vector<domain::FlattenedRecord> records;  // NOLINT(readability-identifier-naming)
  domain::OverallTotals overall;                 // NOLINT(readability-identifier-naming)
  domain::Layout layout{domain::Layout::kClassic};
};

using ParseResult = core::Result<ParseOutput, ParseError>;

// ParserStateMachine makes one forward pass over a sheet. Each row is classified,
// the processing state advances, and data is extracted only on these pairs:
//   (Ready, GrandTotal)              overall totals
//   (StateBody, StateBodyHeader)     state body name and amounts
//   (Program, ProgramHeader)         program code, amounts and description block
//   (Subprogram, SubprogramHeader)   one flattened record
// The 2025 layout has no subprogram marker and accepts subprograms in any state
// after the grand total. The plan emits one record per program.
//
// Single use: construct, call run() once.
class ParserStateMachine {
 public:
  ParserStateMachine(const ingest::Sheet& sheet, ParseOptions options,
                     ParseDiagnostics& diagnostics);

  [[nodiscard]] ParseResult run();

 private:
  // Each handler returns the next row to classify, or an error.
  using Step = core::Result<std::size_t, ParseError>;

  Step on_grand_total(std::size_t index, const ingest::RawRow& row);
  Step on_state_body(std::size_t index, const ingest::RawRow& row);
  Step on_program(std::size_t index, const ingest::RawRow& row);
  Step on_subprogram(std::size_t index, const ingest::RawRow& row);

  void skip_row(std::size_t index, const std::string& reason);

  const ingest::Sheet& sheet_;
  ParseOptions options_;
  ParseDiagnostics& diagnostics_;
  domain::Layout layout_;
  domain::SourceKind kind_;
  std::unique_ptr<IRowClassifier> classifier_;
  DetailCollector collector_;

  ProcessingState state_{ProcessingState::kInit};
  HierarchyContext context_;
  std::optional<domain::OverallTotals> overall_;
  bool program_skipped_{false};  // last program header had a malformed code
  std::vector<domain::FlattenedRecord> records_;
};

// Parse the first sheet of a workbook into flattened records and overall totals.
[[nodiscard]] ParseResult parse_sheet(const ingest::Sheet& sheet, const ParseOptions& options,
                                      ParseDiagnostics& diagnostics);

}  // namespace budgetam::parsing
