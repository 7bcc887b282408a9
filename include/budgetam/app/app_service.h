#pragma once

#include "budgetam/core/clock.h"
#include "budgetam/core/result.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/output/dataset_writer.h"
#include "budgetam/parsing/parse_diagnostics.h"
#include "budgetam/parsing/parser_state_machine.h"
#include "budgetam/storage/dataset_store.h"
#include "budgetam/validation/report_renderer.h"
#include "budgetam/validation/validation_report.h"

#include <optional>
#include <string>
#include <string_view>

namespace budgetam::app {

// Stage at which a pipeline stopped. Every stage failure is fatal to one workbook only.
enum class PipelineStage {
  kRead,   // file I/O, archive or XML problems
  kParse,  // ParseError from the state machine
  kWrite,  // CSV / JSON output
  kStore,  // SQLite persistence
};

[[nodiscard]] std::string_view pipeline_stage_name(PipelineStage stage) noexcept;

struct PipelineError {
  PipelineStage stage{PipelineStage::kRead};  // NOLINT(readability-identifier-naming)
  std::string message;                        // NOLINT(readability-identifier-naming)
};

// "<stage>: <message>", used for batch reason strings and CLI errors.
[[nodiscard]] std::string describe(const PipelineError& error);

// ────────────────────────────────────────────────────────────────
// Parse Pipeline
// ────────────────────────────────────────────────────────────────

struct ParsePipelineRequest {
  std::string input_path;  // NOLINT(readability-identifier-naming)
  domain::SourceType source_type{domain::SourceType::kBudgetLaw};  // NOLINT
  int year{0};             // NOLINT(readability-identifier-naming)

  // When set, the record CSV and overall JSON are written here.
  std::optional<std::string> out_dir;  // NOLINT(readability-identifier-naming)
};

struct ParsePipelineResponse {
  std::string dataset_id;                      // NOLINT(readability-identifier-naming)
  std::string fingerprint;                     // NOLINT(readability-identifier-naming)
  parsing::ParseOutput output;                 // NOLINT(readability-identifier-naming)
  parsing::ParseDiagnostics diagnostics;       // NOLINT(readability-identifier-naming)
  std::optional<output::WrittenFiles> written;  // NOLINT(readability-identifier-naming)
};

using ParsePipelineResult = core::Result<ParsePipelineResponse, PipelineError>;

// Read the workbook, parse its first sheet and optionally write the outputs.
[[nodiscard]] ParsePipelineResult run_parse_pipeline(const ParsePipelineRequest& req);

// ────────────────────────────────────────────────────────────────
// Validation Pipeline
// ────────────────────────────────────────────────────────────────

struct ValidatePipelineResponse {
  ParsePipelineResponse parsed;                // NOLINT(readability-identifier-naming)
  validation::ValidationReport report;         // NOLINT(readability-identifier-naming)
  validation::ReportMetadata metadata;         // NOLINT(readability-identifier-naming)
  bool failed{false};  // has_errors(strict) of the report
};

using ValidatePipelineResult = core::Result<ValidatePipelineResponse, PipelineError>;

// Parse pipeline followed by the default validation registry.
// metadata.generated_at comes from clock.
[[nodiscard]] ValidatePipelineResult run_validate_pipeline(const ParsePipelineRequest& req,
                                                           bool strict,
                                                           const core::ReportClock& clock);

// ────────────────────────────────────────────────────────────────
// Persistence
// ────────────────────────────────────────────────────────────────

// Upsert the parsed dataset under its dataset_id. created_at comes from clock.
[[nodiscard]] core::Result<bool, PipelineError> persist_dataset(
    const ParsePipelineRequest& req, const ParsePipelineResponse& parsed,
    storage::IDatasetStore& store, const core::ReportClock& clock);

// Persist the dataset and append the JSON rendering of its validation report.
[[nodiscard]] core::Result<bool, PipelineError> persist_validation(
    const ParsePipelineRequest& req, const ValidatePipelineResponse& validated,
    storage::IDatasetStore& store, const core::ReportClock& clock);

}  // namespace budgetam::app
