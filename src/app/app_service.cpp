#include "budgetam/app/app_service.h"

#include "budgetam/core/hashing.h"
#include "budgetam/ingest/sheet_adapter.h"
#include "budgetam/validation/check_registry.h"

#include <utility>

namespace budgetam::app {

namespace {

PipelineError make_error(const PipelineStage stage, std::string message) {
  return PipelineError{stage, std::move(message)};
}

}  // namespace

std::string_view pipeline_stage_name(const PipelineStage stage) noexcept {
  switch (stage) {
    case PipelineStage::kRead:
      return "read";
    case PipelineStage::kParse:
      return "parse";
    case PipelineStage::kWrite:
      return "write";
    case PipelineStage::kStore:
      return "store";
  }
  return "unknown";
}

std::string describe(const PipelineError& error) {
  return std::string(pipeline_stage_name(error.stage)) + ": " + error.message;
}

// ────────────────────────────────────────────────────────────────
// Parse Pipeline
// ────────────────────────────────────────────────────────────────

ParsePipelineResult run_parse_pipeline(const ParsePipelineRequest& req) {
  auto bytes = ingest::read_file_bytes(req.input_path);
  if (!bytes.has_value()) {
    return ParsePipelineResult::err(make_error(PipelineStage::kRead, bytes.error()));
  }

  auto adapter = ingest::create_sheet_adapter(req.input_path);
  if (!adapter) {
    return ParsePipelineResult::err(
        make_error(PipelineStage::kRead, "Unsupported workbook format: " + req.input_path));
  }

  auto sheet = adapter->read(bytes.value());
  if (!sheet.has_value()) {
    return ParsePipelineResult::err(make_error(PipelineStage::kRead, sheet.error().message));
  }

  ParsePipelineResponse response;
  response.dataset_id = domain::dataset_id(req.year, req.source_type);
  response.fingerprint = core::fingerprint_bytes(bytes.value());

  const parsing::ParseOptions options{req.source_type, req.year};
  auto parsed = parsing::parse_sheet(sheet.value(), options, response.diagnostics);
  if (!parsed.has_value()) {
    return ParsePipelineResult::err(make_error(PipelineStage::kParse, parsed.error().message));
  }
  response.output = std::move(parsed.value());

  if (req.out_dir.has_value()) {
    auto written = output::write_dataset(*req.out_dir, response.dataset_id,
                                         response.output.records, response.output.overall,
                                         req.source_type, response.output.layout);
    if (!written.has_value()) {
      return ParsePipelineResult::err(make_error(PipelineStage::kWrite, written.error()));
    }
    response.written = std::move(written.value());
  }

  return ParsePipelineResult::ok(std::move(response));
}

// ────────────────────────────────────────────────────────────────
// Validation Pipeline
// ────────────────────────────────────────────────────────────────

ValidatePipelineResult run_validate_pipeline(const ParsePipelineRequest& req, const bool strict,
                                             const core::ReportClock& clock) {
  auto parsed = run_parse_pipeline(req);
  if (!parsed.has_value()) {
    return ValidatePipelineResult::err(parsed.error());
  }

  auto report = validation::run_validation(parsed.value().output.records,
                                           parsed.value().output.overall, req.source_type,
                                           req.input_path);
  validation::ReportMetadata metadata{parsed.value().fingerprint, clock.now_iso8601()};
  const bool failed = report.has_errors(strict);

  return ValidatePipelineResult::ok(ValidatePipelineResponse{
      std::move(parsed.value()), std::move(report), std::move(metadata), failed});
}

// ────────────────────────────────────────────────────────────────
// Persistence
// ────────────────────────────────────────────────────────────────

core::Result<bool, PipelineError> persist_dataset(const ParsePipelineRequest& req,
                                                  const ParsePipelineResponse& parsed,
                                                  storage::IDatasetStore& store,
                                                  const core::ReportClock& clock) {
  storage::StoredDataset dataset;
  dataset.dataset_id = parsed.dataset_id;
  dataset.year = req.year;
  dataset.source_type = req.source_type;
  dataset.source_path = req.input_path;
  dataset.fingerprint = parsed.fingerprint;
  dataset.created_at = clock.now_iso8601();
  dataset.records = parsed.output.records;
  dataset.overall = parsed.output.overall;

  auto saved = store.save(dataset);
  if (!saved.has_value()) {
    return core::Result<bool, PipelineError>::err(
        make_error(PipelineStage::kStore, saved.error()));
  }
  return core::Result<bool, PipelineError>::ok(true);
}

core::Result<bool, PipelineError> persist_validation(const ParsePipelineRequest& req,
                                                     const ValidatePipelineResponse& validated,
                                                     storage::IDatasetStore& store,
                                                     const core::ReportClock& clock) {
  auto dataset = persist_dataset(req, validated.parsed, store, clock);
  if (!dataset.has_value()) {
    return dataset;
  }

  auto saved = store.save_report(validated.parsed.dataset_id,
                                 validation::render_json(validated.report, validated.metadata),
                                 validated.metadata.generated_at);
  if (!saved.has_value()) {
    return core::Result<bool, PipelineError>::err(
        make_error(PipelineStage::kStore, saved.error()));
  }
  return core::Result<bool, PipelineError>::ok(true);
}

}  // namespace budgetam::app
