#pragma once

#include "budgetam/app/app_service.h"
#include "budgetam/core/clock.h"
#include "budgetam/storage/dataset_store.h"

#include <optional>
#include <string>

struct ValidateOutputs {
  std::optional<std::string> report_md;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> report_json;  // NOLINT(readability-identifier-naming)
};

// execute_validate: print the console report, write requested report files and persist.
// Returns 1 when the report fails (warnings count under strict). store may be null.
int execute_validate(const budgetam::app::ParsePipelineRequest& req, bool strict,
                     const ValidateOutputs& outputs, budgetam::storage::IDatasetStore* store,
                     const budgetam::core::ReportClock& clock);
