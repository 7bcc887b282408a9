#pragma once

#include "budgetam/app/app_service.h"
#include "budgetam/core/clock.h"
#include "budgetam/storage/dataset_store.h"

// execute_parse: run the parse pipeline, persist when a store is given, print a JSON summary.
// Takes only interface types; store may be null.
int execute_parse(const budgetam::app::ParsePipelineRequest& req,
                  budgetam::storage::IDatasetStore* store,
                  const budgetam::core::ReportClock& clock);
