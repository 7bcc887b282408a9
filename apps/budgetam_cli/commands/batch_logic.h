#pragma once

#include "budgetam/app/batch_runner.h"
#include "budgetam/core/clock.h"

#include <vector>

// execute_batch: run all items, print one OK/FAIL line per item and a summary line.
// Returns 1 when any item failed.
int execute_batch(const std::vector<budgetam::app::BatchItem>& items,
                  const budgetam::app::BatchOptions& options,
                  const budgetam::core::ReportClock& clock);
