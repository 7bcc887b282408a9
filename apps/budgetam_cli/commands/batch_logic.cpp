#include "batch_logic.h"

#include "command_support.h"
#include <iostream>

int execute_batch(const std::vector<budgetam::app::BatchItem>& items,
                  const budgetam::app::BatchOptions& options,
                  const budgetam::core::ReportClock& clock) {
  std::cerr << "Running batch of " << items.size() << " workbooks"
            << (options.strict ? " (strict)" : "") << "\n";

  const auto outcomes = budgetam::app::run_batch(items, options, clock);
  for (const auto& outcome : outcomes) {
    std::cout << budgetam::app::format_outcome(outcome) << "\n";
  }

  const auto failures = budgetam::app::count_failures(outcomes);
  std::cout << outcomes.size() << " processed, " << outcomes.size() - failures << " ok, "
            << failures << " failed\n";

  return failures == 0 ? kExitOk : kExitFailure;
}
