#include "budgetam/validation/check_registry.h"

#include "budgetam/validation/checks/empty_identifiers.h"
#include "budgetam/validation/checks/execution_exceeds_100.h"
#include "budgetam/validation/checks/hierarchical_structure_sanity.h"
#include "budgetam/validation/checks/hierarchical_totals.h"
#include "budgetam/validation/checks/missing_financial_data.h"
#include "budgetam/validation/checks/negative_percentages.h"
#include "budgetam/validation/checks/negative_totals.h"
#include "budgetam/validation/checks/percentage_calculation.h"
#include "budgetam/validation/checks/period_vs_annual.h"
#include "budgetam/validation/checks/required_fields.h"

#include <iterator>
#include <memory>
#include <utility>

namespace budgetam::validation {

CheckRegistry make_default_registry() {
  CheckRegistry registry;
  // Fixed evaluation order (deterministic reports)
  registry.push_back(std::make_unique<RequiredFieldsCheck>());
  registry.push_back(std::make_unique<EmptyIdentifiersCheck>());
  registry.push_back(std::make_unique<MissingFinancialDataCheck>());
  registry.push_back(std::make_unique<HierarchicalTotalsCheck>());
  registry.push_back(std::make_unique<NegativeTotalsCheck>());
  registry.push_back(std::make_unique<PeriodVsAnnualCheck>());
  registry.push_back(std::make_unique<NegativePercentagesCheck>());
  registry.push_back(std::make_unique<ExecutionExceeds100Check>());
  registry.push_back(std::make_unique<PercentageCalculationCheck>());
  registry.push_back(std::make_unique<HierarchicalStructureSanityCheck>());
  return registry;
}

std::vector<CheckResult> run_checks(const CheckRegistry& registry,
                                    const std::vector<domain::FlattenedRecord>& records,
                                    const domain::OverallTotals& overall,
                                    const domain::SourceType type) {
  std::vector<CheckResult> results;
  for (const auto& check : registry) {
    if (!check || !check->applies_to(type)) {
      continue;
    }
    auto check_results = check->validate(records, overall, type);
    results.insert(results.end(), std::make_move_iterator(check_results.begin()),
                   std::make_move_iterator(check_results.end()));
  }
  return results;
}

ValidationReport run_validation(const std::vector<domain::FlattenedRecord>& records,
                                const domain::OverallTotals& overall,
                                const domain::SourceType type, std::string source_path) {
  const CheckRegistry registry = make_default_registry();
  return ValidationReport(type, std::move(source_path),
                          run_checks(registry, records, overall, type));
}

}  // namespace budgetam::validation
