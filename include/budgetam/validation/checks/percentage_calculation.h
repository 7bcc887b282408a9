#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// percentage_calculation: reported rate == actual / rev_annual_plan (and actual /
// rev_period_plan for quarterly reports) within kPercentageTolerance. A zero or missing
// denominator cannot be checked and passes. One result per rate for the overall totals and
// for each level.
class PercentageCalculationCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "percentage_calculation"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Reported execution rates match actual / plan";
  }

  [[nodiscard]] bool applies_to(const domain::SourceType type) const noexcept override {
    return domain::is_spending(type);
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
