#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// period_vs_annual: period_plan <= annual_plan and rev_period_plan <= rev_annual_plan for
// the overall totals and at each level. Quarterly reports with period columns only.
//
// A pair violates when annual >= 0 and period > annual, when annual < 0 and period < annual,
// or when the signs differ and period != 0. A violation is strict when both operands are
// non-negative and it is either the revised pair or a plain pair whose revised pair also
// violates. A level with only non-strict violations is reported as a warning.
class PeriodVsAnnualCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "period_vs_annual"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Period plans must not exceed annual plans";
  }

  [[nodiscard]] bool applies_to(const domain::SourceType type) const noexcept override {
    return domain::has_period_fields(type);
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
