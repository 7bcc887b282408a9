#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// missing_financial_data: null (not merely zero) amounts in the overall totals and at each
// level. One result for the overall totals and one per level.
class MissingFinancialDataCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "missing_financial_data"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Financial cells must not be null";
  }

  [[nodiscard]] bool applies_to(domain::SourceType /*type*/) const noexcept override {
    return true;
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
