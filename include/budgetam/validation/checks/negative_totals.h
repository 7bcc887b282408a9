#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

class NegativeTotalsCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "negative_totals"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Currency amounts must not be negative";
  }

  [[nodiscard]] bool applies_to(domain::SourceType /*type*/) const noexcept override {
    return true;
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
