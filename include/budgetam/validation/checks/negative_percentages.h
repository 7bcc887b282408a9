#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

class NegativePercentagesCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "negative_percentages"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Execution rates must not be negative";
  }

  [[nodiscard]] bool applies_to(const domain::SourceType type) const noexcept override {
    return domain::is_spending(type);
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
