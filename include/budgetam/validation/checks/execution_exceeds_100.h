#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// execution_exceeds_100: execution rates above 1.0. Overspending against a revised plan can
// be legitimate, so every level is a warning.
class ExecutionExceeds100Check final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "execution_exceeds_100"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Execution rates above 100% are flagged";
  }

  [[nodiscard]] bool applies_to(const domain::SourceType type) const noexcept override {
    return domain::is_spending(type);
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
