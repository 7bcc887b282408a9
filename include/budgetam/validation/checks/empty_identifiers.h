#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// empty_identifiers: counts rows with a blank state_body, program_name or subprogram_name.
// One result per level; the subprogram level is skipped for the medium-term plan.
class EmptyIdentifiersCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "empty_identifiers"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Rows must carry a state body, program name and subprogram name";
  }

  [[nodiscard]] bool applies_to(domain::SourceType /*type*/) const noexcept override {
    return true;
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
