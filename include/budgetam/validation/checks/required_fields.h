#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// required_fields: every amount field the source kind defines is carried by each record
// level and by the overall totals, plus the three plan years for the medium-term plan.
// One aggregated result (error).
class RequiredFieldsCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "required_fields"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Every field of the source kind is present on records and overall totals";
  }

  [[nodiscard]] bool applies_to(domain::SourceType /*type*/) const noexcept override {
    return true;
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
