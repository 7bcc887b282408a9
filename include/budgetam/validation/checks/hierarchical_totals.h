#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// hierarchical_totals: for each currency field,
//   overall          == sum of distinct state bodies
//   each state body  == sum of its distinct programs
//   each program     == sum of its subprograms (three-level sources only)
// within the absolute tolerance of the source type. One result per comparison per field.
class HierarchicalTotalsCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "hierarchical_totals"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Totals sum correctly across hierarchy levels";
  }

  [[nodiscard]] bool applies_to(domain::SourceType /*type*/) const noexcept override {
    return true;
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
