#pragma once

#include "budgetam/validation/validation_check.h"

namespace budgetam::validation {

// hierarchical_structure_sanity: rejects degenerate extractions of the budget law. Fails when
// every state body has the same number of programs, or when none has more than one.
class HierarchicalStructureSanityCheck final : public ValidationCheck {
 public:
  [[nodiscard]] std::string_view check_id() const noexcept override { return "hierarchical_structure_sanity"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "The hierarchy is not degenerate";
  }

  [[nodiscard]] bool applies_to(const domain::SourceType type) const noexcept override {
    return type == domain::SourceType::kBudgetLaw;
  }

  [[nodiscard]] std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const override;
};

}  // namespace budgetam::validation
