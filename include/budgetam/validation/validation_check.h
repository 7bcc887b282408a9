#pragma once

#include "budgetam/domain/budget_record.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/validation/check_result.h"

#include <string_view>
#include <vector>

namespace budgetam::validation {

// ValidationCheck is the abstract base class for dataset checks.
// A check is a pure function of (records, overall, source type): it never mutates
// its inputs and never aborts the run. Failures are reported as CheckResults.
class ValidationCheck {
 public:
  virtual ~ValidationCheck() = default;

  [[nodiscard]] virtual std::string_view check_id() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  [[nodiscard]] virtual bool applies_to(domain::SourceType type) const noexcept = 0;

  [[nodiscard]] virtual std::vector<CheckResult> validate(
      const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
      domain::SourceType type) const = 0;

 protected:
  ValidationCheck() = default;
  ValidationCheck(const ValidationCheck&) = default;
  ValidationCheck& operator=(const ValidationCheck&) = default;
  ValidationCheck(ValidationCheck&&) = default;
  ValidationCheck& operator=(ValidationCheck&&) = default;
};

}  // namespace budgetam::validation
