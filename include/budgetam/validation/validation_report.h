#pragma once

#include "budgetam/domain/source_type.h"
#include "budgetam/validation/check_result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace budgetam::validation {

// ValidationReport aggregates the results of one validation run over one dataset.
// It is built once and never modified.
class ValidationReport {
 public:
  ValidationReport(domain::SourceType source_type, std::string source_path,
                   std::vector<CheckResult> results);

  [[nodiscard]] domain::SourceType source_type() const noexcept { return source_type_; }
  [[nodiscard]] const std::string& source_path() const noexcept { return source_path_; }
  [[nodiscard]] const std::vector<CheckResult>& results() const noexcept { return results_; }

  // Any failed error-severity result; with strict, failed warnings count too.
  [[nodiscard]] bool has_errors(bool strict = false) const noexcept;

  // Sum of fail_count over failed results of each severity.
  [[nodiscard]] int error_count() const noexcept;
  [[nodiscard]] int warning_count() const noexcept;

  [[nodiscard]] std::size_t total_count() const noexcept { return results_.size(); }
  [[nodiscard]] std::size_t passed_count() const noexcept;

  // Failed results in run order, optionally only those of one severity.
  [[nodiscard]] std::vector<CheckResult> failed_checks(
      std::optional<Severity> severity = std::nullopt) const;

 private:
  domain::SourceType source_type_;
  std::string source_path_;
  std::vector<CheckResult> results_;
};

}  // namespace budgetam::validation
