#include "budgetam/validation/validation_report.h"

#include <algorithm>
#include <utility>

namespace budgetam::validation {

namespace {

int failures_of(const std::vector<CheckResult>& results, const Severity severity) {
  int count = 0;
  for (const auto& result : results) {
    if (!result.passed() && result.severity() == severity) {
      count += result.fail_count();
    }
  }
  return count;
}

}  // namespace

ValidationReport::ValidationReport(const domain::SourceType source_type, std::string source_path,
                                   std::vector<CheckResult> results)
    : source_type_(source_type),
      source_path_(std::move(source_path)),
      results_(std::move(results)) {}

bool ValidationReport::has_errors(const bool strict) const noexcept {
  return std::any_of(results_.begin(), results_.end(), [strict](const CheckResult& result) {
    if (result.passed()) {
      return false;
    }
    return result.severity() == Severity::kError || strict;
  });
}

int ValidationReport::error_count() const noexcept {
  return failures_of(results_, Severity::kError);
}

int ValidationReport::warning_count() const noexcept {
  return failures_of(results_, Severity::kWarning);
}

std::size_t ValidationReport::passed_count() const noexcept {
  return static_cast<std::size_t>(std::count_if(
      results_.begin(), results_.end(), [](const CheckResult& result) { return result.passed(); }));
}

std::vector<CheckResult> ValidationReport::failed_checks(
    const std::optional<Severity> severity) const {
  std::vector<CheckResult> failed;
  for (const auto& result : results_) {
    if (!result.passed() && (!severity.has_value() || result.severity() == severity.value())) {
      failed.push_back(result);
    }
  }
  return failed;
}

}  // namespace budgetam::validation
