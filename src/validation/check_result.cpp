#include "budgetam/validation/check_result.h"

#include <stdexcept>
#include <utility>

namespace budgetam::validation {

std::string_view severity_name(const Severity severity) noexcept {
  return severity == Severity::kError ? "error" : "warning";
}

std::optional<Severity> severity_from_name(const std::string_view name) noexcept {
  if (name == "error") {
    return Severity::kError;
  }
  if (name == "warning") {
    return Severity::kWarning;
  }
  return std::nullopt;
}

CheckResult::CheckResult(std::string check_id, const Severity severity, const bool passed,
                         const int fail_count, std::vector<std::string> messages)
    : check_id_(std::move(check_id)),
      severity_(severity),
      passed_(passed),
      fail_count_(fail_count),
      messages_(std::move(messages)) {
  if (fail_count_ < 0) {
    throw std::invalid_argument("CheckResult " + check_id_ + ": negative fail_count");
  }
  if (passed_ != (fail_count_ == 0)) {
    throw std::invalid_argument("CheckResult " + check_id_ +
                                ": passed must hold exactly when fail_count is 0");
  }
}

CheckResult CheckResult::pass(std::string check_id, const Severity severity) {
  return CheckResult(std::move(check_id), severity, true, 0, {});
}

CheckResult CheckResult::fail(std::string check_id, const Severity severity, const int fail_count,
                              std::vector<std::string> messages) {
  return CheckResult(std::move(check_id), severity, false, fail_count, std::move(messages));
}

}  // namespace budgetam::validation
