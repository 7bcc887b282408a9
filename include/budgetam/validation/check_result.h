#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace budgetam::validation {

enum class Severity {
  kWarning,
  kError,
};

// "warning", "error"
[[nodiscard]] std::string_view severity_name(Severity severity) noexcept;
[[nodiscard]] std::optional<Severity> severity_from_name(std::string_view name) noexcept;

// CheckResult is the outcome of one check at one hierarchy level (or one sub-check).
// Invariant: passed == (fail_count == 0). The constructor throws std::invalid_argument
// when it is violated, so an inconsistent result can never be observed.
class CheckResult {
 public:
  CheckResult(std::string check_id, Severity severity, bool passed, int fail_count,
              std::vector<std::string> messages);

  [[nodiscard]] static CheckResult pass(std::string check_id, Severity severity);
  [[nodiscard]] static CheckResult fail(std::string check_id, Severity severity, int fail_count,
                                        std::vector<std::string> messages);

  [[nodiscard]] const std::string& check_id() const noexcept { return check_id_; }
  [[nodiscard]] Severity severity() const noexcept { return severity_; }
  [[nodiscard]] bool passed() const noexcept { return passed_; }
  [[nodiscard]] int fail_count() const noexcept { return fail_count_; }
  [[nodiscard]] const std::vector<std::string>& messages() const noexcept { return messages_; }

 private:
  std::string check_id_;
  Severity severity_;
  bool passed_;
  int fail_count_;
  std::vector<std::string> messages_;
};

}  // namespace budgetam::validation
