#pragma once

#include <optional>
#include <string>
#include <utility>

namespace budgetam::core {

// ReportClock stamps validation reports and stored datasets with generated_at.
// A pinned clock returns the same instant on every call, so reports built from the
// same inputs are byte-identical.
class ReportClock {
 public:
  ReportClock() = default;
  explicit ReportClock(std::string pinned_utc) : pinned_utc_(std::move(pinned_utc)) {}

  // ISO 8601 UTC, second precision ("2026-01-01T00:00:00Z").
  [[nodiscard]] std::string now_iso8601() const;

 private:
  std::optional<std::string> pinned_utc_;
};

}  // namespace budgetam::core
