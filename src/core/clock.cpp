#include "budgetam/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace budgetam::core {

std::string ReportClock::now_iso8601() const {
  if (pinned_utc_.has_value()) {
    return *pinned_utc_;
  }

  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace budgetam::core
