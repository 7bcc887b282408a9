#include "budgetam/validation/report_renderer.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>
#include <utility>
#include <vector>

namespace budgetam::validation {

namespace {

constexpr const char* kErrorIcon = "❌";
constexpr const char* kWarningIcon = "⚠️";
constexpr const char* kPassIcon = "✅";

std::string file_name(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

// Failed results of one severity merged per check id, in first-seen order.
struct CheckGroup {
  std::string check_id;
  int fail_count{0};
  std::vector<std::string> messages;
};

std::vector<CheckGroup> group_failures(const std::vector<CheckResult>& failed) {
  std::vector<CheckGroup> groups;
  for (const auto& result : failed) {
    auto it = std::find_if(groups.begin(), groups.end(), [&result](const CheckGroup& group) {
      return group.check_id == result.check_id();
    });
    if (it == groups.end()) {
      groups.push_back(CheckGroup{result.check_id(), 0, {}});
      it = std::prev(groups.end());
    }
    it->fail_count += result.fail_count();
    it->messages.insert(it->messages.end(), result.messages().begin(), result.messages().end());
  }
  return groups;
}

// Check ids none of whose results failed, in first-seen order.
std::vector<std::string> passed_check_ids(const std::vector<CheckResult>& results) {
  std::vector<std::string> ids;
  for (const auto& result : results) {
    if (std::find(ids.begin(), ids.end(), result.check_id()) != ids.end()) {
      continue;
    }
    const bool any_failed =
        std::any_of(results.begin(), results.end(), [&result](const CheckResult& other) {
          return other.check_id() == result.check_id() && !other.passed();
        });
    if (!any_failed) {
      ids.push_back(result.check_id());
    }
  }
  return ids;
}

nlohmann::json result_to_json(const CheckResult& result) {
  return nlohmann::json{{"check_id", result.check_id()},
                        {"severity", std::string{severity_name(result.severity())}},
                        {"fail_count", result.fail_count()},
                        {"messages", result.messages()}};
}

nlohmann::json failed_bucket(std::vector<CheckResult> failed) {
  std::stable_sort(failed.begin(), failed.end(), [](const CheckResult& a, const CheckResult& b) {
    return a.fail_count() > b.fail_count();
  });
  nlohmann::json bucket = nlohmann::json::array();
  for (const auto& result : failed) {
    bucket.push_back(result_to_json(result));
  }
  return bucket;
}

void write_group_section(std::ostringstream& out, const std::string& heading, const char* icon,
                         const std::vector<CheckResult>& failed) {
  out << "## " << heading << "\n\n";
  for (const auto& group : group_failures(failed)) {
    out << "### " << icon << " " << group.check_id << " (" << group.fail_count
        << " failures)\n\n";
    for (const auto& message : group.messages) {
      out << "- " << message << "\n";
    }
    out << "\n";
  }
}

}  // namespace

std::string render_console(const ValidationReport& report) {
  const std::size_t total = report.total_count();
  const std::size_t passed = report.passed_count();

  std::ostringstream out;
  out << "Validation Summary:\n"
      << "  Source: " << domain::source_type_to_string(report.source_type()) << " ("
      << file_name(report.source_path()) << ")\n"
      << "  Checks: " << total << " total, " << passed << " passed, " << (total - passed)
      << " failed\n"
      << "  Errors: " << report.error_count() << "\n"
      << "  Warnings: " << report.warning_count() << "\n\n";

  const auto failed = report.failed_checks();
  if (failed.empty()) {
    out << kPassIcon << " All validation checks passed!\n";
    return out.str();
  }

  out << "Failed Checks:\n";
  for (const auto& result : failed) {
    const char* icon = result.severity() == Severity::kError ? kErrorIcon : kWarningIcon;
    out << icon << " " << result.check_id() << " (" << severity_name(result.severity())
        << "): " << result.fail_count() << " failures\n";
    for (const auto& message : result.messages()) {
      out << "   - " << message << "\n";
    }
  }
  return out.str();
}

std::string render_markdown(const ValidationReport& report, const ReportMetadata& metadata) {
  const std::size_t total = report.total_count();
  const std::size_t passed = report.passed_count();
  const auto errors = report.failed_checks(Severity::kError);
  const auto warnings = report.failed_checks(Severity::kWarning);

  std::ostringstream out;
  out << "# Validation Report: " << file_name(report.source_path()) << "\n\n"
      << "**Source Type:** " << domain::source_type_to_string(report.source_type()) << "\n"
      << "**File:** " << report.source_path() << "\n"
      << "Generated: " << metadata.generated_at << "\n\n";

  out << "## Summary\n\n"
      << "- **Total Checks:** " << total << "\n"
      << "- **Passed:** " << passed << " " << kPassIcon << "\n"
      << "- **Failed:** " << (total - passed) << " " << kErrorIcon << "\n"
      << "- **Errors:** " << report.error_count() << "\n"
      << "- **Warnings:** " << report.warning_count() << "\n\n";

  if (errors.empty() && warnings.empty()) {
    out << "## " << kPassIcon << " All Checks Passed\n\n"
        << "No validation issues found.\n\n";
  }
  if (!errors.empty()) {
    write_group_section(out, std::string{kErrorIcon} + " Errors", kErrorIcon, errors);
  }
  if (!warnings.empty()) {
    write_group_section(out, std::string{kWarningIcon} + " Warnings", kWarningIcon, warnings);
  }

  const auto passed_ids = passed_check_ids(report.results());
  if (!passed_ids.empty()) {
    out << "## " << kPassIcon << " Passed Checks\n\n";
    for (const auto& id : passed_ids) {
      out << "- **" << id << "**\n";
    }
    out << "\n";
  }

  out << "---\n\n"
      << "For detailed information about validation checks, see the budgetam validation "
         "reference.\n";
  return out.str();
}

nlohmann::json render_json(const ValidationReport& report, const ReportMetadata& metadata) {
  const auto errors = report.failed_checks(Severity::kError);
  const auto warnings = report.failed_checks(Severity::kWarning);

  nlohmann::json passed = nlohmann::json::array();
  for (const auto& result : report.results()) {
    if (result.passed()) {
      passed.push_back(result_to_json(result));
    }
  }

  nlohmann::json j;
  j["metadata"] = {{"source_type", domain::source_type_to_string(report.source_type())},
                   {"source_path", report.source_path()},
                   {"fingerprint", metadata.fingerprint},
                   {"generated_at", metadata.generated_at}};
  j["summary"] = {{"total", report.total_count()},
                  {"passed", report.passed_count()},
                  {"with_warnings", warnings.size()},
                  {"with_errors", errors.size()},
                  {"error_count", report.error_count()},
                  {"warning_count", report.warning_count()}};
  j["passed_checks"] = std::move(passed);
  j["warning_checks"] = failed_bucket(warnings);
  j["error_checks"] = failed_bucket(errors);
  return j;
}

}  // namespace budgetam::validation
