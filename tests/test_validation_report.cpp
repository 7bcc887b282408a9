#include "budgetam/core/clock.h"
#include "budgetam/validation/check_registry.h"
#include "budgetam/validation/report_renderer.h"
#include "budgetam/validation/validation_report.h"

#include <catch2/catch_test_macros.hpp>

#include "support/sheet_fixtures.h"

#include <set>
#include <string>

using namespace budgetam;
using namespace budgetam::validation;

namespace {

ValidationReport mixed_report() {
  return ValidationReport(
      domain::SourceType::kBudgetLaw, "data/2023/2023.xlsx",
      {
          CheckResult::pass("required_fields", Severity::kError),
          CheckResult::fail("hierarchical_totals", Severity::kError, 2, {"first", "second"}),
          CheckResult::fail("negative_totals", Severity::kWarning, 1, {"third"}),
          CheckResult::fail("hierarchical_totals", Severity::kError, 1, {"fourth"}),
          CheckResult::pass("negative_totals", Severity::kWarning),
      });
}

ReportMetadata fixed_metadata() {
  core::ReportClock clock("2026-01-01T00:00:00Z");
  return ReportMetadata{"abc123", clock.now_iso8601()};
}

bool contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("Report counts failures by severity", "[validation][report]") {
  const auto report = mixed_report();

  REQUIRE(report.total_count() == 5);
  REQUIRE(report.passed_count() == 2);
  REQUIRE(report.error_count() == 3);
  REQUIRE(report.warning_count() == 1);
  REQUIRE(report.has_errors());
  REQUIRE(report.failed_checks().size() == 3);
  REQUIRE(report.failed_checks(Severity::kWarning).size() == 1);
}

TEST_CASE("Strict mode promotes warnings", "[validation][report]") {
  const ValidationReport report(
      domain::SourceType::kSpendingQ1, "q1.xlsx",
      {CheckResult::fail("execution_exceeds_100", Severity::kWarning, 1, {"rate"})});

  REQUIRE_FALSE(report.has_errors());
  REQUIRE(report.has_errors(true));
}

TEST_CASE("Default registry runs in a fixed order", "[validation][registry]") {
  const auto registry = make_default_registry();
  std::vector<std::string> ids;
  for (const auto& check : registry) {
    ids.emplace_back(check->check_id());
  }

  REQUIRE(ids == std::vector<std::string>{
                     "required_fields", "empty_identifiers", "missing_financial_data",
                     "hierarchical_totals", "negative_totals", "period_vs_annual",
                     "negative_percentages", "execution_exceeds_100", "percentage_calculation",
                     "hierarchical_structure_sanity"});
}

TEST_CASE("Only applicable checks contribute results", "[validation][registry]") {
  const auto registry = make_default_registry();
  const auto results = run_checks(registry, testing::budget_law_records(),
                                  testing::budget_law_overall(), domain::SourceType::kBudgetLaw);

  std::set<std::string> ids;
  for (const auto& result : results) {
    ids.insert(result.check_id());
  }
  REQUIRE(ids == std::set<std::string>{"required_fields", "empty_identifiers",
                                       "missing_financial_data", "hierarchical_totals",
                                       "negative_totals", "hierarchical_structure_sanity"});
  REQUIRE(results.front().check_id() == "required_fields");
  REQUIRE(results.back().check_id() == "hierarchical_structure_sanity");
}

TEST_CASE("Console rendering", "[validation][render]") {
  SECTION("failures are listed with their messages") {
    const std::string text = render_console(mixed_report());

    REQUIRE(contains(text, "Validation Summary:\n"
                           "  Source: BUDGET_LAW (2023.xlsx)\n"
                           "  Checks: 5 total, 2 passed, 3 failed\n"
                           "  Errors: 3\n"
                           "  Warnings: 1\n"));
    REQUIRE(contains(text, "hierarchical_totals (error): 2 failures\n   - first\n   - second\n"));
    REQUIRE(contains(text, "negative_totals (warning): 1 failures\n   - third\n"));
  }

  SECTION("clean report") {
    const ValidationReport report(domain::SourceType::kMtep, "plan.xlsx",
                                  {CheckResult::pass("required_fields", Severity::kError)});
    REQUIRE(contains(render_console(report), "All validation checks passed!"));
  }
}

TEST_CASE("Markdown rendering groups failures per check", "[validation][render]") {
  const std::string text = render_markdown(mixed_report(), fixed_metadata());

  REQUIRE(text.rfind("# Validation Report: 2023.xlsx\n", 0) == 0);
  REQUIRE(contains(text, "**Source Type:** BUDGET_LAW\n"));
  REQUIRE(contains(text, "**File:** data/2023/2023.xlsx\n"));
  REQUIRE(contains(text, "Generated: 2026-01-01T00:00:00Z\n"));
  REQUIRE(contains(text, "- **Errors:** 3\n"));
  REQUIRE(contains(text, "hierarchical_totals (3 failures)\n\n- first\n- second\n- fourth\n"));
  REQUIRE(contains(text, "negative_totals (1 failures)\n\n- third\n"));

  // A check with any failed result is not listed as passed.
  REQUIRE(contains(text, "- **required_fields**\n"));
  REQUIRE_FALSE(contains(text, "- **negative_totals**\n"));
  REQUIRE_FALSE(contains(text, "All Checks Passed"));
}

TEST_CASE("JSON rendering", "[validation][render]") {
  const auto j = render_json(mixed_report(), fixed_metadata());

  REQUIRE(j["metadata"]["source_type"] == "BUDGET_LAW");
  REQUIRE(j["metadata"]["source_path"] == "data/2023/2023.xlsx");
  REQUIRE(j["metadata"]["fingerprint"] == "abc123");
  REQUIRE(j["metadata"]["generated_at"] == "2026-01-01T00:00:00Z");

  REQUIRE(j["summary"]["total"] == 5);
  REQUIRE(j["summary"]["passed"] == 2);
  REQUIRE(j["summary"]["with_errors"] == 2);
  REQUIRE(j["summary"]["with_warnings"] == 1);
  REQUIRE(j["summary"]["error_count"] == 3);
  REQUIRE(j["summary"]["warning_count"] == 1);

  REQUIRE(j["passed_checks"].size() == 2);
  REQUIRE(j["warning_checks"].size() == 1);

  const auto& errors = j["error_checks"];
  REQUIRE(errors.size() == 2);
  REQUIRE(errors[0]["fail_count"] == 2);
  REQUIRE(errors[0]["severity"] == "error");
  REQUIRE(errors[0]["messages"] == nlohmann::json::array({"first", "second"}));
  REQUIRE(errors[1]["fail_count"] == 1);
}

TEST_CASE("Rendering is deterministic under a fixed clock", "[validation][render]") {
  const auto report = mixed_report();

  REQUIRE(render_markdown(report, fixed_metadata()) == render_markdown(report, fixed_metadata()));
  REQUIRE(render_json(report, fixed_metadata()).dump() ==
          render_json(report, fixed_metadata()).dump());
}

TEST_CASE("JSON text replaces invalid UTF-8 in messages", "[validation][render]") {
  const ValidationReport report(
      domain::SourceType::kBudgetLaw, "cp1251.csv",
      {CheckResult::fail("negative_totals", Severity::kWarning, 1,
                         {"Subprogram violation for \xCC\xE8\xED | 1 | 2"})});

  const std::string text = domain::json_text(render_json(report, fixed_metadata()));
  REQUIRE(contains(text, "Subprogram violation for \xEF\xBF\xBD"));
  REQUIRE(contains(text, " | 1 | 2"));
  REQUIRE(nlohmann::json::parse(text)["summary"]["warning_count"] == 1);
}
