#include "budgetam/validation/checks/hierarchical_totals.h"

#include "budgetam/domain/budget_record.h"
#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

#include <cmath>
#include <utility>

namespace budgetam::validation {

namespace {

using domain::AmountField;
using domain::FlattenedRecord;
using domain::Level;

double value_at(const FlattenedRecord& record, const Level level, const AmountField field) {
  return domain::amount_of(domain::amounts_at(record, level), field).value_or(0.0);
}

std::string mismatch(const std::string& subject, const double expected, const double got,
                     const double diff) {
  return subject + ": expected " + domain::format_number(expected) + ", got " +
         domain::format_number(got) + ", diff " + domain::format_number(diff);
}

}  // namespace

std::vector<CheckResult> HierarchicalTotalsCheck::validate(
    const std::vector<FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  const std::string id{check_id()};
  const double tolerance = hierarchical_tolerance(type);
  const auto state_bodies = distinct_entities(records, Level::kStateBody);
  const auto programs = distinct_entities(records, Level::kProgram);
  std::vector<CheckResult> results;

  for (const AmountField field : domain::currency_fields(domain::source_kind_of(type))) {
    // Overall against the distinct state bodies.
    double state_body_sum = 0.0;
    for (const FlattenedRecord* state_body : state_bodies) {
      state_body_sum += value_at(*state_body, Level::kStateBody, field);
    }
    const double overall_value = domain::amount_of(overall.amounts, field).value_or(0.0);
    const double overall_diff = std::fabs(overall_value - state_body_sum);
    if (overall_diff <= tolerance) {
      results.push_back(CheckResult::pass(id, Severity::kError));
    } else {
      results.push_back(CheckResult::fail(
          id, Severity::kError, 1,
          {mismatch("Overall " + domain::column_name(Level::kOverall, field), state_body_sum,
                    overall_value, overall_diff) +
           " (tolerance " + domain::format_number(tolerance) + ")"}));
    }

    // Each state body against its distinct programs.
    std::vector<std::string> state_body_failures;
    for (const FlattenedRecord* state_body : state_bodies) {
      double program_sum = 0.0;
      for (const FlattenedRecord* program : programs) {
        if (program->state_body == state_body->state_body) {
          program_sum += value_at(*program, Level::kProgram, field);
        }
      }
      const double total = value_at(*state_body, Level::kStateBody, field);
      const double diff = std::fabs(total - program_sum);
      if (diff > tolerance) {
        state_body_failures.push_back(
            mismatch(state_body->state_body + " " + domain::column_name(Level::kStateBody, field),
                     program_sum, total, diff));
      }
    }
    results.push_back(result_from_messages(id, Severity::kError, std::move(state_body_failures)));

    if (!domain::has_subprogram_level(type)) {
      continue;
    }

    // Each program against its subprograms.
    std::vector<std::string> program_failures;
    for (const FlattenedRecord* program : programs) {
      double subprogram_sum = 0.0;
      for (const FlattenedRecord& record : records) {
        if (record.state_body == program->state_body &&
            record.program_code == program->program_code) {
          subprogram_sum += value_at(record, Level::kSubprogram, field);
        }
      }
      const double total = value_at(*program, Level::kProgram, field);
      const double diff = std::fabs(total - subprogram_sum);
      if (diff > tolerance) {
        program_failures.push_back(mismatch(program->state_body + "/" +
                                                std::to_string(program->program_code) + " " +
                                                domain::column_name(Level::kProgram, field),
                                            subprogram_sum, total, diff));
      }
    }
    results.push_back(result_from_messages(id, Severity::kError, std::move(program_failures)));
  }

  return results;
}

}  // namespace budgetam::validation
