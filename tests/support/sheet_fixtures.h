#pragma once

#include "budgetam/domain/budget_record.h"
#include "budgetam/ingest/sheet.h"

#include <string>
#include <utility>
#include <vector>

// Builders for in-memory worksheets in the workbook grammars the parser reads.
namespace budgetam::testing {

inline const std::string kGrandTotalLabel = "Ընդամենը";
inline const std::string kSubprogramMarkerLabel = "Ծրագրի միջոցառումներ";
inline const std::string kProgramGoalLabel = "Ծրագրի նպատակը";
inline const std::string kProgramResultLabel = "Վերջնական արդյունքի նկարագրությունը";
inline const std::string kSubprogramDescLabel = "Միջոցառման նկարագրությունը";
inline const std::string kSubprogramTypeLabel = "Միջոցառման տեսակը";

using Cells = std::vector<std::string>;

inline ingest::RawRow raw_row(Cells cells) {
  return ingest::RawRow{std::move(cells)};
}

inline ingest::Sheet make_sheet(const std::vector<Cells>& rows) {
  ingest::Sheet sheet;
  sheet.name = "Sheet1";
  for (const auto& cells : rows) {
    sheet.rows.push_back(ingest::RawRow{cells});
  }
  return sheet;
}

// Classic four-column grammar: col0 program code, col1 subprogram code, col2 text,
// col3.. amounts (one column for budget law, more for spending reports).
class ClassicSheetBuilder {
 public:
  ClassicSheetBuilder& grand_total(const Cells& amounts) {
    return row({"", "", kGrandTotalLabel}, amounts);
  }

  ClassicSheetBuilder& state_body(const std::string& name, const Cells& amounts) {
    return row({"", "", name}, amounts);
  }

  ClassicSheetBuilder& program(const std::string& code, const Cells& amounts,
                               const std::string& name) {
    row({code, "", "Program " + code}, amounts);
    detail(name).detail(kProgramGoalLabel).detail("Goal of " + name);
    detail(kProgramResultLabel).detail("Result of " + name);
    return detail(kSubprogramMarkerLabel);
  }

  ClassicSheetBuilder& subprogram(const std::string& code, const Cells& amounts,
                                  const std::string& name) {
    row({"", code, "Subprogram " + code}, amounts);
    detail(name).detail(kSubprogramDescLabel).detail("Description of " + name);
    return detail(kSubprogramTypeLabel).detail("Service");
  }

  ClassicSheetBuilder& detail(const std::string& text) { return raw({"", "", text}); }

  ClassicSheetBuilder& raw(Cells cells) {
    rows_.push_back(std::move(cells));
    return *this;
  }

  [[nodiscard]] ingest::Sheet build() const { return make_sheet(rows_); }

 private:
  ClassicSheetBuilder& row(Cells head, const Cells& amounts) {
    head.insert(head.end(), amounts.begin(), amounts.end());
    return raw(std::move(head));
  }

  std::vector<Cells> rows_;
};

// Budget-law fixture: grand total 1,000,000; State Body 1 = 600,000 with
// Program 1 = 300,000 (150,000 + 150,000) and Program 2 = 300,000 (300,000);
// State Body 2 = 400,000 with Program 3 = 400,000 (400,000).
inline ClassicSheetBuilder budget_law_fixture() {
  ClassicSheetBuilder builder;
  builder.grand_total({"1000000"})
      .state_body("State Body 1", {"600000"})
      .program("1", {"300000"}, "Program One")
      .subprogram("1", {"150000"}, "Subprogram 1")
      .subprogram("2", {"150000"}, "Subprogram 2")
      .program("2", {"300000"}, "Program Two")
      .subprogram("3", {"300000"}, "Subprogram 3")
      .state_body("State Body 2", {"400000"})
      .program("3", {"400000"}, "Program Three")
      .subprogram("4", {"400000"}, "Subprogram 4");
  return builder;
}

// Flattened record with budget-law totals at every level.
inline domain::FlattenedRecord budget_law_record(const std::string& state_body, int program_code,
                                                 int subprogram_code, double state_body_total,
                                                 double program_total, double subprogram_total) {
  domain::FlattenedRecord record;
  record.state_body = state_body;
  record.program_code = program_code;
  record.program_name = "Program " + std::to_string(program_code);
  record.subprogram_code = subprogram_code;
  record.subprogram_name = "Subprogram " + std::to_string(subprogram_code);
  record.state_body_amounts = domain::BudgetLawAmounts{state_body_total};
  record.program_amounts = domain::BudgetLawAmounts{program_total};
  record.subprogram_amounts = domain::BudgetLawAmounts{subprogram_total};
  return record;
}

// Records and overall totals of budget_law_fixture(), as the parser produces them.
inline std::vector<domain::FlattenedRecord> budget_law_records() {
  return {
      budget_law_record("State Body 1", 1, 1, 600000.0, 300000.0, 150000.0),
      budget_law_record("State Body 1", 1, 2, 600000.0, 300000.0, 150000.0),
      budget_law_record("State Body 1", 2, 3, 600000.0, 300000.0, 300000.0),
      budget_law_record("State Body 2", 3, 4, 400000.0, 400000.0, 400000.0),
  };
}

inline domain::OverallTotals budget_law_overall(double total = 1000000.0) {
  return domain::OverallTotals{domain::BudgetLawAmounts{total}, {}};
}

}  // namespace budgetam::testing
