#include "budgetam/parsing/row_classifier.h"
#include "budgetam/parsing/row_type.h"

#include <catch2/catch_test_macros.hpp>

#include "support/sheet_fixtures.h"

using namespace budgetam::parsing;
using budgetam::testing::raw_row;

TEST_CASE("Classic classifier recognises every row type", "[parsing][classifier]") {
  const ClassicRowClassifier classifier(4);

  REQUIRE(classifier.classify(raw_row({"", "", "", ""})) == RowType::kEmpty);
  REQUIRE(classifier.classify(raw_row({"", "", "Ընդամենը՝", "1000"})) == RowType::kGrandTotal);
  REQUIRE(classifier.classify(raw_row({"", "", "ԾՐԱԳՐԻ ՄԻՋՈՑԱՌՈՒՄՆԵՐ", ""})) ==
          RowType::kSubprogramMarker);
  REQUIRE(classifier.classify(raw_row({"", "", "Ministry", "600"})) == RowType::kStateBodyHeader);
  REQUIRE(classifier.classify(raw_row({"1004", "", "Program", "300"})) ==
          RowType::kProgramHeader);
  REQUIRE(classifier.classify(raw_row({"", "11001", "Subprogram", "150"})) ==
          RowType::kSubprogramHeader);
  REQUIRE(classifier.classify(raw_row({"", "1004-11001", "Subprogram", "150"})) ==
          RowType::kSubprogramHeader);
  REQUIRE(classifier.classify(raw_row({"", "", "Free text", ""})) == RowType::kDetailLine);
  REQUIRE(classifier.classify(raw_row({"x", "y", "", "z"})) == RowType::kUnknown);
}

TEST_CASE("Classic classifier precedence", "[parsing][classifier]") {
  const ClassicRowClassifier classifier(4);

  // The grand total also satisfies the state-body predicate.
  REQUIRE(classifier.classify(raw_row({"", "", "ընդամենը", "1000"})) == RowType::kGrandTotal);
  // A marker anywhere in the first three cells wins over other shapes.
  REQUIRE(classifier.classify(raw_row({"Ծրագրի միջոցառումներ", "", "", ""})) ==
          RowType::kSubprogramMarker);
  // Whitespace-only cells are blank, so the row is empty rather than a detail line.
  REQUIRE(classifier.classify(raw_row({" ", "", "\t", ""})) == RowType::kEmpty);
}

TEST_CASE("Classic classifier rejects malformed subprogram codes", "[parsing][classifier]") {
  const ClassicRowClassifier classifier(4);

  REQUIRE(classifier.classify(raw_row({"", "1-2-3", "Subprogram", "150"})) == RowType::kUnknown);
  REQUIRE(classifier.classify(raw_row({"", "abc", "Subprogram", "150"})) == RowType::kUnknown);
  REQUIRE(classifier.classify(raw_row({"", "12", "Subprogram", "n/a"})) == RowType::kUnknown);

  REQUIRE(is_subprogram_code_cell("12"));
  REQUIRE(is_subprogram_code_cell("1004-12"));
  REQUIRE_FALSE(is_subprogram_code_cell("1004-"));
  REQUIRE_FALSE(is_subprogram_code_cell("a-b"));
}

TEST_CASE("2025 classifier", "[parsing][classifier]") {
  const Budget2025RowClassifier classifier;

  REQUIRE(classifier.classify(raw_row({"ԸՆԴԱՄԵՆԸ", "", "", "", "", "", "1000"})) ==
          RowType::kGrandTotal);
  REQUIRE(classifier.classify(raw_row({"Ministry", "", "", "", "", "", "600"})) ==
          RowType::kStateBodyHeader);
  REQUIRE(classifier.classify(raw_row({"", "1004", "", "Name", "Goal", "Result", "300"})) ==
          RowType::kProgramHeader);
  REQUIRE(classifier.classify(raw_row({"", "", "1004-11", "Name", "Desc", "Type", "150"})) ==
          RowType::kSubprogramHeader);
  REQUIRE(classifier.classify(raw_row({"", "", "", "Text", "", "", ""})) ==
          RowType::kDetailLine);
  REQUIRE(classifier.classify(raw_row({"", "", "", "", "", "", ""})) == RowType::kEmpty);
  // Subprogram header needs a dash in the code cell.
  REQUIRE(classifier.classify(raw_row({"", "", "11", "Name", "Desc", "Type", "150"})) ==
          RowType::kUnknown);
  REQUIRE(classifier.detail_text_column() == 3);
}

TEST_CASE("Plan classifier", "[parsing][classifier]") {
  const MtepRowClassifier classifier;

  REQUIRE(classifier.classify(raw_row({"", "Ընդամենը", "100", "110", "120", ""})) ==
          RowType::kGrandTotal);
  REQUIRE(classifier.classify(raw_row({"Ընդամենը", "", "100", "110", "120", ""})) ==
          RowType::kGrandTotal);
  REQUIRE(classifier.classify(raw_row({"", "Ministry", "100", "110", "120", ""})) ==
          RowType::kStateBodyHeader);
  REQUIRE(classifier.classify(raw_row({"1004", "Program", "60", "70", "80", ""})) ==
          RowType::kProgramHeader);
  REQUIRE(classifier.classify(raw_row({"", "Goal text", "", "", "", ""})) ==
          RowType::kDetailLine);
  // A state body with a missing forecast year is not a header.
  REQUIRE(classifier.classify(raw_row({"", "Ministry", "100", "", "120", ""})) ==
          RowType::kUnknown);
}

TEST_CASE("make_row_classifier picks the layout grammar", "[parsing][classifier]") {
  using budgetam::domain::Layout;
  using budgetam::domain::SourceType;

  REQUIRE(make_row_classifier(Layout::kClassic, SourceType::kBudgetLaw)->width() == 4);
  REQUIRE(make_row_classifier(Layout::kClassic, SourceType::kSpendingQ12)->width() == 10);
  REQUIRE(make_row_classifier(Layout::kClassic, SourceType::kSpendingQ1234)->width() == 7);
  REQUIRE(make_row_classifier(Layout::kBudget2025, SourceType::kBudgetLaw)->width() == 7);
  REQUIRE(make_row_classifier(Layout::kMtep, SourceType::kMtep)->width() == 6);
}

TEST_CASE("State transitions depend only on state and row type", "[parsing][state]") {
  REQUIRE(next_state(ProcessingState::kInit, RowType::kStateBodyHeader) == ProcessingState::kInit);
  REQUIRE(next_state(ProcessingState::kInit, RowType::kGrandTotal) == ProcessingState::kReady);
  REQUIRE(next_state(ProcessingState::kReady, RowType::kStateBodyHeader) ==
          ProcessingState::kStateBody);
  REQUIRE(next_state(ProcessingState::kStateBody, RowType::kProgramHeader) ==
          ProcessingState::kProgram);
  REQUIRE(next_state(ProcessingState::kProgram, RowType::kSubprogramMarker) ==
          ProcessingState::kSubprogram);
  REQUIRE(next_state(ProcessingState::kSubprogram, RowType::kSubprogramHeader) ==
          ProcessingState::kSubprogram);
  REQUIRE(next_state(ProcessingState::kSubprogram, RowType::kDetailLine) ==
          ProcessingState::kSubprogram);
  REQUIRE(next_state(ProcessingState::kSubprogram, RowType::kProgramHeader) ==
          ProcessingState::kProgram);
}
