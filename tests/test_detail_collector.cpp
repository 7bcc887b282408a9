#include "budgetam/parsing/detail_collector.h"
#include "budgetam/parsing/parse_diagnostics.h"
#include "budgetam/parsing/row_classifier.h"

#include <catch2/catch_test_macros.hpp>

#include "support/sheet_fixtures.h"

using namespace budgetam::parsing;
using namespace budgetam::testing;

TEST_CASE("Strict collection reads a program description block", "[parsing][detail]") {
  const auto sheet = make_sheet({
      {"1004", "", "Program", "300"},
      {"", "", "Education"},
      {"", "", kProgramGoalLabel},
      {"", "", "Literacy"},
      {"", "", kProgramResultLabel},
      {"", "", "Schools built"},
      {"", "", kSubprogramMarkerLabel},
  });
  const ClassicRowClassifier classifier(4);
  const DetailCollector collector(sheet, classifier);
  ParseDiagnostics diagnostics;

  const auto result = collector.collect_strict(1, DetailLevel::kProgram, diagnostics);
  REQUIRE(result.has_value());
  REQUIRE(result.value().lines[0] == "Education");
  REQUIRE(result.value().lines[2] == "Literacy");
  REQUIRE(result.value().lines[4] == "Schools built");
  REQUIRE(result.value().next_row == 6);
  REQUIRE(diagnostics.empty());
}

TEST_CASE("Strict collection fails on a label mismatch", "[parsing][detail]") {
  const auto sheet = make_sheet({
      {"", "", "Name"},
      {"", "", "Something else"},
      {"", "", "Goal"},
      {"", "", kProgramResultLabel},
      {"", "", "Result"},
  });
  const ClassicRowClassifier classifier(4);
  const DetailCollector collector(sheet, classifier);
  ParseDiagnostics diagnostics;

  const auto result = collector.collect_strict(0, DetailLevel::kProgram, diagnostics);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().kind == ParseErrorKind::kDetailLabelMismatch);
  REQUIRE(result.error().row == 1);
  REQUIRE(result.error().expected == "ծրագրինպատակը");
  REQUIRE(result.error().found == "Something else");
  REQUIRE(result.error().message ==
          "Row 2: expected label containing 'ծրագրինպատակը', found 'Something else'");
}

TEST_CASE("Strict collection fails when the label row is not a detail line",
          "[parsing][detail]") {
  // The label text is right but the amount column is filled.
  const auto sheet = make_sheet({
      {"", "", "Name"},
      {"", "", kSubprogramDescLabel, "5"},
      {"", "", "Desc"},
      {"", "", kSubprogramTypeLabel},
      {"", "", "Type"},
  });
  const ClassicRowClassifier classifier(4);
  const DetailCollector collector(sheet, classifier);
  ParseDiagnostics diagnostics;

  const auto result = collector.collect_strict(0, DetailLevel::kSubprogram, diagnostics);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().expected == "միջոցառմաննկարագրությունը");
}

TEST_CASE("Value lines are never fatal", "[parsing][detail]") {
  const auto sheet = make_sheet({
      {"", "", "", ""},
      {"", "", kSubprogramDescLabel},
      {"", "5", "Odd row", "7"},
      {"", "", kSubprogramTypeLabel},
  });
  const ClassicRowClassifier classifier(4);
  const DetailCollector collector(sheet, classifier);
  ParseDiagnostics diagnostics;

  // Offset 4 is past the end of the sheet and reads as empty.
  const auto result = collector.collect_strict(0, DetailLevel::kSubprogram, diagnostics);
  REQUIRE(result.has_value());
  REQUIRE(result.value().lines[0].empty());
  REQUIRE(result.value().lines[2] == "Odd row");
  REQUIRE(result.value().lines[4].empty());
  REQUIRE(diagnostics.warnings().size() == 3);
  REQUIRE(diagnostics.warnings()[0].message == "Row 1: name line is empty");
}

TEST_CASE("Lenient collection stops at the next header", "[parsing][detail]") {
  const auto sheet = make_sheet({
      {"1004", "Program", "60", "70", "80"},
      {"", "Program name"},
      {"", "Goal label"},
      {"1005", "Next program", "1", "2", "3"},
  });
  const MtepRowClassifier classifier;
  const DetailCollector collector(sheet, classifier);

  const DetailLines lines = collector.collect_lenient(1);
  REQUIRE(lines.lines[0] == "Program name");
  REQUIRE(lines.lines[1] == "Goal label");
  REQUIRE(lines.lines[2].empty());
  REQUIRE(lines.next_row == 3);
}

TEST_CASE("Lenient collection stops at the sheet end", "[parsing][detail]") {
  const auto sheet = make_sheet({
      {"1004", "Program", "60", "70", "80"},
      {"", "Name"},
  });
  const MtepRowClassifier classifier;
  const DetailCollector collector(sheet, classifier);

  const DetailLines lines = collector.collect_lenient(1);
  REQUIRE(lines.lines[0] == "Name");
  REQUIRE(lines.next_row == 2);
}
