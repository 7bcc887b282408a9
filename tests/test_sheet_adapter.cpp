#include "budgetam/ingest/sheet.h"
#include "budgetam/ingest/sheet_adapter.h"

#include <catch2/catch_test_macros.hpp>

#include <zip.h>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

using namespace budgetam::ingest;

namespace {

std::vector<uint8_t> to_bytes(const std::string& text) {
  return {text.begin(), text.end()};
}

// Build an xlsx archive in memory from (entry name, content) pairs.
std::vector<uint8_t> make_zip(const std::vector<std::pair<std::string, std::string>>& entries) {
  zip_error_t error;
  zip_error_init(&error);
  zip_source_t* archive_source = zip_source_buffer_create(nullptr, 0, 0, &error);
  REQUIRE(archive_source != nullptr);
  zip_t* archive = zip_open_from_source(archive_source, ZIP_TRUNCATE, &error);
  REQUIRE(archive != nullptr);
  zip_source_keep(archive_source);

  for (const auto& [name, content] : entries) {
    zip_source_t* entry = zip_source_buffer(archive, content.data(), content.size(), 0);
    REQUIRE(entry != nullptr);
    REQUIRE(zip_file_add(archive, name.c_str(), entry, ZIP_FL_OVERWRITE) >= 0);
  }
  REQUIRE(zip_close(archive) == 0);

  REQUIRE(zip_source_open(archive_source) == 0);
  REQUIRE(zip_source_seek(archive_source, 0, SEEK_END) == 0);
  const zip_int64_t size = zip_source_tell(archive_source);
  REQUIRE(zip_source_seek(archive_source, 0, SEEK_SET) == 0);
  std::vector<uint8_t> bytes(static_cast<std::size_t>(size));
  REQUIRE(zip_source_read(archive_source, bytes.data(), static_cast<zip_uint64_t>(size)) == size);
  zip_source_close(archive_source);
  zip_source_free(archive_source);
  zip_error_fini(&error);
  return bytes;
}

const std::string kWorkbookXml = R"(<?xml version="1.0" encoding="UTF-8"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
          xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
  <sheets>
    <sheet name="Budget" sheetId="1" r:id="rId7"/>
    <sheet name="Other" sheetId="2" r:id="rId8"/>
  </sheets>
</workbook>)";

const std::string kWorkbookRels = R"(<?xml version="1.0" encoding="UTF-8"?>
<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
  <Relationship Id="rId8" Target="worksheets/sheet2.xml"/>
  <Relationship Id="rId7" Target="worksheets/budget.xml"/>
</Relationships>)";

const std::string kSharedStrings = R"(<?xml version="1.0" encoding="UTF-8"?>
<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
  <si><t>Ընդամենը</t></si>
  <si><r><t>State </t></r><r><t>Body 1</t></r></si>
</sst>)";

const std::string kBudgetSheet = R"(<?xml version="1.0" encoding="UTF-8"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
  <sheetData>
    <row r="1">
      <c r="C1" t="s"><v>0</v></c>
      <c r="D1"><v>1000000</v></c>
    </row>
    <row r="3">
      <c r="C3" t="s"><v>1</v></c>
      <c r="D3" t="str"><v>600000.5</v></c>
      <c r="F3" t="inlineStr"><is><t>note</t></is></c>
    </row>
  </sheetData>
</worksheet>)";

const std::string kOtherSheet = R"(<?xml version="1.0" encoding="UTF-8"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
  <sheetData><row r="1"><c r="A1" t="inlineStr"><is><t>wrong sheet</t></is></c></row></sheetData>
</worksheet>)";

}  // namespace

TEST_CASE("CSV adapter handles quotes, BOM and CRLF", "[ingest][csv]") {
  CsvSheetAdapter adapter;
  const auto result = adapter.read(
      to_bytes("\xEF\xBB\xBF,,\"Ministry, of \"\"Finance\"\"\",600000\r\n1,,Program,\"300\n000\"\r\n"));
  REQUIRE(result.has_value());

  const Sheet& sheet = result.value();
  REQUIRE(sheet.row_count() == 2);
  REQUIRE(sheet.rows[0].cells.size() == 4);
  REQUIRE(sheet.rows[0].cell(0).empty());
  REQUIRE(sheet.rows[0].cell(2) == "Ministry, of \"Finance\"");
  REQUIRE(sheet.rows[0].cell(3) == "600000");
  REQUIRE(sheet.rows[1].cell(3) == "300\n000");
}

TEST_CASE("CSV adapter rejects unterminated quotes and empty input", "[ingest][csv]") {
  CsvSheetAdapter adapter;
  REQUIRE_FALSE(adapter.read(to_bytes("a,\"b\n")).has_value());
  REQUIRE_FALSE(adapter.read({}).has_value());
  REQUIRE(adapter.format_name() == "csv-rfc4180-v1");
}

TEST_CASE("Sheet rows are trimmed and padded to the requested width", "[ingest][sheet]") {
  Sheet sheet;
  sheet.rows.push_back(RawRow{{"  a ", "b", "c", "d", "e"}});

  const RawRow cut = sheet.row(0, 3);
  REQUIRE(cut.cells == std::vector<std::string>{"a", "b", "c"});

  const RawRow padded = sheet.row(0, 7);
  REQUIRE(padded.cells.size() == 7);
  REQUIRE(padded.cell(6).empty());

  const RawRow past_end = sheet.row(5, 4);
  REQUIRE(past_end.cells == std::vector<std::string>{"", "", "", ""});
  REQUIRE(past_end.cell(100).empty());
}

TEST_CASE("xlsx adapter reads the first sheet through workbook relationships",
          "[ingest][xlsx]") {
  const auto bytes = make_zip({
      {"xl/workbook.xml", kWorkbookXml},
      {"xl/_rels/workbook.xml.rels", kWorkbookRels},
      {"xl/sharedStrings.xml", kSharedStrings},
      {"xl/worksheets/budget.xml", kBudgetSheet},
      {"xl/worksheets/sheet2.xml", kOtherSheet},
  });

  XlsxSheetAdapter adapter;
  const auto result = adapter.read(bytes);
  REQUIRE(result.has_value());

  const Sheet& sheet = result.value();
  REQUIRE(sheet.name == "Budget");
  REQUIRE(sheet.row_count() == 3);

  // Sparse columns are padded with empty cells.
  REQUIRE(sheet.rows[0].cells.size() == 4);
  REQUIRE(sheet.rows[0].cell(0).empty());
  REQUIRE(sheet.rows[0].cell(2) == "Ընդամենը");
  REQUIRE(sheet.rows[0].cell(3) == "1000000");

  // Row 2 is absent from the XML and reads as empty.
  REQUIRE(sheet.rows[1].cells.empty());

  REQUIRE(sheet.rows[2].cell(2) == "State Body 1");
  REQUIRE(sheet.rows[2].cell(3) == "600000.5");
  REQUIRE(sheet.rows[2].cell(4).empty());
  REQUIRE(sheet.rows[2].cell(5) == "note");
}

TEST_CASE("xlsx adapter reports missing parts", "[ingest][xlsx]") {
  XlsxSheetAdapter adapter;

  SECTION("not a zip archive") {
    const auto result = adapter.read(to_bytes("plain text"));
    REQUIRE_FALSE(result.has_value());
  }

  SECTION("no workbook part") {
    const auto result = adapter.read(make_zip({{"docProps/app.xml", "<Properties/>"}}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message == "Failed to find xl/workbook.xml in workbook");
  }

  SECTION("shared string index out of range") {
    const std::string sheet_xml = R"(<worksheet><sheetData>
      <row r="1"><c r="A1" t="s"><v>5</v></c></row></sheetData></worksheet>)";
    const auto result = adapter.read(make_zip({
        {"xl/workbook.xml", kWorkbookXml},
        {"xl/sharedStrings.xml", kSharedStrings},
        {"xl/worksheets/sheet1.xml", sheet_xml},
    }));
    REQUIRE_FALSE(result.has_value());
  }
}

TEST_CASE("create_sheet_adapter selects by extension", "[ingest][adapter]") {
  REQUIRE(create_sheet_adapter("budget.XLSX")->format_name() == "xlsx-ooxml-v1");
  REQUIRE(create_sheet_adapter("data/budget.csv")->format_name() == "csv-rfc4180-v1");
  REQUIRE(create_sheet_adapter("budget.xls") == nullptr);
  REQUIRE(create_sheet_adapter("budget") == nullptr);
}
