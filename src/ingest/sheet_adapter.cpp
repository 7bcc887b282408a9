#include "budgetam/ingest/sheet_adapter.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <zip.h>

namespace budgetam::ingest {

namespace {

// SpreadsheetML parts are usually written without a namespace prefix, but some
// producers emit "x:row" and friends. Element lookups compare local names only.
std::string_view local_name(const pugi::xml_node& node) {
  std::string_view name{node.name()};
  const auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

pugi::xml_node child_named(const pugi::xml_node& parent, const std::string_view name) {
  for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element && local_name(child) == name) {
      return child;
    }
  }
  return {};
}

std::vector<pugi::xml_node> children_named(const pugi::xml_node& parent,
                                           const std::string_view name) {
  std::vector<pugi::xml_node> nodes;
  for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element && local_name(child) == name) {
      nodes.push_back(child);
    }
  }
  return nodes;
}

// Relationship id attribute of <sheet>, written as r:id with a varying prefix.
std::string relationship_id(const pugi::xml_node& sheet) {
  for (pugi::xml_attribute attr = sheet.first_attribute(); attr; attr = attr.next_attribute()) {
    const std::string_view name{attr.name()};
    if (name == "id" || (name.size() > 3 && name.substr(name.size() - 3) == ":id")) {
      return attr.value();
    }
  }
  return {};
}

// Text of a shared or inline string item: a plain <t>, or the <t> of each rich-text run.
std::string string_item_text(const pugi::xml_node& item) {
  const pugi::xml_node plain = child_named(item, "t");
  if (plain) {
    return plain.text().get();
  }
  std::string text;
  for (const pugi::xml_node& run : children_named(item, "r")) {
    text += child_named(run, "t").text().get();
  }
  return text;
}

// "BC12" -> 54 (zero-based column). Returns nullopt when the reference has no letters.
std::optional<std::size_t> column_from_reference(const std::string_view reference) {
  std::size_t column = 0;
  std::size_t letters = 0;
  for (const char ch : reference) {
    if (ch >= 'A' && ch <= 'Z') {
      column = column * 26 + static_cast<std::size_t>(ch - 'A' + 1);
      ++letters;
    } else if (ch >= 'a' && ch <= 'z') {
      column = column * 26 + static_cast<std::size_t>(ch - 'a' + 1);
      ++letters;
    } else {
      break;
    }
  }
  if (letters == 0) {
    return std::nullopt;
  }
  return column - 1;
}

// Owns an open archive for the duration of a read.
class ZipArchive {
 public:
  ZipArchive() = default;
  ~ZipArchive() {
    if (archive_ != nullptr) {
      zip_close(archive_);
    }
  }
  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;
  ZipArchive(ZipArchive&&) = delete;
  ZipArchive& operator=(ZipArchive&&) = delete;

  bool open(const std::vector<uint8_t>& data) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(data.data(), data.size(), 0, &error);
    if (src == nullptr) {
      zip_error_fini(&error);
      return false;
    }
    archive_ = zip_open_from_source(src, ZIP_RDONLY, &error);
    zip_error_fini(&error);
    if (archive_ == nullptr) {
      zip_source_free(src);
      return false;
    }
    return true;
  }

  // Full content of an archive member, or nullopt when it is absent or unreadable.
  [[nodiscard]] std::optional<std::vector<char>> read_entry(const std::string& name) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(archive_, name.c_str(), 0, &st) != 0) {
      return std::nullopt;
    }

    zip_file_t* file = zip_fopen(archive_, name.c_str(), 0);
    if (file == nullptr) {
      return std::nullopt;
    }

    std::vector<char> content(st.size);
    const zip_int64_t bytes_read = zip_fread(file, content.data(), st.size);
    zip_fclose(file);
    if (bytes_read != static_cast<zip_int64_t>(st.size)) {
      return std::nullopt;
    }
    return content;
  }

 private:
  zip_t* archive_ = nullptr;
};

bool load_xml(pugi::xml_document& doc, const std::vector<char>& content) {
  return static_cast<bool>(doc.load_buffer(content.data(), content.size()));
}

// Target of a workbook relationship, resolved against the "xl/" directory.
std::string resolve_sheet_target(const std::string& target) {
  if (!target.empty() && target.front() == '/') {
    return target.substr(1);
  }
  if (target.rfind("xl/", 0) == 0) {
    return target;
  }
  return "xl/" + target;
}

std::string lower_extension(const std::string& path) {
  const auto dot = path.find_last_of('.');
  const auto slash = path.find_last_of("/\\");
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return {};
  }
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return ext;
}

}  // namespace

SheetResult XlsxSheetAdapter::read(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return SheetResult::err(SheetError{"Empty input data"});
  }

  ZipArchive archive;
  if (!archive.open(data)) {
    return SheetResult::err(SheetError{"Failed to open workbook as ZIP archive"});
  }

  // Locate the first worksheet: workbook.xml names it, the relationships part maps it
  // to a member path. Fall back to the conventional path when either part is missing.
  Sheet sheet;
  std::string sheet_path = "xl/worksheets/sheet1.xml";

  const auto workbook_xml = archive.read_entry("xl/workbook.xml");
  if (!workbook_xml.has_value()) {
    return SheetResult::err(SheetError{"Failed to find xl/workbook.xml in workbook"});
  }
  pugi::xml_document workbook;
  if (!load_xml(workbook, workbook_xml.value())) {
    return SheetResult::err(SheetError{"Failed to parse xl/workbook.xml as XML"});
  }
  const pugi::xml_node first_sheet =
      child_named(child_named(child_named(workbook, "workbook"), "sheets"), "sheet");
  if (!first_sheet) {
    return SheetResult::err(SheetError{"Workbook contains no worksheets"});
  }
  sheet.name = first_sheet.attribute("name").value();
  const std::string rel_id = relationship_id(first_sheet);

  const auto rels_xml = archive.read_entry("xl/_rels/workbook.xml.rels");
  if (rels_xml.has_value() && !rel_id.empty()) {
    pugi::xml_document rels;
    if (load_xml(rels, rels_xml.value())) {
      for (const pugi::xml_node& rel :
           children_named(child_named(rels, "Relationships"), "Relationship")) {
        if (rel_id == rel.attribute("Id").value()) {
          sheet_path = resolve_sheet_target(rel.attribute("Target").value());
          break;
        }
      }
    }
  }

  // Shared strings are optional: a workbook with only numbers and inline strings omits them.
  std::vector<std::string> shared_strings;
  const auto shared_xml = archive.read_entry("xl/sharedStrings.xml");
  if (shared_xml.has_value()) {
    pugi::xml_document shared;
    if (!load_xml(shared, shared_xml.value())) {
      return SheetResult::err(SheetError{"Failed to parse xl/sharedStrings.xml as XML"});
    }
    for (const pugi::xml_node& item : children_named(child_named(shared, "sst"), "si")) {
      shared_strings.push_back(string_item_text(item));
    }
  }

  const auto sheet_xml = archive.read_entry(sheet_path);
  if (!sheet_xml.has_value()) {
    return SheetResult::err(SheetError{"Failed to find " + sheet_path + " in workbook"});
  }
  pugi::xml_document worksheet;
  if (!load_xml(worksheet, sheet_xml.value())) {
    return SheetResult::err(SheetError{"Failed to parse " + sheet_path + " as XML"});
  }

  const pugi::xml_node sheet_data = child_named(child_named(worksheet, "worksheet"), "sheetData");
  for (const pugi::xml_node& row_node : children_named(sheet_data, "row")) {
    // Rows may be sparse; "r" is the one-based row number.
    const unsigned row_number = row_node.attribute("r").as_uint(0);
    if (row_number > 0) {
      while (sheet.rows.size() + 1 < row_number) {
        sheet.rows.emplace_back();
      }
    }

    RawRow row;
    std::size_t next_column = 0;
    for (const pugi::xml_node& cell : children_named(row_node, "c")) {
      const auto referenced = column_from_reference(cell.attribute("r").value());
      const std::size_t column = referenced.value_or(next_column);
      next_column = column + 1;

      const std::string_view type{cell.attribute("t").value()};
      std::string text;
      if (type == "s") {
        const unsigned index = child_named(cell, "v").text().as_uint(0);
        if (index >= shared_strings.size()) {
          return SheetResult::err(SheetError{"Shared string index out of range in " + sheet_path});
        }
        text = shared_strings[index];
      } else if (type == "inlineStr") {
        text = string_item_text(child_named(cell, "is"));
      } else {
        // n, str, b, e and untyped cells keep the stored value text.
        text = child_named(cell, "v").text().get();
      }

      if (row.cells.size() < column + 1) {
        row.cells.resize(column + 1);
      }
      row.cells[column] = std::move(text);
    }
    sheet.rows.push_back(std::move(row));
  }

  return SheetResult::ok(std::move(sheet));
}

SheetResult CsvSheetAdapter::read(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return SheetResult::err(SheetError{"Empty input data"});
  }

  std::string_view text{reinterpret_cast<const char*>(data.data()), data.size()};
  if (text.size() >= 3 && std::memcmp(text.data(), "\xEF\xBB\xBF", 3) == 0) {
    text.remove_prefix(3);
  }

  Sheet sheet;
  RawRow row;
  std::string field;
  bool in_quotes = false;
  bool row_has_content = false;

  const auto end_field = [&]() {
    row.cells.push_back(std::move(field));
    field.clear();
    row_has_content = true;
  };
  const auto end_row = [&]() {
    end_field();
    sheet.rows.push_back(std::move(row));
    row = RawRow{};
    row_has_content = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }

    if (ch == '"') {
      in_quotes = true;
      row_has_content = true;
    } else if (ch == ',') {
      end_field();
    } else if (ch == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      end_row();
    } else if (ch == '\n') {
      end_row();
    } else {
      field.push_back(ch);
      row_has_content = true;
    }
  }

  if (in_quotes) {
    return SheetResult::err(SheetError{"Unterminated quoted field in CSV input"});
  }
  if (row_has_content || !field.empty()) {
    end_row();
  }

  return SheetResult::ok(std::move(sheet));
}

std::unique_ptr<ISheetAdapter> create_sheet_adapter(const std::string& path) {
  const std::string ext = lower_extension(path);
  if (ext == ".xlsx") {
    return std::make_unique<XlsxSheetAdapter>();
  }
  if (ext == ".csv") {
    return std::make_unique<CsvSheetAdapter>();
  }
  return nullptr;
}

core::Result<std::vector<uint8_t>, std::string> read_file_bytes(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Failed to open file: " + path);
  }

  const auto size = file.tellg();
  if (size < 0) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Failed to read file: " + path);
  }
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<std::size_t>(size));
  if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Failed to read file: " + path);
  }

  return core::Result<std::vector<uint8_t>, std::string>::ok(std::move(data));
}

SheetResult load_sheet(const std::string& path) {
  const auto adapter = create_sheet_adapter(path);
  if (adapter == nullptr) {
    return SheetResult::err(SheetError{"Unsupported workbook format: " + path});
  }

  auto bytes = read_file_bytes(path);
  if (!bytes.has_value()) {
    return SheetResult::err(SheetError{bytes.error()});
  }

  return adapter->read(bytes.value());
}

}  // namespace budgetam::ingest
