#include "budgetam/output/dataset_writer.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace budgetam::output {

namespace {

core::Result<bool, std::string> write_text_file(const std::filesystem::path& path,
                                                const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return core::Result<bool, std::string>::err("Cannot open " + path.string() + " for writing");
  }
  out << content;
  out.close();
  if (!out) {
    return core::Result<bool, std::string>::err("Failed to write " + path.string());
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string quoted = "\"";
  for (const char c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string render_records_csv(const std::vector<domain::FlattenedRecord>& records,
                               const domain::SourceType type, const domain::Layout layout) {
  const auto columns = domain::output_columns(type, layout);
  std::ostringstream out;

  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << csv_escape(columns[i]);
  }
  out << '\n';

  for (const auto& record : records) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) {
        out << ',';
      }
      out << csv_escape(domain::record_cell(record, columns[i]));
    }
    out << '\n';
  }
  return out.str();
}

core::Result<WrittenFiles, std::string> write_dataset(
    const std::string& out_dir, const std::string& dataset_id,
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type, const domain::Layout layout) {
  const std::filesystem::path dir(out_dir);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return core::Result<WrittenFiles, std::string>::err("Cannot create output directory " +
                                                        out_dir + ": " + ec.message());
  }

  WrittenFiles files;
  files.records_csv = (dir / (dataset_id + ".csv")).string();
  files.overall_json = (dir / (dataset_id + "_overall.json")).string();

  auto csv = write_text_file(files.records_csv, render_records_csv(records, type, layout));
  if (!csv.has_value()) {
    return core::Result<WrittenFiles, std::string>::err(csv.error());
  }

  auto json = write_text_file(files.overall_json,
                              domain::json_text(domain::overall_to_json(overall), 2) + "\n");
  if (!json.has_value()) {
    return core::Result<WrittenFiles, std::string>::err(json.error());
  }

  return core::Result<WrittenFiles, std::string>::ok(std::move(files));
}

}  // namespace budgetam::output
