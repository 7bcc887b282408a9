#pragma once

#include "budgetam/core/result.h"
#include "budgetam/ingest/sheet.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace budgetam::ingest {

/// Error type for workbook read failures
struct SheetError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

/// Result of reading the first worksheet of a workbook
using SheetResult = core::Result<Sheet, SheetError>;

/// Sheet adapter interface: raw file bytes in, grid of cell text out.
class ISheetAdapter {
 public:
  virtual ~ISheetAdapter() = default;

  /// Read the first worksheet. Every cell is returned as text; numeric cells keep
  /// the representation stored in the file ("150000", "0.712").
  [[nodiscard]] virtual SheetResult read(const std::vector<uint8_t>& data) const = 0;

  /// Format identifier (e.g., "xlsx-ooxml-v1")
  [[nodiscard]] virtual std::string format_name() const = 0;

 protected:
  ISheetAdapter() = default;
  ISheetAdapter(const ISheetAdapter&) = default;
  ISheetAdapter& operator=(const ISheetAdapter&) = default;
  ISheetAdapter(ISheetAdapter&&) = default;
  ISheetAdapter& operator=(ISheetAdapter&&) = default;
};

/// Office Open XML workbook (.xlsx): a ZIP archive of SpreadsheetML parts.
class XlsxSheetAdapter : public ISheetAdapter {
 public:
  [[nodiscard]] SheetResult read(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string format_name() const override { return "xlsx-ooxml-v1"; }
};

/// Comma-separated export of a single sheet (RFC 4180 quoting, optional UTF-8 BOM).
class CsvSheetAdapter : public ISheetAdapter {
 public:
  [[nodiscard]] SheetResult read(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string format_name() const override { return "csv-rfc4180-v1"; }
};

/// Adapter for a file path by extension (".xlsx", ".csv", case-insensitive).
/// Returns nullptr for unsupported extensions.
[[nodiscard]] std::unique_ptr<ISheetAdapter> create_sheet_adapter(const std::string& path);

/// Read a whole file into memory.
[[nodiscard]] core::Result<std::vector<uint8_t>, std::string> read_file_bytes(
    const std::string& path);

/// Read the first worksheet of the workbook at `path`.
[[nodiscard]] SheetResult load_sheet(const std::string& path);

}  // namespace budgetam::ingest
