#pragma once

#include "budgetam/storage/dataset_store.h"
#include "budgetam/storage/sqlite/sqlite_db.h"

#include <memory>

namespace budgetam::storage::sqlite {

// SQLite-backed dataset store. Amount sets are kept as JSON text per record so one
// table serves every source kind; the kind is recovered from the dataset's source_type.
class SqliteDatasetStore final : public IDatasetStore {
 public:
  explicit SqliteDatasetStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> save(const StoredDataset& dataset) override;
  [[nodiscard]] core::Result<std::optional<StoredDataset>, std::string> load(
      const std::string& dataset_id) const override;
  [[nodiscard]] core::Result<std::vector<DatasetSummary>, std::string> list() const override;
  [[nodiscard]] core::Result<bool, std::string> save_report(
      const std::string& dataset_id, const nlohmann::json& report,
      const std::string& created_at) override;
  [[nodiscard]] core::Result<std::optional<nlohmann::json>, std::string> latest_report(
      const std::string& dataset_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  [[nodiscard]] core::Result<std::vector<domain::FlattenedRecord>, std::string> load_records(
      const std::string& dataset_id, domain::SourceKind kind) const;
};

}  // namespace budgetam::storage::sqlite
