#pragma once

#include "budgetam/core/result.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/parsing/parse_diagnostics.h"
#include "budgetam/storage/sqlite/sqlite_dataset_store.h"

#include <memory>
#include <optional>
#include <string>

// Process exit codes shared by every subcommand.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;  // parse failure, or validation failure
constexpr int kExitUsage = 2;

// Flag value parsers. Each prints its own message and returns false on bad input.
bool parse_source_type_flag(const std::string& value,
                            std::optional<budgetam::domain::SourceType>& out);
bool parse_year_flag(const std::string& value, std::optional<int>& out);

// Open (or create) the database and apply the schema.
budgetam::core::Result<std::unique_ptr<budgetam::storage::sqlite::SqliteDatasetStore>, std::string>
open_dataset_store(const std::string& db_path);

// Row-local warnings to stderr, one per line.
void print_diagnostics(const budgetam::parsing::ParseDiagnostics& diagnostics);
