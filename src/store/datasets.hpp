#pragma once
#include "analytic_store.hpp"
#include "../config.hpp"
#include <string>
#include <vector>

namespace sandlot {

// Parsed tabular data ready for SqliteAnalyticStore::create_table.
struct TableData {
    std::vector<ColumnInfo> columns;
    std::vector<std::vector<Value>> rows;
};

// RFC 4180 CSV with a header row. Column types are inferred per column:
// INTEGER if every non-empty cell is an integer, REAL if every one is
// numeric, TEXT otherwise. Empty cells become NULL.
TableData parse_csv(const std::string& text);

// JSON array of objects. Columns in first-seen key order; nested values are
// stored as their JSON text.
TableData parse_json_records(const std::string& text);

// Load one dataset file into `store`; returns the number of rows loaded.
// Throws std::runtime_error for unreadable or malformed files.
size_t load_dataset(SqliteAnalyticStore& store, const DatasetConfig& dataset);

// Load every dataset, logging and skipping the ones that fail. Returns the
// number loaded.
size_t load_datasets(SqliteAnalyticStore& store, const std::vector<DatasetConfig>& datasets);

// Markdown description of every dataset table for the system prompt.
std::string build_schema_context(AnalyticStore& store, const std::vector<DatasetConfig>& datasets);

} // namespace sandlot
