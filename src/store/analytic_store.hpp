#pragma once
#include "../engine/value.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct sqlite3; // forward declare

namespace sandlot {

// One result row: column name → value, in select-list order.
using Row = std::vector<std::pair<std::string, Value>>;

struct ColumnInfo {
    std::string column_name;
    std::string column_type;
    bool nullable = true;
};

// Read-only view of the analytic tables, shared by concurrent code units.
class AnalyticStore {
public:
    virtual ~AnalyticStore() = default;

    virtual std::vector<Row> execute_sql(const std::string& query) = 0;
    // Sorted by name.
    virtual std::vector<std::string> table_names() = 0;
    virtual std::vector<ColumnInfo> describe_table(const std::string& table) = 0;
};

class SqliteAnalyticStore : public AnalyticStore {
public:
    explicit SqliteAnalyticStore(const std::string& path = ":memory:");
    ~SqliteAnalyticStore() override;

    // Non-copyable
    SqliteAnalyticStore(const SqliteAnalyticStore&) = delete;
    SqliteAnalyticStore& operator=(const SqliteAnalyticStore&) = delete;

    std::vector<Row> execute_sql(const std::string& query) override;
    std::vector<std::string> table_names() override;
    std::vector<ColumnInfo> describe_table(const std::string& table) override;

    // Setup only: run one or more statements. Throws StoreError once sealed
    // and the script writes.
    void execute_script(const std::string& sql);

    // Create `table` (replacing any existing one) and bulk insert `rows`,
    // each aligned with `columns`.
    void create_table(const std::string& table,
                      const std::vector<ColumnInfo>& columns,
                      const std::vector<std::vector<Value>>& rows);

    // Switch the connection to query_only; no statement can write afterwards.
    void seal();
    bool sealed() const { return sealed_; }

private:
    std::vector<Row> query_locked(const std::string& query);

    sqlite3* db_ = nullptr;
    bool sealed_ = false;
    mutable std::mutex mutex_;
};

} // namespace sandlot
