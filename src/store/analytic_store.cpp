#include "analytic_store.hpp"
#include "sqlite_util.hpp"
#include <filesystem>

namespace sandlot {

static Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Value::integer(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return Value::number(sqlite3_column_double(stmt, col));
        case SQLITE_NULL:
            return Value::none();
        case SQLITE_BLOB: {
            const void* blob = sqlite3_column_blob(stmt, col);
            int size = sqlite3_column_bytes(stmt, col);
            if (!blob) return Value::string("");
            return Value::string(std::string(static_cast<const char*>(blob), static_cast<size_t>(size)));
        }
        default:
            return Value::string(column_text(stmt, col));
    }
}

static void bind_value(sqlite3_stmt* stmt, int index, const Value& v) {
    switch (v.kind()) {
        case ValueKind::None:
            sqlite3_bind_null(stmt, index);
            break;
        case ValueKind::Bool:
        case ValueKind::Int:
            sqlite3_bind_int64(stmt, index, v.as_int());
            break;
        case ValueKind::Float:
            sqlite3_bind_double(stmt, index, v.as_float());
            break;
        case ValueKind::Str:
            sqlite3_bind_text(stmt, index, v.as_str().c_str(), static_cast<int>(v.as_str().size()),
                              SQLITE_TRANSIENT);
            break;
        default: {
            std::string text = v.str();
            sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
            break;
        }
    }
}

SqliteAnalyticStore::SqliteAnalyticStore(const std::string& path) {
    if (path != ":memory:") {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("SqliteAnalyticStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
}

SqliteAnalyticStore::~SqliteAnalyticStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::vector<Row> SqliteAnalyticStore::execute_sql(const std::string& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_locked(query);
}

std::vector<Row> SqliteAnalyticStore::query_locked(const std::string& query) {
    StmtGuard guard;
    if (sqlite3_prepare_v2(db_, query.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("SQL error: ") + sqlite3_errmsg(db_));
    }
    if (!guard.stmt) return {}; // empty statement

    int ncols = sqlite3_column_count(guard.stmt);
    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        const char* name = sqlite3_column_name(guard.stmt, c);
        names.emplace_back(name ? name : "");
    }

    std::vector<Row> rows;
    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        Row row;
        row.reserve(names.size());
        for (int c = 0; c < ncols; ++c) {
            row.emplace_back(names[static_cast<size_t>(c)], column_value(guard.stmt, c));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("SQL error: ") + sqlite3_errmsg(db_));
    }
    return rows;
}

std::vector<std::string> SqliteAnalyticStore::table_names() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& row : query_locked(
             "SELECT name FROM sqlite_master WHERE type IN ('table', 'view') "
             "AND name NOT LIKE 'sqlite_%' ORDER BY name")) {
        names.push_back(row.front().second.as_str());
    }
    return names;
}

std::vector<ColumnInfo> SqliteAnalyticStore::describe_table(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = query_locked("PRAGMA table_info(" + quote_identifier(table) + ")");
    if (rows.empty()) throw StoreError("no such table: " + table);

    // table_info columns: cid, name, type, notnull, dflt_value, pk
    std::vector<ColumnInfo> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        ColumnInfo info;
        info.column_name = row[1].second.str();
        info.column_type = row[2].second.is_str() ? row[2].second.as_str() : "";
        info.nullable = row[3].second.as_int() == 0;
        columns.push_back(std::move(info));
    }
    return columns;
}

void SqliteAnalyticStore::execute_script(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SQL error: " + message);
    }
}

void SqliteAnalyticStore::create_table(const std::string& table,
                                       const std::vector<ColumnInfo>& columns,
                                       const std::vector<std::vector<Value>>& rows) {
    if (columns.empty()) throw StoreError("create_table: " + table + " has no columns");

    std::string ddl = "CREATE TABLE " + quote_identifier(table) + " (";
    std::string insert = "INSERT INTO " + quote_identifier(table) + " VALUES (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            ddl += ", ";
            insert += ", ";
        }
        ddl += quote_identifier(columns[i].column_name) + " " + columns[i].column_type;
        if (!columns[i].nullable) ddl += " NOT NULL";
        insert += "?";
    }
    ddl += ")";
    insert += ")";

    execute_script("DROP TABLE IF EXISTS " + quote_identifier(table) + "; " + ddl + ";");

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr);
    {
        StmtGuard guard;
        if (sqlite3_prepare_v2(db_, insert.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
            std::string err = sqlite3_errmsg(db_);
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            throw StoreError("SQL error: " + err);
        }
        for (const auto& row : rows) {
            sqlite3_reset(guard.stmt);
            sqlite3_clear_bindings(guard.stmt);
            for (size_t i = 0; i < columns.size(); ++i) {
                bind_value(guard.stmt, static_cast<int>(i + 1), i < row.size() ? row[i] : Value::none());
            }
            if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
                std::string err = sqlite3_errmsg(db_);
                sqlite3_reset(guard.stmt);
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
                throw StoreError("SQL error: " + err);
            }
        }
    }
    sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
}

void SqliteAnalyticStore::seal() {
    execute_script("PRAGMA query_only=ON;");
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
}

} // namespace sandlot
