#pragma once
#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace sandlot {

// SQLite failure in either store.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Column text, "" for NULL
inline std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

// Double-quoted SQL identifier
inline std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace sandlot
