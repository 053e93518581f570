#include "conversation_store.hpp"
#include "sqlite_util.hpp"
#include "../util.hpp"
#include <filesystem>

namespace sandlot {

nlohmann::json to_json(const Conversation& c) {
    return {{"id", c.id}, {"title", c.title}, {"created_at", c.created_at}, {"updated_at", c.updated_at}};
}

nlohmann::json to_json(const StoredMessage& m) {
    return {{"id", m.id}, {"conversation_id", m.conversation_id}, {"role", m.role},
            {"content", m.content}, {"created_at", m.created_at}};
}

static nlohmann::json optional_json(const std::optional<std::string>& s) {
    return s ? nlohmann::json(*s) : nlohmann::json();
}

nlohmann::json to_json(const Artifact& a) {
    return {{"id", a.id},
            {"conversation_id", a.conversation_id},
            {"message_id", optional_json(a.message_id)},
            {"code", a.code},
            {"result_json", optional_json(a.result_json)},
            {"result_type", optional_json(a.result_type)},
            {"error", optional_json(a.error)},
            {"created_at", a.created_at}};
}

static void bind_text(sqlite3_stmt* stmt, int index, const std::string& s) {
    sqlite3_bind_text(stmt, index, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& s) {
    if (s) {
        bind_text(stmt, index, *s);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

static std::optional<std::string> column_optional(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

static std::optional<std::string> column_blob(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const void* data = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (!data) return std::string();
    return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

ConversationStore::ConversationStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("ConversationStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    init_schema();
}

ConversationStore::~ConversationStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ConversationStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("ConversationStore: " + message);
    }
}

void ConversationStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS conversations ("
         "  id         TEXT PRIMARY KEY,"
         "  title      TEXT NOT NULL DEFAULT 'New conversation',"
         "  created_at TEXT NOT NULL,"
         "  updated_at TEXT NOT NULL"
         ");");

    exec("CREATE TABLE IF NOT EXISTS messages ("
         "  id              TEXT PRIMARY KEY,"
         "  conversation_id TEXT NOT NULL REFERENCES conversations(id),"
         "  role            TEXT NOT NULL,"
         "  content         TEXT NOT NULL,"
         "  created_at      TEXT NOT NULL"
         ");");

    exec("CREATE TABLE IF NOT EXISTS artifacts ("
         "  id              TEXT PRIMARY KEY,"
         "  conversation_id TEXT NOT NULL REFERENCES conversations(id),"
         "  message_id      TEXT REFERENCES messages(id),"
         "  code            TEXT NOT NULL,"
         "  state_blob      BLOB,"
         "  result_json     TEXT,"
         "  result_type     TEXT,"
         "  error           TEXT,"
         "  created_at      TEXT NOT NULL"
         ");");

    exec("CREATE INDEX IF NOT EXISTS idx_messages_conversation ON messages(conversation_id);");
    exec("CREATE INDEX IF NOT EXISTS idx_artifacts_conversation ON artifacts(conversation_id);");
}

// ── Conversations ────────────────────────────────────────────────

Conversation ConversationStore::create_conversation(const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    Conversation c{generate_uuid(), title, timestamp_now(), ""};
    c.updated_at = c.created_at;

    StmtGuard guard;
    const char* sql = "INSERT INTO conversations (id, title, created_at, updated_at) VALUES (?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("create_conversation: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, c.id);
    bind_text(guard.stmt, 2, c.title);
    bind_text(guard.stmt, 3, c.created_at);
    bind_text(guard.stmt, 4, c.updated_at);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("create_conversation: ") + sqlite3_errmsg(db_));
    }
    return c;
}

static Conversation read_conversation(sqlite3_stmt* stmt) {
    return Conversation{column_text(stmt, 0), column_text(stmt, 1), column_text(stmt, 2),
                        column_text(stmt, 3)};
}

std::vector<Conversation> ConversationStore::list_conversations() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard guard;
    const char* sql = "SELECT id, title, created_at, updated_at FROM conversations "
                      "ORDER BY updated_at DESC, rowid DESC";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("list_conversations: ") + sqlite3_errmsg(db_));
    }
    std::vector<Conversation> out;
    while (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        out.push_back(read_conversation(guard.stmt));
    }
    return out;
}

std::optional<Conversation> ConversationStore::get_conversation(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard guard;
    const char* sql = "SELECT id, title, created_at, updated_at FROM conversations WHERE id = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("get_conversation: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, id);
    if (sqlite3_step(guard.stmt) != SQLITE_ROW) return std::nullopt;
    return read_conversation(guard.stmt);
}

void ConversationStore::update_conversation_title(const std::string& id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard guard;
    const char* sql = "UPDATE conversations SET title = ?, updated_at = ? WHERE id = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("update_conversation_title: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, title);
    bind_text(guard.stmt, 2, timestamp_now());
    bind_text(guard.stmt, 3, id);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("update_conversation_title: ") + sqlite3_errmsg(db_));
    }
}

void ConversationStore::touch_locked(const std::string& id, const std::string& now) {
    StmtGuard guard;
    const char* sql = "UPDATE conversations SET updated_at = ? WHERE id = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("touch_conversation: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, now);
    bind_text(guard.stmt, 2, id);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("touch_conversation: ") + sqlite3_errmsg(db_));
    }
}

void ConversationStore::touch_conversation(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    touch_locked(id, timestamp_now());
}

// ── Messages ─────────────────────────────────────────────────────

StoredMessage ConversationStore::add_message(const std::string& conversation_id,
                                             const std::string& role,
                                             const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    StoredMessage m{generate_uuid(), conversation_id, role, content, timestamp_now()};

    StmtGuard guard;
    const char* sql = "INSERT INTO messages (id, conversation_id, role, content, created_at) "
                      "VALUES (?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("add_message: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, m.id);
    bind_text(guard.stmt, 2, m.conversation_id);
    bind_text(guard.stmt, 3, m.role);
    bind_text(guard.stmt, 4, m.content);
    bind_text(guard.stmt, 5, m.created_at);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("add_message: ") + sqlite3_errmsg(db_));
    }
    touch_locked(conversation_id, m.created_at);
    return m;
}

std::vector<StoredMessage> ConversationStore::get_messages(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard guard;
    const char* sql = "SELECT id, conversation_id, role, content, created_at FROM messages "
                      "WHERE conversation_id = ? ORDER BY created_at, rowid";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("get_messages: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, conversation_id);
    std::vector<StoredMessage> out;
    while (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        out.push_back(StoredMessage{column_text(guard.stmt, 0), column_text(guard.stmt, 1),
                                    column_text(guard.stmt, 2), column_text(guard.stmt, 3),
                                    column_text(guard.stmt, 4)});
    }
    return out;
}

// ── Artifacts ────────────────────────────────────────────────────

Artifact ConversationStore::save_artifact(const std::string& conversation_id,
                                          const std::optional<std::string>& message_id,
                                          const std::string& code,
                                          const std::optional<std::string>& state_blob,
                                          const std::optional<std::string>& result_json,
                                          const std::optional<std::string>& result_type,
                                          const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Artifact a;
    a.id = generate_uuid();
    a.conversation_id = conversation_id;
    a.message_id = message_id;
    a.code = code;
    a.result_json = result_json;
    a.result_type = result_type;
    a.error = error;
    a.created_at = timestamp_now();

    StmtGuard guard;
    const char* sql = "INSERT INTO artifacts (id, conversation_id, message_id, code, state_blob, "
                      "result_json, result_type, error, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("save_artifact: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, a.id);
    bind_text(guard.stmt, 2, a.conversation_id);
    bind_optional(guard.stmt, 3, a.message_id);
    bind_text(guard.stmt, 4, a.code);
    if (state_blob) {
        sqlite3_bind_blob(guard.stmt, 5, state_blob->data(), static_cast<int>(state_blob->size()),
                          SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(guard.stmt, 5);
    }
    bind_optional(guard.stmt, 6, a.result_json);
    bind_optional(guard.stmt, 7, a.result_type);
    bind_optional(guard.stmt, 8, a.error);
    bind_text(guard.stmt, 9, a.created_at);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("save_artifact: ") + sqlite3_errmsg(db_));
    }
    return a;
}

std::optional<Artifact> ConversationStore::get_artifact(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard guard;
    const char* sql = "SELECT id, conversation_id, message_id, code, result_json, result_type, error, "
                      "created_at, state_blob FROM artifacts WHERE id = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("get_artifact: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, id);
    if (sqlite3_step(guard.stmt) != SQLITE_ROW) return std::nullopt;

    Artifact a;
    a.id = column_text(guard.stmt, 0);
    a.conversation_id = column_text(guard.stmt, 1);
    a.message_id = column_optional(guard.stmt, 2);
    a.code = column_text(guard.stmt, 3);
    a.result_json = column_optional(guard.stmt, 4);
    a.result_type = column_optional(guard.stmt, 5);
    a.error = column_optional(guard.stmt, 6);
    a.created_at = column_text(guard.stmt, 7);
    a.state_blob = column_blob(guard.stmt, 8);
    return a;
}

std::vector<Artifact> ConversationStore::get_artifacts_for_conversation(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard guard;
    const char* sql = "SELECT id, conversation_id, message_id, code, result_json, result_type, error, "
                      "created_at FROM artifacts WHERE conversation_id = ? ORDER BY created_at, rowid";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("get_artifacts_for_conversation: ") + sqlite3_errmsg(db_));
    }
    bind_text(guard.stmt, 1, conversation_id);
    std::vector<Artifact> out;
    while (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        Artifact a;
        a.id = column_text(guard.stmt, 0);
        a.conversation_id = column_text(guard.stmt, 1);
        a.message_id = column_optional(guard.stmt, 2);
        a.code = column_text(guard.stmt, 3);
        a.result_json = column_optional(guard.stmt, 4);
        a.result_type = column_optional(guard.stmt, 5);
        a.error = column_optional(guard.stmt, 6);
        a.created_at = column_text(guard.stmt, 7);
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace sandlot
