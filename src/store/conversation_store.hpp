#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct sqlite3; // forward declare

namespace sandlot {

struct Conversation {
    std::string id;
    std::string title;
    std::string created_at;
    std::string updated_at;
};

struct StoredMessage {
    std::string id;
    std::string conversation_id;
    std::string role;
    std::string content;
    std::string created_at;
};

// A persisted code unit and its outcome. Immutable once saved.
struct Artifact {
    std::string id;
    std::string conversation_id;
    std::optional<std::string> message_id;
    std::string code;
    std::optional<std::string> result_json;
    std::optional<std::string> result_type;
    std::optional<std::string> error;
    std::string created_at;
    std::optional<std::string> state_blob; // only filled by get_artifact()
};

nlohmann::json to_json(const Conversation& c);
nlohmann::json to_json(const StoredMessage& m);
// Never includes the state blob.
nlohmann::json to_json(const Artifact& a);

inline constexpr const char* DEFAULT_CONVERSATION_TITLE = "New conversation";

// Conversations, messages and artifacts in one SQLite file. Throws
// StoreError on SQLite failures.
class ConversationStore {
public:
    explicit ConversationStore(const std::string& path);
    ~ConversationStore();

    // Non-copyable
    ConversationStore(const ConversationStore&) = delete;
    ConversationStore& operator=(const ConversationStore&) = delete;

    // ── Conversations ──
    Conversation create_conversation(const std::string& title = DEFAULT_CONVERSATION_TITLE);
    // Most recently updated first.
    std::vector<Conversation> list_conversations();
    std::optional<Conversation> get_conversation(const std::string& id);
    void update_conversation_title(const std::string& id, const std::string& title);
    void touch_conversation(const std::string& id);

    // ── Messages ──
    // Also touches the conversation.
    StoredMessage add_message(const std::string& conversation_id, const std::string& role,
                              const std::string& content);
    std::vector<StoredMessage> get_messages(const std::string& conversation_id);

    // ── Artifacts ──
    Artifact save_artifact(const std::string& conversation_id,
                           const std::optional<std::string>& message_id,
                           const std::string& code,
                           const std::optional<std::string>& state_blob,
                           const std::optional<std::string>& result_json,
                           const std::optional<std::string>& result_type,
                           const std::optional<std::string>& error);
    std::optional<Artifact> get_artifact(const std::string& id);
    // Creation order, without state blobs.
    std::vector<Artifact> get_artifacts_for_conversation(const std::string& conversation_id);

private:
    void init_schema();
    void exec(const char* sql);
    void touch_locked(const std::string& id, const std::string& now);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace sandlot
