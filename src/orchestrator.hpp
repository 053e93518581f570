#pragma once
#include "agent.hpp"
#include "event.hpp"
#include "executor.hpp"
#include "request_context.hpp"
#include "store/conversation_store.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace sandlot {

class Orchestrator;

// Events of one chat turn, pulled in order. Not restartable; once next()
// returns false the stream is spent. Destroying a stream mid-way waits for
// its agent thread.
class ChatStream {
public:
    ChatStream(ChatStream&&) = default;
    ChatStream& operator=(ChatStream&&) = delete;
    ChatStream(const ChatStream&) = delete;
    ChatStream& operator=(const ChatStream&) = delete;
    ~ChatStream();

    // Fills `event` and returns true, or returns false after the done event.
    bool next(StreamEvent& event);

    const std::string& conversation_id() const { return ctx_->conversation_id; }

private:
    friend class Orchestrator;
    ChatStream(Orchestrator& owner, std::unique_ptr<RequestContext> ctx);

    enum class Phase { Start, Streaming, Tail, Finished };

    void launch();
    void finalize();

    Orchestrator* owner_;
    std::unique_ptr<RequestContext> ctx_;
    std::thread worker_;
    Phase phase_ = Phase::Start;
    std::deque<StreamEvent> tail_;
};

// Turns one user message into a stream of events: runs the agent on a
// background thread with the execute_code and load_result tools, relays its
// progress, then persists the reply and reports artifacts and timing.
class Orchestrator {
public:
    Orchestrator(ConversationStore& store, ExecutionBridge& bridge, AgentRunner& agent,
                 std::string schema_context, uint32_t max_load_rows = 100);

    // Creates a conversation when none is given and appends the user message.
    // Returns the conversation id.
    std::string begin_turn(const std::optional<std::string>& conversation_id,
                           const std::string& message);

    ChatStream stream(const std::string& conversation_id, const std::string& user_message);

    // Re-runs a stored artifact's code through the bridge without persisting
    // anything. nullopt if the artifact does not exist.
    std::optional<ExecutionOutcome> replay_artifact(const std::string& artifact_id);

    const std::string& schema_context() const { return schema_context_; }

private:
    friend class ChatStream;
    void run_agent(RequestContext& ctx);
    void on_agent_message(RequestContext& ctx, const AgentMessage& message);

    ConversationStore& store_;
    ExecutionBridge& bridge_;
    AgentRunner& agent_;
    std::string schema_context_;
    uint32_t max_load_rows_;
};

// {id, code, result_json, result_type, error}
nlohmann::json artifact_event_payload(const Artifact& artifact);

} // namespace sandlot
