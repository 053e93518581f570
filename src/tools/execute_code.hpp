#pragma once
#include "../tool.hpp"
#include "../executor.hpp"
#include "../request_context.hpp"
#include "../store/conversation_store.hpp"

namespace sandlot {

// Runs a code unit through the bridge and persists the outcome as an
// artifact of the current conversation.
class ExecuteCodeTool : public Tool {
public:
    ExecuteCodeTool(ExecutionBridge& bridge, ConversationStore& store, RequestContext& ctx)
        : bridge_(bridge), store_(store), ctx_(ctx) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "execute_code"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ExecutionBridge& bridge_;
    ConversationStore& store_;
    RequestContext& ctx_;
};

// Agent-facing summary of a successful outcome, keyed by the artifact id.
std::string summarize_outcome(const std::string& artifact_id, const ExecutionOutcome& outcome);

} // namespace sandlot
