#include "agent.hpp"
#include "dispatcher.hpp"
#include <iostream>

namespace sandlot {

ProviderAgent::ProviderAgent(Provider& provider, std::string model, double temperature,
                             uint32_t max_turns)
    : provider_(provider)
    , model_(std::move(model))
    , temperature_(temperature)
    , max_turns_(max_turns)
{}

void ProviderAgent::run(const AgentRequest& request,
                        const std::vector<std::unique_ptr<Tool>>& tools,
                        const AgentMessageCallback& on_message) {
    std::vector<ChatMessage> history;
    if (!request.system_prompt.empty()) {
        history.push_back(ChatMessage{Role::System, request.system_prompt, {}, {}, {}});
    }
    history.push_back(ChatMessage{Role::User, request.prompt, {}, {}, {}});

    std::vector<ToolSpec> tool_specs;
    tool_specs.reserve(tools.size());
    for (const auto& tool : tools) {
        tool_specs.push_back(tool->spec());
    }

    uint32_t turns = 0;
    while (turns < max_turns_) {
        turns++;

        ChatResponse response = provider_.chat(history, tool_specs, model_, temperature_);

        AgentMessage turn;
        turn.kind = AgentMessageKind::AssistantTurn;
        turn.text_blocks = response.text_blocks;
        turn.tool_calls = response.tool_calls;
        on_message(turn);

        history.push_back(ChatMessage{Role::Assistant, response.content.value_or(""),
                                      {}, {}, response.tool_calls});

        // No tool calls means the agent is done
        if (!response.has_tool_calls()) return;

        AgentMessage results;
        results.kind = AgentMessageKind::ToolResults;
        for (const auto& call : response.tool_calls) {
            std::cerr << "[tool] " << call.name << '\n';
            ToolResult result = dispatch_tool(call, tools);
            history.push_back(
                format_tool_result_message(call.id, call.name, result.success, result.output));
            results.results.push_back(
                ToolOutcome{call.id, call.name, result.success, history.back().content});
        }
        on_message(results);
    }

    std::cerr << "[agent] Max turns reached (" << max_turns_ << ")\n";
}

} // namespace sandlot
