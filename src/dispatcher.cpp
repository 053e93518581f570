#include "dispatcher.hpp"

namespace sandlot {

ToolResult dispatch_tool(const ToolCall& call,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == call.name) {
            return tool->execute(call.arguments);
        }
    }
    return ToolResult{false, "Unknown tool: " + call.name};
}

ChatMessage format_tool_result_message(const std::string& tool_call_id,
                                       const std::string& tool_name,
                                       bool success,
                                       const std::string& output) {
    bool prefixed = output.compare(0, 6, "Error:") == 0 || output.compare(0, 6, "Error ") == 0;
    std::string content = success || prefixed ? output : "Error: " + output;
    return ChatMessage{Role::Tool, content, tool_name, tool_call_id, {}};
}

} // namespace sandlot
