#pragma once
#include "provider.hpp"
#include "tool.hpp"
#include <string>
#include <vector>
#include <memory>

namespace sandlot {

// Execute a single tool call, finding the tool by name
ToolResult dispatch_tool(const ToolCall& call,
                         const std::vector<std::unique_ptr<Tool>>& tools);

// Format a tool result as a Role::Tool message; failures get an "Error: "
// prefix unless the output already carries one.
ChatMessage format_tool_result_message(const std::string& tool_call_id,
                                       const std::string& tool_name,
                                       bool success,
                                       const std::string& output);

} // namespace sandlot
