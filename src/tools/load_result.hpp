#pragma once
#include "../tool.hpp"
#include "../store/conversation_store.hpp"
#include <cstdint>

namespace sandlot {

// Reads a stored artifact back into the agent's context.
class LoadResultTool : public Tool {
public:
    LoadResultTool(ConversationStore& store, uint32_t max_rows)
        : store_(store), max_rows_(max_rows) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "load_result"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    ConversationStore& store_;
    uint32_t max_rows_;
};

// Markdown-style table of at most max_rows rows for a list of records,
// otherwise the JSON indented by two spaces.
std::string render_result(const std::string& result_json, uint32_t max_rows);

} // namespace sandlot
