#include "load_result.hpp"
#include "tool_util.hpp"
#include "../engine/value.hpp"
#include "../util.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace sandlot {

static std::string cell_text(const nlohmann::ordered_json& row, const std::string& col) {
    auto it = row.find(col);
    if (it == row.end()) return "";
    return from_json(*it).str();
}

std::string render_result(const std::string& result_json, uint32_t max_rows) {
    auto data = nlohmann::ordered_json::parse(result_json);

    if (data.is_array() && !data.empty() && data[0].is_object()) {
        std::vector<std::string> cols;
        for (auto it = data[0].begin(); it != data[0].end(); ++it) {
            cols.push_back(it.key());
        }

        size_t shown = std::min<size_t>(data.size(), max_rows);
        std::string text = join(cols, " | ") + "\n" +
                           join(std::vector<std::string>(cols.size(), "---"), " | ") + "\n";
        for (size_t i = 0; i < shown; i++) {
            std::vector<std::string> cells;
            for (const auto& c : cols) {
                cells.push_back(data[i].is_object() ? cell_text(data[i], c) : "");
            }
            if (i > 0) text += "\n";
            text += join(cells, " | ");
        }
        if (data.size() > max_rows) {
            text += "\n\n(Showing " + std::to_string(shown) + " of " +
                    std::to_string(data.size()) + " rows)";
        }
        return text;
    }

    return data.dump(2, ' ', true);
}

ToolResult LoadResultTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "uid")) return *err;

    std::string uid = args["uid"].get<std::string>();
    auto artifact = store_.get_artifact(uid);
    if (!artifact) {
        return ToolResult{false, "Error: No result found for UID " + uid};
    }
    if (artifact->error) {
        return ToolResult{false, "Error in result: " + *artifact->error};
    }
    if (!artifact->result_json || artifact->result_json->empty()) {
        return ToolResult{true, "Result: None"};
    }

    try {
        return ToolResult{true, render_result(*artifact->result_json, max_rows_)};
    } catch (const nlohmann::json::exception& e) {
        return ToolResult{false, std::string("Error: stored result is not valid JSON: ") + e.what()};
    }
}

std::string LoadResultTool::description() const {
    return "Load result data into context by its UID. Returns up to " +
           std::to_string(max_rows_) + " rows formatted as a markdown table. Use this "
           "when you need to reference specific values in your analysis.";
}

std::string LoadResultTool::parameters_json() const {
    return R"json({"type":"object","properties":{"uid":{"type":"string","description":"Result UID returned by execute_code"}},"required":["uid"]})json";
}

} // namespace sandlot
