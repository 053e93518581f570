#include "execute_code.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <future>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sandlot {

std::string summarize_outcome(const std::string& artifact_id, const ExecutionOutcome& outcome) {
    std::string head = "Result UID: " + artifact_id + "\n";
    if (!outcome.output_json) {
        return head + "Type: none\nValue: None";
    }
    const std::string& text = *outcome.output_json;

    switch (outcome.output_type) {
        case OutputType::Table: {
            auto data = nlohmann::ordered_json::parse(text);
            std::vector<std::string> cols;
            if (!data.empty() && data[0].is_object()) {
                for (auto it = data[0].begin(); it != data[0].end(); ++it) {
                    cols.push_back(it.key());
                }
            }
            return head + "Type: table\nRows: " + std::to_string(data.size()) +
                   "\nColumns: " + join(cols, ", ");
        }
        case OutputType::Scalar:
            return head + "Type: scalar (displayed as a metric)\nValue: " + text;
        case OutputType::Dict: {
            auto data = nlohmann::ordered_json::parse(text);
            std::vector<std::string> keys;
            if (data.is_object()) {
                for (auto it = data.begin(); it != data.end(); ++it) {
                    keys.push_back(it.key());
                }
            }
            return head + "Type: dict (displayed as key-value pairs)\nKeys: " + join(keys, ", ");
        }
        default:
            return head + "Type: " + output_type_to_string(outcome.output_type) +
                   "\nData: " + utf8_truncate(text, 200);
    }
}

ToolResult ExecuteCodeTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "code")) return *err;

    std::string code = args["code"].get<std::string>();

    ctx_.queue.push(StreamEventKind::Status, "Running code in sandbox...");

    uint64_t t0 = monotonic_ms();
    auto worker = std::async(std::launch::async, [this, &code]() {
        return bridge_.run(code);
    });
    ExecutionOutcome outcome = worker.get();
    uint64_t exec_ms = monotonic_ms() - t0;

    Artifact artifact = store_.save_artifact(
        ctx_.conversation_id, std::nullopt, code, outcome.state_blob,
        outcome.output_json,
        outcome.error ? std::nullopt
                      : std::optional<std::string>(output_type_to_string(outcome.output_type)),
        outcome.error);
    ctx_.pending_artifacts.push_back(artifact);
    ctx_.tool_timings.push_back(ToolTiming{tool_name(), exec_ms, outcome.error.has_value()});

    if (outcome.error) {
        std::cerr << "[execute_code] " << *outcome.error << "\n";
        ctx_.queue.push(StreamEventKind::Status, "Code failed, agent may retry...");
        return ToolResult{false, "Error: " + *outcome.error};
    }

    return ToolResult{true, summarize_outcome(artifact.id, outcome)};
}

std::string ExecuteCodeTool::description() const {
    return "Execute Python code in the sandbox. The code can call fetch(), count(), "
           "describe(), and tables() to access datasets. Returns a result UID and "
           "metadata; the full data is rendered to the user automatically.";
}

std::string ExecuteCodeTool::parameters_json() const {
    return R"json({"type":"object","properties":{"code":{"type":"string","description":"Python code to run; the value of the last expression is the result"}},"required":["code"]})json";
}

} // namespace sandlot
