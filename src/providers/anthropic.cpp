#include "anthropic.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace sandlot {

AnthropicProvider::AnthropicProvider(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url) {}

bool AnthropicProvider::is_retryable(long status_code) {
    return status_code == 429 || status_code == 408 || status_code == 409 ||
           (status_code >= 500 && status_code < 600);
}

void AnthropicProvider::backoff_sleep(uint32_t attempt) {
    double delay = std::min(INITIAL_DELAY_S * std::pow(2.0, static_cast<double>(attempt)),
                            MAX_DELAY_S);
    auto ms = static_cast<long>(delay * 1000);
    std::cerr << "[anthropic] Request failed, retrying in " << ms << "ms...\n";
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

json AnthropicProvider::build_request(const std::vector<ChatMessage>& messages,
                                      const std::vector<ToolSpec>& tools,
                                      const std::string& model,
                                      double temperature) const {
    json request;
    request["model"] = model;
    request["max_tokens"] = 4096;
    request["temperature"] = temperature;

    // Extract system messages
    std::string system_text;
    for (const auto& msg : messages) {
        if (msg.role == Role::System) {
            if (!system_text.empty()) {
                system_text += "\n";
            }
            system_text += msg.content;
        }
    }
    if (!system_text.empty()) {
        request["system"] = system_text;
    }

    json msgs = json::array();
    for (size_t i = 0; i < messages.size(); i++) {
        const auto& msg = messages[i];
        if (msg.role == Role::System) continue;

        json m;
        if (msg.role == Role::Tool) {
            // Consecutive tool results travel in one user message
            json tool_results = json::array();
            while (i < messages.size() && messages[i].role == Role::Tool) {
                json tool_result;
                tool_result["type"] = "tool_result";
                tool_result["tool_use_id"] = messages[i].tool_call_id.value_or("");
                tool_result["content"] = messages[i].content;
                tool_results.push_back(tool_result);
                i++;
            }
            i--; // adjust for outer loop increment
            m["role"] = "user";
            m["content"] = tool_results;
        } else if (msg.role == Role::Assistant && !msg.tool_calls.empty()) {
            m["role"] = "assistant";
            json content_blocks = json::array();
            if (!msg.content.empty()) {
                content_blocks.push_back({{"type", "text"}, {"text", msg.content}});
            }
            for (const auto& tc : msg.tool_calls) {
                json input = json::parse(tc.arguments.empty() ? "{}" : tc.arguments, nullptr, false);
                if (input.is_discarded() || !input.is_object()) input = json::object();
                content_blocks.push_back({{"type", "tool_use"}, {"id", tc.id},
                                          {"name", tc.name}, {"input", input}});
            }
            m["content"] = content_blocks;
        } else {
            m["role"] = role_to_string(msg.role);
            m["content"] = msg.content;
        }
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    if (!tools.empty()) {
        json tools_arr = json::array();
        for (const auto& tool : tools) {
            json t;
            t["name"] = tool.name;
            t["description"] = tool.description;
            t["input_schema"] = json::parse(tool.parameters_json);
            tools_arr.push_back(t);
        }
        request["tools"] = tools_arr;
    }

    return request;
}

ChatResponse AnthropicProvider::parse_response(const std::string& body, const std::string& model) {
    json resp = json::parse(body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        throw std::runtime_error("Anthropic API error: malformed response body");
    }

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("content") && resp["content"].is_array()) {
        for (const auto& block : resp["content"]) {
            std::string type = block.value("type", "");
            if (type == "text") {
                result.text_blocks.push_back(block.value("text", ""));
            } else if (type == "tool_use") {
                ToolCall tc;
                tc.id = block.value("id", "");
                tc.name = block.value("name", "");
                tc.arguments = block.contains("input") ? block["input"].dump() : "{}";
                result.tool_calls.push_back(std::move(tc));
            }
        }
    }
    if (!result.text_blocks.empty()) {
        std::string joined;
        for (const auto& t : result.text_blocks) {
            if (!joined.empty() && !t.empty()) joined += "\n";
            joined += t;
        }
        result.content = joined;
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = usage.value("input_tokens", 0u);
        result.usage.completion_tokens = usage.value("output_tokens", 0u);
        result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;
    }
    return result;
}

ChatResponse AnthropicProvider::chat(const std::vector<ChatMessage>& messages,
                                     const std::vector<ToolSpec>& tools,
                                     const std::string& model,
                                     double temperature) {
    std::string body = build_request(messages, tools, model, temperature).dump();

    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    for (uint32_t attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
        auto response = http_.post(base_url_ + "/messages", body, headers);

        if (response.status_code >= 200 && response.status_code < 300) {
            return parse_response(response.body, model);
        }

        if (is_retryable(response.status_code) && attempt < MAX_RETRIES) {
            backoff_sleep(attempt);
            continue;
        }

        throw std::runtime_error("Anthropic API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    throw std::runtime_error("Anthropic API error: max retries exceeded");
}

} // namespace sandlot
