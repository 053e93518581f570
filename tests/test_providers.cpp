#include <catch2/catch_test_macros.hpp>
#include "mock_http_client.hpp"
#include "provider.hpp"
#include "providers/anthropic.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace sandlot;

// ── Helpers ─────────────────────────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

static ChatMessage user(const std::string& text) {
    return ChatMessage{Role::User, text, std::nullopt, std::nullopt, {}};
}

static const char* OK_BODY = R"({
    "model": "claude-test",
    "content": [{"type": "text", "text": "ok"}],
    "usage": {"input_tokens": 5, "output_tokens": 2}
})";

// ════════════════════════════════════════════════════════════════
// Request shape
// ════════════════════════════════════════════════════════════════

TEST_CASE("AnthropicProvider: chat sends correct request", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "model": "claude-test",
        "content": [{"type": "text", "text": "Hello!"}],
        "usage": {"input_tokens": 10, "output_tokens": 5}
    })"};

    AnthropicProvider provider("test-key", mock, "");
    auto result = provider.chat({user("Hi")}, {}, "claude-test", 0.2);

    REQUIRE(mock.last_url == "https://api.anthropic.com/v1/messages");
    REQUIRE(find_header(mock.last_headers, "x-api-key") == "test-key");
    REQUIRE(find_header(mock.last_headers, "anthropic-version") == "2023-06-01");
    REQUIRE(find_header(mock.last_headers, "content-type") == "application/json");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "claude-test");
    REQUIRE(body["temperature"] == 0.2);
    REQUIRE(body["max_tokens"] == 4096);
    REQUIRE(body["messages"].size() == 1);
    REQUIRE(body["messages"][0]["role"] == "user");
    REQUIRE(body["messages"][0]["content"] == "Hi");
    REQUIRE_FALSE(body.contains("tools"));

    REQUIRE(result.content.value_or("") == "Hello!");
    REQUIRE(result.model == "claude-test");
    REQUIRE(result.usage.total_tokens == 15);
}

TEST_CASE("AnthropicProvider: custom base URL", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, OK_BODY};
    AnthropicProvider provider("key", mock, "http://localhost:8080/v1");
    provider.chat({user("Hi")}, {}, "m", 0.0);
    REQUIRE(mock.last_url == "http://localhost:8080/v1/messages");
}

TEST_CASE("AnthropicProvider: system messages move to the system field", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, OK_BODY};
    AnthropicProvider provider("key", mock, "");

    std::vector<ChatMessage> messages = {
        {Role::System, "Be precise", std::nullopt, std::nullopt, {}},
        user("Hi")
    };
    provider.chat(messages, {}, "m", 0.5);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["system"] == "Be precise");
    REQUIRE(body["messages"].size() == 1);
}

TEST_CASE("AnthropicProvider: tools carry their input schema", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, OK_BODY};
    AnthropicProvider provider("key", mock, "");

    std::vector<ToolSpec> tools = {
        {"execute_code", "Run code", R"({"type":"object","properties":{"code":{"type":"string"}}})"}
    };
    provider.chat({user("Hi")}, tools, "m", 0.5);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["tools"].size() == 1);
    REQUIRE(body["tools"][0]["name"] == "execute_code");
    REQUIRE(body["tools"][0]["input_schema"]["properties"]["code"]["type"] == "string");
}

// ════════════════════════════════════════════════════════════════
// Tool use round trip
// ════════════════════════════════════════════════════════════════

TEST_CASE("AnthropicProvider: parses text blocks and tool calls", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, R"JSON({
        "model": "claude-test",
        "content": [
            {"type": "text", "text": "Let me look."},
            {"type": "tool_use", "id": "toolu_1", "name": "execute_code", "input": {"code": "tables()"}},
            {"type": "text", "text": "Running it."}
        ],
        "usage": {"input_tokens": 10, "output_tokens": 20}
    })JSON"};

    AnthropicProvider provider("key", mock, "");
    auto result = provider.chat({user("What tables?")}, {}, "m", 0.5);

    REQUIRE(result.text_blocks.size() == 2);
    REQUIRE(result.content.value_or("") == "Let me look.\nRunning it.");
    REQUIRE(result.tool_calls.size() == 1);
    REQUIRE(result.tool_calls[0].id == "toolu_1");
    REQUIRE(json::parse(result.tool_calls[0].arguments)["code"] == "tables()");
}

TEST_CASE("AnthropicProvider: assistant tool calls and grouped results", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, OK_BODY};
    AnthropicProvider provider("key", mock, "");

    std::vector<ChatMessage> messages = {
        user("Go"),
        {Role::Assistant, "Two calls.", std::nullopt, std::nullopt,
         {ToolCall{"t1", "execute_code", R"({"code":"1"})"},
          ToolCall{"t2", "load_result", R"({"uid":"x"})"}}},
        {Role::Tool, "first", std::string("execute_code"), std::string("t1"), {}},
        {Role::Tool, "second", std::string("load_result"), std::string("t2"), {}},
    };
    provider.chat(messages, {}, "m", 0.5);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["messages"].size() == 3);

    const auto& assistant = body["messages"][1];
    REQUIRE(assistant["role"] == "assistant");
    REQUIRE(assistant["content"].size() == 3);
    REQUIRE(assistant["content"][0]["type"] == "text");
    REQUIRE(assistant["content"][1]["type"] == "tool_use");
    REQUIRE(assistant["content"][1]["input"]["code"] == "1");
    REQUIRE(assistant["content"][2]["name"] == "load_result");

    const auto& results = body["messages"][2];
    REQUIRE(results["role"] == "user");
    REQUIRE(results["content"].size() == 2);
    REQUIRE(results["content"][0]["type"] == "tool_result");
    REQUIRE(results["content"][0]["tool_use_id"] == "t1");
    REQUIRE(results["content"][1]["content"] == "second");
}

TEST_CASE("AnthropicProvider: empty content array returns no content", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"model": "m", "content": [], "usage": {"input_tokens": 5, "output_tokens": 0}})"};
    AnthropicProvider provider("key", mock, "");
    auto result = provider.chat({user("Hi")}, {}, "m", 0.5);
    REQUIRE_FALSE(result.content.has_value());
    REQUIRE_FALSE(result.has_tool_calls());
}

// ════════════════════════════════════════════════════════════════
// Errors and retries
// ════════════════════════════════════════════════════════════════

TEST_CASE("AnthropicProvider: client error is not retried", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {400, R"({"error": "bad request"})"};
    AnthropicProvider provider("key", mock, "");

    try {
        provider.chat({user("Hi")}, {}, "m", 0.5);
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == R"(Anthropic API error (HTTP 400): {"error": "bad request"})");
    }
    REQUIRE(mock.call_count == 1);
}

TEST_CASE("AnthropicProvider: rate limit is retried", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.response_queue = {
        {429, R"({"error": "rate limited"})"},
        {200, OK_BODY}
    };
    AnthropicProvider provider("key", mock, "");
    auto result = provider.chat({user("Hi")}, {}, "m", 0.5);
    REQUIRE(result.content.value_or("") == "ok");
    REQUIRE(mock.call_count == 2);
}

TEST_CASE("AnthropicProvider: malformed body throws", "[providers][anthropic]") {
    MockHttpClient mock;
    mock.next_response = {200, "<html>"};
    AnthropicProvider provider("key", mock, "");
    REQUIRE_THROWS_AS(provider.chat({user("Hi")}, {}, "m", 0.5), std::runtime_error);
}

// ════════════════════════════════════════════════════════════════
// Factory
// ════════════════════════════════════════════════════════════════

TEST_CASE("create_provider: anthropic and unknown names", "[providers]") {
    MockHttpClient mock;
    auto provider = create_provider("anthropic", "key", mock);
    REQUIRE(provider->provider_name() == "anthropic");
    REQUIRE_THROWS_AS(create_provider("nope", "key", mock), std::invalid_argument);
}
