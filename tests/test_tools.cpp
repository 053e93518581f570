#include <catch2/catch_test_macros.hpp>
#include "tools/execute_code.hpp"
#include "tools/load_result.hpp"
#include "engine/script_engine.hpp"
#include "test_fixtures.hpp"
#include <nlohmann/json.hpp>

using namespace sandlot;

// Store, bridge and request context for one conversation.
struct ToolFixture {
    ConversationStoreFixture conversations;
    std::unique_ptr<SqliteAnalyticStore> analytic = make_test_table_store();
    FunctionRouter router{*analytic};
    ScriptEngine engine;
    ExecutionBridge bridge{engine, router};
    RequestContext ctx;

    ToolFixture() {
        ctx.conversation_id = conversations.store.create_conversation().id;
    }

    ToolResult run_code(const std::string& code) {
        ExecuteCodeTool tool(bridge, conversations.store, ctx);
        return tool.execute(nlohmann::json{{"code", code}}.dump());
    }

    std::vector<StreamEvent> drain() {
        ctx.queue.close();
        std::vector<StreamEvent> out;
        while (auto ev = ctx.queue.pop()) out.push_back(std::move(*ev));
        return out;
    }
};

// ── execute_code ────────────────────────────────────────────────

TEST_CASE("ExecuteCodeTool: schema requires a code parameter", "[tools]") {
    ToolFixture f;
    ExecuteCodeTool tool(f.bridge, f.conversations.store, f.ctx);
    REQUIRE(tool.tool_name() == "execute_code");
    auto params = nlohmann::json::parse(tool.parameters_json());
    REQUIRE(params["required"][0] == "code");
}

TEST_CASE("ExecuteCodeTool: table result is summarized and stored", "[tools]") {
    ToolFixture f;
    auto result = f.run_code("fetch(\"test_table\", order_by=\"id\")");

    REQUIRE(result.success);
    REQUIRE(f.ctx.pending_artifacts.size() == 1);
    const auto& artifact = f.ctx.pending_artifacts[0];
    REQUIRE(result.output.find("Result UID: " + artifact.id) == 0);
    REQUIRE(result.output.find("Type: table") != std::string::npos);
    REQUIRE(result.output.find("Rows: 3") != std::string::npos);
    REQUIRE(result.output.find("Columns: id, name") != std::string::npos);

    auto stored = f.conversations.store.get_artifact(artifact.id);
    REQUIRE(stored.has_value());
    REQUIRE(stored->conversation_id == f.ctx.conversation_id);
    REQUIRE(stored->result_type == std::optional<std::string>("table"));
    REQUIRE_FALSE(stored->error.has_value());
    REQUIRE(stored->state_blob.has_value());

    REQUIRE(f.ctx.tool_timings.size() == 1);
    REQUIRE(f.ctx.tool_timings[0].name == "execute_code");
    REQUIRE_FALSE(f.ctx.tool_timings[0].has_error);

    auto events = f.drain();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == StreamEventKind::Status);
    REQUIRE(events[0].payload == "Running code in sandbox...");
}

TEST_CASE("ExecuteCodeTool: scalar and dict summaries", "[tools]") {
    ToolFixture f;
    auto scalar = f.run_code("count(\"test_table\")");
    REQUIRE(scalar.success);
    REQUIRE(scalar.output.find("Type: scalar (displayed as a metric)\nValue: 3") != std::string::npos);

    auto dict = f.run_code("{\"rows\": count(\"test_table\"), \"name\": \"t\"}");
    REQUIRE(dict.success);
    REQUIRE(dict.output.find("Keys: rows, name") != std::string::npos);
}

TEST_CASE("ExecuteCodeTool: no trailing expression yields none", "[tools]") {
    ToolFixture f;
    auto result = f.run_code("x = 1");
    REQUIRE(result.success);
    REQUIRE(result.output.find("Type: none\nValue: None") != std::string::npos);
    REQUIRE(f.ctx.pending_artifacts[0].result_type == std::optional<std::string>("none"));
}

TEST_CASE("ExecuteCodeTool: failing code stores an error artifact", "[tools]") {
    ToolFixture f;
    auto result = f.run_code("x = 1\ny = x / 0");

    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("Error: ") == 0);
    REQUIRE(result.output.find("ZeroDivisionError") != std::string::npos);

    REQUIRE(f.ctx.pending_artifacts.size() == 1);
    const auto& artifact = f.ctx.pending_artifacts[0];
    REQUIRE(artifact.error.has_value());
    REQUIRE_FALSE(artifact.result_type.has_value());
    REQUIRE(f.ctx.tool_timings[0].has_error);

    auto events = f.drain();
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].payload == "Code failed, agent may retry...");
}

TEST_CASE("ExecuteCodeTool: missing code parameter", "[tools]") {
    ToolFixture f;
    ExecuteCodeTool tool(f.bridge, f.conversations.store, f.ctx);
    auto result = tool.execute("{}");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("code") != std::string::npos);
    REQUIRE(f.ctx.pending_artifacts.empty());

    auto bad = tool.execute("not json");
    REQUIRE_FALSE(bad.success);
}

// ── load_result ─────────────────────────────────────────────────

TEST_CASE("render_result: table with truncation note", "[tools]") {
    std::string json = R"([{"id":1,"name":"a"},{"id":2,"name":"b"},{"id":3,"name":null}])";
    REQUIRE(render_result(json, 10) == "id | name\n--- | ---\n1 | a\n2 | b\n3 | None");
    REQUIRE(render_result(json, 2) == "id | name\n--- | ---\n1 | a\n2 | b\n\n(Showing 2 of 3 rows)");
}

TEST_CASE("render_result: non-table is indented JSON", "[tools]") {
    REQUIRE(render_result(R"({"b":1,"a":2})", 10) == "{\n  \"b\": 1,\n  \"a\": 2\n}");
    REQUIRE(render_result("42", 10) == "42");
}

TEST_CASE("LoadResultTool: loads a stored table", "[tools]") {
    ToolFixture f;
    auto exec = f.run_code("fetch(\"test_table\", order_by=\"id\", limit=2)");
    REQUIRE(exec.success);

    LoadResultTool tool(f.conversations.store, 100);
    auto id = f.ctx.pending_artifacts[0].id;
    auto result = tool.execute(nlohmann::json{{"uid", id}}.dump());
    REQUIRE(result.success);
    REQUIRE(result.output == "id | name\n--- | ---\n1 | a\n2 | b");
}

TEST_CASE("LoadResultTool: unknown uid", "[tools]") {
    ToolFixture f;
    LoadResultTool tool(f.conversations.store, 100);
    auto result = tool.execute(R"({"uid":"nope"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Error: No result found for UID nope");
}

TEST_CASE("LoadResultTool: failed artifact reports its error", "[tools]") {
    ToolFixture f;
    auto artifact = f.conversations.store.save_artifact(
        f.ctx.conversation_id, std::nullopt, "boom()", std::nullopt, std::nullopt,
        std::nullopt, std::string("Runtime error: line 1: NameError: boom"));
    LoadResultTool tool(f.conversations.store, 100);
    auto result = tool.execute(nlohmann::json{{"uid", artifact.id}}.dump());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Error in result: Runtime error: line 1: NameError: boom");
}

TEST_CASE("LoadResultTool: none result", "[tools]") {
    ToolFixture f;
    auto artifact = f.conversations.store.save_artifact(
        f.ctx.conversation_id, std::nullopt, "x = 1", std::nullopt, std::nullopt,
        std::string("none"), std::nullopt);
    LoadResultTool tool(f.conversations.store, 100);
    auto result = tool.execute(nlohmann::json{{"uid", artifact.id}}.dump());
    REQUIRE(result.success);
    REQUIRE(result.output == "Result: None");
}

TEST_CASE("LoadResultTool: description names the row cap", "[tools]") {
    ToolFixture f;
    LoadResultTool tool(f.conversations.store, 25);
    REQUIRE(tool.description().find("25 rows") != std::string::npos);
}
