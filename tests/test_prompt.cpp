#include <catch2/catch_test_macros.hpp>
#include "prompt.hpp"

using namespace sandlot;

static StoredMessage msg(const std::string& role, const std::string& content) {
    return StoredMessage{"id", "conv", role, content, "2025-01-01T00:00:00.000Z"};
}

// ── build_system_prompt ─────────────────────────────────────────

TEST_CASE("build_system_prompt: documents the data functions", "[prompt]") {
    auto result = build_system_prompt("");
    REQUIRE(result.find("fetch(table") != std::string::npos);
    REQUIRE(result.find("count(table") != std::string::npos);
    REQUIRE(result.find("describe(table)") != std::string::npos);
    REQUIRE(result.find("tables()") != std::string::npos);
    REQUIRE(result.find("execute_code") != std::string::npos);
    REQUIRE(result.find("load_result") != std::string::npos);
}

TEST_CASE("build_system_prompt: schema context comes last", "[prompt]") {
    auto result = build_system_prompt("### titanic\n| age | REAL |");
    auto schema = result.find("## Dataset Schema");
    REQUIRE(schema != std::string::npos);
    REQUIRE(result.find("### titanic", schema) != std::string::npos);
    REQUIRE(result.rfind("## ") == schema);
}

// ── build_prompt_with_history ───────────────────────────────────

TEST_CASE("build_prompt_with_history: no history returns message", "[prompt]") {
    REQUIRE(build_prompt_with_history("hello", {}) == "hello");
}

TEST_CASE("build_prompt_with_history: drops trailing copy of the message", "[prompt]") {
    std::vector<StoredMessage> history = {msg("user", "hello")};
    REQUIRE(build_prompt_with_history("hello", history) == "hello");
}

TEST_CASE("build_prompt_with_history: prefixes roles and appends message", "[prompt]") {
    std::vector<StoredMessage> history = {
        msg("user", "How many rows?"),
        msg("assistant", "891 rows."),
        msg("user", "And survivors?"),
    };
    auto result = build_prompt_with_history("And survivors?", history);
    REQUIRE(result == "User: How many rows?\n\nAssistant: 891 rows.\n\nUser: And survivors?");
}

TEST_CASE("build_prompt_with_history: earlier identical message is kept", "[prompt]") {
    std::vector<StoredMessage> history = {
        msg("user", "again"),
        msg("assistant", "done"),
    };
    auto result = build_prompt_with_history("again", history);
    REQUIRE(result == "User: again\n\nAssistant: done\n\nUser: again");
}

// ── conversation_title ──────────────────────────────────────────

TEST_CASE("conversation_title: short message kept trimmed", "[prompt]") {
    REQUIRE(conversation_title("  Survival by class?  ") == "Survival by class?");
}

TEST_CASE("conversation_title: long message truncated with ellipsis", "[prompt]") {
    std::string longer(120, 'x');
    auto title = conversation_title(longer);
    REQUIRE(title.size() == 80);
    REQUIRE(title.substr(77) == "...");
    REQUIRE(title.substr(0, 77) == std::string(77, 'x'));
}

TEST_CASE("conversation_title: under the limit is untouched", "[prompt]") {
    std::string almost(79, 'y');
    REQUIRE(conversation_title(almost) == almost);
}
