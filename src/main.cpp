#include "config.hpp"
#include "provider.hpp"
#include "agent.hpp"
#include "http.hpp"
#include "executor.hpp"
#include "function_router.hpp"
#include "orchestrator.hpp"
#include "engine/script_engine.hpp"
#include "store/analytic_store.hpp"
#include "store/conversation_store.hpp"
#include "store/datasets.hpp"
#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

static void print_usage() {
    std::cout << "Usage: sandlot <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  chat -m MSG [-c ID]   Run one agent turn, printing its event stream\n"
              << "  exec CODE             Run a code unit against the datasets (not persisted)\n"
              << "  replay ARTIFACT_ID    Re-run a stored artifact's code\n"
              << "  artifact ARTIFACT_ID  Show a stored artifact\n"
              << "  conversations         List conversations, most recent first\n"
              << "  conversation ID       Show a conversation with its messages and artifacts\n"
              << "  tables                List tables and print the schema context\n"
              << "\n"
              << "Options:\n"
              << "  --model NAME          Use specific model\n"
              << "  -h, --help            Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY     API key for Anthropic\n"
              << "  SANDLOT_MODEL         Model override\n"
              << "  SANDLOT_STORE_PATH    Conversation store file\n"
              << "  SANDLOT_BASE_URL      Provider endpoint override\n";
}

static sandlot::ResourceLimits limits_from(const sandlot::Config& config) {
    sandlot::ResourceLimits limits;
    limits.max_duration = std::chrono::milliseconds(
        static_cast<int64_t>(config.sandbox.max_duration_secs) * 1000);
    return limits;
}

static void print_event(const sandlot::StreamEvent& ev) {
    std::cout << "event: " << sandlot::stream_event_kind_to_string(ev.kind) << "\n"
              << "data: " << ev.payload << "\n\n" << std::flush;
}

static nlohmann::json replay_json(const std::string& artifact_id, const std::string& code,
                                  const sandlot::ExecutionOutcome& outcome) {
    auto j = sandlot::outcome_to_json(outcome);
    j["artifact_id"] = artifact_id;
    j["code"] = code;
    return j;
}

static int run_chat(const sandlot::Config& config, sandlot::SqliteAnalyticStore& analytic,
                    sandlot::ConversationStore& store, sandlot::ExecutionBridge& bridge,
                    const std::string& message,
                    const std::optional<std::string>& conversation_id) {
    sandlot::SocketHttpClient http_client;
    std::unique_ptr<sandlot::Provider> provider;
    try {
        provider = sandlot::create_provider(
            config.provider,
            config.api_key_for(config.provider),
            http_client,
            config.base_url_for(config.provider));
    } catch (const std::exception& e) {
        std::cerr << "Error creating provider: " << e.what() << "\n";
        return 1;
    }

    sandlot::ProviderAgent agent(*provider, config.model, config.temperature,
                                 config.agent.max_turns);
    sandlot::Orchestrator orchestrator(store, bridge, agent,
                                       sandlot::build_schema_context(analytic, config.datasets),
                                       config.results.max_load_rows);

    std::string id = orchestrator.begin_turn(conversation_id, message);
    std::cerr << "[sandlot] Conversation " << id << "\n";

    auto stream = orchestrator.stream(id, message);
    sandlot::StreamEvent ev;
    while (stream.next(ev)) {
        print_event(ev);
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string command;
    std::vector<std::string> positional;
    std::string message;
    std::optional<std::string> conversation_id;
    std::string model_name;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--conversation") == 0) && i + 1 < argc) {
            conversation_id = std::string(argv[++i]);
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    auto config = sandlot::Config::load();
    if (!model_name.empty()) {
        config.model = model_name;
    }

    auto need_arg = [&](const char* what) -> bool {
        if (positional.empty()) {
            std::cerr << "Missing " << what << " for '" << command << "'\n";
            return false;
        }
        return true;
    };

    // Commands that only touch the conversation store
    if (command == "conversations" || command == "conversation" || command == "artifact") {
        sandlot::ConversationStore store(config.store_path());
        if (command == "conversations") {
            auto arr = nlohmann::json::array();
            for (const auto& c : store.list_conversations()) arr.push_back(sandlot::to_json(c));
            std::cout << arr.dump(2) << "\n";
            return 0;
        }
        if (!need_arg(command == "artifact" ? "artifact id" : "conversation id")) return 1;
        if (command == "artifact") {
            auto artifact = store.get_artifact(positional[0]);
            if (!artifact) {
                std::cerr << "Artifact not found: " << positional[0] << "\n";
                return 1;
            }
            std::cout << sandlot::to_json(*artifact).dump(2) << "\n";
            return 0;
        }
        auto conv = store.get_conversation(positional[0]);
        if (!conv) {
            std::cerr << "Conversation not found: " << positional[0] << "\n";
            return 1;
        }
        auto messages = nlohmann::json::array();
        for (const auto& m : store.get_messages(conv->id)) messages.push_back(sandlot::to_json(m));
        auto artifacts = nlohmann::json::array();
        for (const auto& a : store.get_artifacts_for_conversation(conv->id)) artifacts.push_back(sandlot::to_json(a));
        nlohmann::json out = {{"conversation", sandlot::to_json(*conv)},
                              {"messages", messages},
                              {"artifacts", artifacts}};
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command != "chat" && command != "exec" && command != "replay" && command != "tables") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    // Analytic side: load datasets, then make the store read-only
    sandlot::SqliteAnalyticStore analytic;
    sandlot::load_datasets(analytic, config.datasets);
    analytic.seal();

    if (command == "tables") {
        for (const auto& name : analytic.table_names()) std::cout << name << "\n";
        std::cout << "\n" << sandlot::build_schema_context(analytic, config.datasets) << "\n";
        return 0;
    }

    sandlot::ScriptEngine engine;
    sandlot::FunctionRouter router(analytic);
    sandlot::ExecutionBridge bridge(engine, router, limits_from(config));

    if (command == "exec") {
        if (!need_arg("code")) return 1;
        auto outcome = bridge.run(positional[0]);
        std::cout << sandlot::outcome_to_json(outcome).dump(2) << "\n";
        return outcome.ok() ? 0 : 2;
    }

    sandlot::ConversationStore store(config.store_path());

    if (command == "replay") {
        if (!need_arg("artifact id")) return 1;
        auto artifact = store.get_artifact(positional[0]);
        if (!artifact) {
            std::cerr << "Artifact not found: " << positional[0] << "\n";
            return 1;
        }
        auto outcome = bridge.run(artifact->code);
        std::cout << replay_json(artifact->id, artifact->code, outcome).dump(2) << "\n";
        return 0;
    }

    if (message.empty()) {
        std::cerr << "chat requires -m MESSAGE\n";
        return 1;
    }
    return run_chat(config, analytic, store, bridge, message, conversation_id);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
