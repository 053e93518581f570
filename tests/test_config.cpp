#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace sandlot;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(cfg.temperature == 0.2);
    REQUIRE(cfg.agent.max_turns == 25);
    REQUIRE(cfg.sandbox.max_duration_secs == 30);
    REQUIRE(cfg.results.max_load_rows == 100);
    REQUIRE(cfg.api_key_for("anthropic").empty());
    REQUIRE(cfg.datasets.empty());
}

TEST_CASE("Config::defaults_json: ships the sample datasets", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(j["datasets"].is_array());
    REQUIRE(j["datasets"].size() == 6);
    REQUIRE(j["datasets"][0]["name"] == "titanic");
    REQUIRE(j["datasets"][4]["format"] == "json");
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    nlohmann::json j = {
        {"provider", "anthropic"},
        {"model", "claude-test"},
        {"temperature", 0.5},
        {"providers", {{"anthropic", {{"api_key", "sk-1"}, {"base_url", "http://proxy/v1"}}}}},
        {"agent", {{"max_turns", 4}}},
        {"sandbox", {{"max_duration_secs", 2}}},
        {"results", {{"max_load_rows", 10}}},
        {"store", {{"path", "/tmp/x.db"}}},
        {"datasets", {{{"name", "t"}, {"path", "/data/t.json"}, {"format", "json"}, {"description", "T"}}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.model == "claude-test");
    REQUIRE(cfg.temperature == 0.5);
    REQUIRE(cfg.api_key_for("anthropic") == "sk-1");
    REQUIRE(cfg.base_url_for("anthropic") == "http://proxy/v1");
    REQUIRE(cfg.agent.max_turns == 4);
    REQUIRE(cfg.sandbox.max_duration_secs == 2);
    REQUIRE(cfg.results.max_load_rows == 10);
    REQUIRE(cfg.store_path() == "/tmp/x.db");
    REQUIRE(cfg.datasets.size() == 1);
    REQUIRE(cfg.datasets[0].format == "json");
    REQUIRE(cfg.datasets[0].description == "T");
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    nlohmann::json j = {
        {"model", 42},
        {"agent", {{"max_turns", -3}}},
        {"datasets", {{{"path", "no-name.csv"}}, "junk"}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.model == "claude-sonnet-4-5-20250929");
    REQUIRE(cfg.agent.max_turns == 25);
    REQUIRE(cfg.datasets.empty());
}

// ── api_key_for / base_url_for ───────────────────────────────────

TEST_CASE("Config::api_key_for: unknown provider returns empty", "[config]") {
    Config cfg;
    cfg.providers["anthropic"].api_key = "key";
    REQUIRE(cfg.api_key_for("anthropic") == "key");
    REQUIRE(cfg.api_key_for("unknown").empty());
    REQUIRE(cfg.api_key_for("").empty());
}

TEST_CASE("Config::base_url_for: global override wins", "[config]") {
    Config cfg;
    cfg.providers["anthropic"].base_url = "http://per-provider";
    REQUIRE(cfg.base_url_for("anthropic") == "http://per-provider");
    REQUIRE(cfg.base_url_for("unknown").empty());
    cfg.base_url = "http://global";
    REQUIRE(cfg.base_url_for("anthropic") == "http://global");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "sandlot_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("SANDLOT_MODEL");
        unsetenv("SANDLOT_STORE_PATH");
        unsetenv("SANDLOT_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.sandlot/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.sandlot");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "providers": { "anthropic": { "api_key": "sk-file-ant" } },
        "model": "claude-file",
        "temperature": 0.5,
        "agent": { "max_turns": 7 },
        "store": { "path": "~/custom.db" }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.api_key_for("anthropic") == "sk-file-ant");
    REQUIRE(cfg.model == "claude-file");
    REQUIRE(cfg.temperature == 0.5);
    REQUIRE(cfg.agent.max_turns == 7);
    REQUIRE(cfg.store_path() == g.dir + "/custom.db");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"providers": {"anthropic": {"api_key": "from-file"}}, "model": "file-model"})");
    setenv("ANTHROPIC_API_KEY", "from-env", 1);
    setenv("SANDLOT_MODEL", "env-model", 1);
    setenv("SANDLOT_STORE_PATH", "/tmp/env.db", 1);
    setenv("SANDLOT_BASE_URL", "http://env:1234", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("anthropic") == "from-env");
    REQUIRE(cfg.model == "env-model");
    REQUIRE(cfg.store_path() == "/tmp/env.db");
    REQUIRE(cfg.base_url_for("anthropic") == "http://env:1234");

    unsetenv("ANTHROPIC_API_KEY");
    unsetenv("SANDLOT_MODEL");
    unsetenv("SANDLOT_STORE_PATH");
    unsetenv("SANDLOT_BASE_URL");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(cfg.api_key_for("anthropic").empty());
    REQUIRE(g.read_config() == "not valid json {{{");
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.datasets.size() == 6);
    REQUIRE(std::filesystem::exists(g.config_path()));

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["provider"] == "anthropic");
    REQUIRE(j["providers"].contains("anthropic"));
    REQUIRE(j["agent"]["max_turns"] == 25);
    REQUIRE(j["sandbox"]["max_duration_secs"] == 30);
    REQUIRE(j["store"]["path"] == "~/.sandlot/store.db");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"providers": {"anthropic": {"api_key": "sk-test"}}, "model": "claude-x", "datasets": []})");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("anthropic") == "sk-test");
    REQUIRE(cfg.model == "claude-x");
    // An explicit empty dataset list is the user's choice
    REQUIRE(cfg.datasets.empty());

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["providers"]["anthropic"]["api_key"] == "sk-test");
    REQUIRE(j["model"] == "claude-x");
    REQUIRE(j["results"]["max_load_rows"] == 100);
    REQUIRE(j["datasets"].empty());
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["model"] = "claude-other";
    full["agent"]["max_turns"] = 5;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();

    REQUIRE(cfg.model == "claude-other");
    REQUIRE(cfg.agent.max_turns == 5);
    REQUIRE(before == g.read_config());
}
