#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace sandlot {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct AgentConfig {
    uint32_t max_turns = 25;
};

struct SandboxConfig {
    uint32_t max_duration_secs = 30;
};

struct ResultsConfig {
    uint32_t max_load_rows = 100;
};

struct StoreConfig {
    std::string path = "~/.sandlot/store.db";
};

// A table loaded into the analytic store at startup.
struct DatasetConfig {
    std::string name;
    std::string path;
    std::string format = "csv"; // "csv" or "json"
    std::string description;
};

struct Config {
    std::string provider = "anthropic";
    std::string model = "claude-sonnet-4-5-20250929";
    double temperature = 0.2;
    std::string base_url;  // Global override for the provider endpoint

    std::unordered_map<std::string, ProviderEntry> providers;

    AgentConfig agent;
    SandboxConfig sandbox;
    ResultsConfig results;
    StoreConfig store;
    std::vector<DatasetConfig> datasets;

    // Load from ~/.sandlot/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Populate from an already-merged config document
    static Config from_json(const nlohmann::json& j);

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // store.path with ~ expanded
    std::string store_path() const;
};

} // namespace sandlot
