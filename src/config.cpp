#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sandlot {

static nlohmann::json dataset_entry(const char* name, const char* file, const char* format,
                                    const char* description) {
    return {
        {"name", name},
        {"path", std::string("~/.sandlot/data/") + file},
        {"format", format},
        {"description", description}
    };
}

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "anthropic"},
        {"model", "claude-sonnet-4-5-20250929"},
        {"temperature", 0.2},
        {"base_url", ""},
        {"providers", {
            {"anthropic", {{"api_key", ""}}}
        }},
        {"agent", {
            {"max_turns", 25}
        }},
        {"sandbox", {
            {"max_duration_secs", 30}
        }},
        {"results", {
            {"max_load_rows", 100}
        }},
        {"store", {
            {"path", "~/.sandlot/store.db"}
        }},
        {"datasets", nlohmann::json::array({
            dataset_entry("titanic", "titanic.csv", "csv",
                          "Titanic passenger survival data (survived, pclass, name, sex, age, fare, sibsp, parch)"),
            dataset_entry("bigmac", "bigmac.csv", "csv",
                          "Big Mac Index economics data (date, currency_code, name, local_price, dollar_ex, dollar_price)"),
            dataset_entry("smoking", "smoking.csv", "csv",
                          "Simpson's paradox dataset on smoking/survival (outcome, smoker, age)"),
            dataset_entry("stocks", "stocks.csv", "csv",
                          "Stock prices for MSFT, KLM, ING, MOS (Date, MSFT, KLM, ING, MOS)"),
            dataset_entry("pokemon", "pokemon.json", "json",
                          "Pokemon stats (name, type, total, hp, attack)"),
            dataset_entry("stigler", "stigler.csv", "csv",
                          "Stigler diet optimization data (commodity, unit, price_cents, calories, protein_g, ...nutrients)")
        })}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static uint32_t read_u32(const nlohmann::json& obj, const char* key, uint32_t fallback) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        return obj[key].get<uint32_t>();
    return fallback;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("agent") && j["agent"].is_object())
        cfg.agent.max_turns = read_u32(j["agent"], "max_turns", cfg.agent.max_turns);
    if (j.contains("sandbox") && j["sandbox"].is_object())
        cfg.sandbox.max_duration_secs = read_u32(j["sandbox"], "max_duration_secs", cfg.sandbox.max_duration_secs);
    if (j.contains("results") && j["results"].is_object())
        cfg.results.max_load_rows = read_u32(j["results"], "max_load_rows", cfg.results.max_load_rows);
    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("path") && s["path"].is_string())
            cfg.store.path = s["path"].get<std::string>();
    }

    if (j.contains("datasets") && j["datasets"].is_array()) {
        for (const auto& d : j["datasets"]) {
            if (!d.is_object() || !d.contains("name") || !d["name"].is_string()) continue;
            DatasetConfig ds;
            ds.name = d["name"].get<std::string>();
            if (d.contains("path") && d["path"].is_string())
                ds.path = d["path"].get<std::string>();
            if (d.contains("format") && d["format"].is_string())
                ds.format = d["format"].get<std::string>();
            if (d.contains("description") && d["description"].is_string())
                ds.description = d["description"].get<std::string>();
            cfg.datasets.push_back(std::move(ds));
        }
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.sandlot/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                } else {
                    std::cerr << "[config] Could not write " << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << ", using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } else {
            std::cerr << "[config] Could not write " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        cfg.providers["anthropic"].api_key = v;
    if (const char* v = std::getenv("SANDLOT_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("SANDLOT_STORE_PATH"))
        cfg.store.path = v;
    if (const char* v = std::getenv("SANDLOT_BASE_URL"))
        cfg.base_url = v;

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    if (!base_url.empty()) return base_url;
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::store_path() const {
    return expand_home(store.path);
}

} // namespace sandlot
