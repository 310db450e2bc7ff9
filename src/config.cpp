#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace forge {

nlohmann::json Config::defaults_json() {
    return {
        {"model", "llama3.2"},
        {"base_url", "http://localhost:11434"},
        {"temperature", 0.7},
        {"max_tokens", 4096},
        {"timeout_seconds", 30},
        {"max_json_depth", 128},
        {"chat", {
            {"history_limit", 2000},
            {"history_keep", 1500}
        }}
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

std::string Config::path() {
    return expand_home("~/.forge/config.json");
}

// Counts may be stored signed (from code) or unsigned (from a parsed file).
static bool is_count(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() >= 0;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (is_count(j, "max_tokens"))
        cfg.max_tokens = j["max_tokens"].get<uint32_t>();
    if (is_count(j, "timeout_seconds")) {
        int64_t t = j["timeout_seconds"].get<int64_t>();
        if (t >= kMinTimeoutSeconds && t <= kMaxTimeoutSeconds)
            cfg.timeout_seconds = static_cast<uint32_t>(t);
    }
    if (is_count(j, "max_json_depth"))
        cfg.max_json_depth = j["max_json_depth"].get<uint32_t>();

    if (j.contains("chat") && j["chat"].is_object()) {
        auto& c = j["chat"];
        if (is_count(c, "history_limit"))
            cfg.chat.history_limit = c["history_limit"].get<uint32_t>();
        if (is_count(c, "history_keep"))
            cfg.chat.history_keep = c["history_keep"].get<uint32_t>();
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = path();
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // The server address is the one setting the environment may override.
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.base_url = v;

    return cfg;
}

Endpoint Config::endpoint() const {
    return parse_base_url(base_url);
}

ClientOptions Config::client_options() const {
    ClientOptions opts;
    int64_t ms = static_cast<int64_t>(timeout_seconds) * 1000;
    opts.timeout_ms = static_cast<int>(std::clamp<int64_t>(ms, 1000, INT_MAX));
    opts.max_json_depth = max_json_depth;
    opts.temperature = temperature;
    opts.max_tokens = max_tokens;
    return opts;
}

bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier) {
    std::string config_path = Config::path();
    nlohmann::json j = Config::defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), Config::defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Rewriting malformed " << config_path
                      << ": " << e.what() << "\n";
        }
        file.close();
    }

    modifier(j);
    return atomic_write_file(config_path, j.dump(4) + "\n");
}

static const nlohmann::json* walk(const nlohmann::json& j, const std::string& key) {
    const nlohmann::json* node = &j;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object() || !node->contains(part)) return nullptr;
        node = &(*node)[part];
    }
    return node;
}

std::optional<nlohmann::json> config_get(const nlohmann::json& j, const std::string& key) {
    const nlohmann::json* node = walk(j, key);
    if (!node) return std::nullopt;
    return *node;
}

bool config_set(nlohmann::json& j, const std::string& key, const std::string& value,
                std::string& error) {
    nlohmann::json defaults = Config::defaults_json();
    const nlohmann::json* shape = walk(defaults, key);
    if (!shape || shape->is_object()) {
        error = "Unknown configuration key: " + key;
        return false;
    }

    nlohmann::json converted;
    try {
        if (shape->is_string()) {
            converted = value;
        } else if (shape->is_boolean()) {
            if (value == "true") converted = true;
            else if (value == "false") converted = false;
            else throw std::invalid_argument("expected true or false");
        } else if (shape->is_number_integer()) {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument("expected a non-negative integer");
            unsigned long n = std::stoul(value);
            if (n > UINT32_MAX) throw std::out_of_range("too large");
            if (key == "timeout_seconds" &&
                (n < kMinTimeoutSeconds || n > kMaxTimeoutSeconds))
                throw std::out_of_range("expected 1 to 86400 seconds");
            converted = static_cast<uint32_t>(n);
        } else {
            size_t used = 0;
            double d = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument("expected a number");
            converted = d;
        }
    } catch (const std::exception& e) {
        error = "Invalid value for " + key + ": '" + value + "' (" + e.what() + ")";
        return false;
    }

    nlohmann::json* node = &j;
    for (const auto& part : split(key, '.')) {
        node = &(*node)[part];
    }
    *node = converted;
    return true;
}

} // namespace forge
