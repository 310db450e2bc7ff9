#pragma once
#include "providers/ollama.hpp"
#include "transport.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace forge {

// Per-read timeout bounds; a zero or unbounded wait is never configured.
constexpr uint32_t kMinTimeoutSeconds = 1;
constexpr uint32_t kMaxTimeoutSeconds = 86400;

struct ChatConfig {
    uint32_t history_limit = 2000; // transcript characters before trimming
    uint32_t history_keep = 1500;  // roughly how much survives a trim
};

struct Config {
    std::string model = "llama3.2";
    std::string base_url = "http://localhost:11434";
    double temperature = 0.7;
    uint32_t max_tokens = 4096;
    uint32_t timeout_seconds = 30;
    uint32_t max_json_depth = 128;

    ChatConfig chat;

    // Load from ~/.forge/config.json + OLLAMA_BASE_URL
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Populate from parsed JSON; keys of the wrong type are ignored.
    static Config from_json(const nlohmann::json& j);

    // ~/.forge/config.json with ~ expanded
    static std::string path();

    // Resolve base_url. Throws std::invalid_argument on a bad URL.
    Endpoint endpoint() const;

    ClientOptions client_options() const;
};

// Read-modify-write ~/.forge/config.json atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier);

// Dotted-key access ("chat.history_limit") into a config document.
std::optional<nlohmann::json> config_get(const nlohmann::json& j, const std::string& key);

// Set a dotted key from command-line text, coerced to the type the key has
// in defaults_json(). Returns false and fills error for unknown keys or
// values that do not convert.
bool config_set(nlohmann::json& j, const std::string& key, const std::string& value,
                std::string& error);

} // namespace forge
