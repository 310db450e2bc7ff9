#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <climits>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace forge;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.base_url == "http://localhost:11434");
    REQUIRE(cfg.temperature == 0.7);
    REQUIRE(cfg.max_tokens == 4096);
    REQUIRE(cfg.timeout_seconds == 30);
    REQUIRE(cfg.max_json_depth == 128);
    REQUIRE(cfg.chat.history_limit == 2000);
    REQUIRE(cfg.chat.history_keep == 1500);
}

TEST_CASE("Config::from_json: defaults_json matches struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.model == plain.model);
    REQUIRE(cfg.base_url == plain.base_url);
    REQUIRE(cfg.temperature == plain.temperature);
    REQUIRE(cfg.max_tokens == plain.max_tokens);
    REQUIRE(cfg.timeout_seconds == plain.timeout_seconds);
    REQUIRE(cfg.max_json_depth == plain.max_json_depth);
    REQUIRE(cfg.chat.history_limit == plain.chat.history_limit);
    REQUIRE(cfg.chat.history_keep == plain.chat.history_keep);
}

TEST_CASE("Config::from_json: wrong types are ignored", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "model": 42,
        "max_tokens": -5,
        "timeout_seconds": "soon",
        "chat": "none"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.max_tokens == 4096);
    REQUIRE(cfg.timeout_seconds == 30);
    REQUIRE(cfg.chat.history_limit == 2000);
}

// ── endpoint / client_options ────────────────────────────────────

TEST_CASE("Config::endpoint: resolves base_url", "[config]") {
    Config cfg;
    cfg.base_url = "http://gpu-box:8080/ollama";
    Endpoint ep = cfg.endpoint();
    REQUIRE(ep.host == "gpu-box");
    REQUIRE(ep.port == 8080);
    REQUIRE(ep.base_path == "/ollama");
}

TEST_CASE("Config::endpoint: https is rejected", "[config]") {
    Config cfg;
    cfg.base_url = "https://localhost:11434";
    REQUIRE_THROWS_AS(cfg.endpoint(), std::invalid_argument);
}

TEST_CASE("Config::client_options: carries limits and sampling", "[config]") {
    Config cfg;
    cfg.timeout_seconds = 5;
    cfg.max_json_depth = 16;
    cfg.temperature = 0.2;
    cfg.max_tokens = 100;
    ClientOptions opts = cfg.client_options();
    REQUIRE(opts.timeout_ms == 5000);
    REQUIRE(opts.max_json_depth == 16);
    REQUIRE(opts.temperature.value() == 0.2);
    REQUIRE(opts.max_tokens == 100);
}

TEST_CASE("Config::client_options: timeout stays positive and bounded", "[config]") {
    Config cfg;
    cfg.timeout_seconds = 4294967295u;
    REQUIRE(cfg.client_options().timeout_ms == INT_MAX);

    cfg.timeout_seconds = kMaxTimeoutSeconds;
    REQUIRE(cfg.client_options().timeout_ms == 86400000);

    cfg.timeout_seconds = 0;
    REQUIRE(cfg.client_options().timeout_ms == 1000);
}

TEST_CASE("Config::from_json: out-of-range timeout keeps the default", "[config]") {
    REQUIRE(Config::from_json(nlohmann::json::parse(R"({"timeout_seconds": 0})")).timeout_seconds == 30);
    REQUIRE(Config::from_json(nlohmann::json::parse(R"({"timeout_seconds": 86401})")).timeout_seconds == 30);
    REQUIRE(Config::from_json(nlohmann::json::parse(R"({"timeout_seconds": 4294967295})")).timeout_seconds == 30);
    REQUIRE(Config::from_json(nlohmann::json::parse(R"({"timeout_seconds": 86400})")).timeout_seconds == 86400);
    REQUIRE(Config::from_json(nlohmann::json::parse(R"({"timeout_seconds": 1})")).timeout_seconds == 1);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "forge_cfg_XXXXXX";
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
        unsetenv("OLLAMA_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("OLLAMA_BASE_URL");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.forge/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.forge");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::path: under HOME", "[config]") {
    ConfigTestGuard g;
    REQUIRE(Config::path() == g.config_path());
}

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "model": "codellama:7b",
        "base_url": "http://box:9999",
        "temperature": 0.5,
        "max_tokens": 256,
        "timeout_seconds": 10,
        "max_json_depth": 64,
        "chat": { "history_limit": 4000, "history_keep": 3000 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.model == "codellama:7b");
    REQUIRE(cfg.base_url == "http://box:9999");
    REQUIRE(cfg.temperature == 0.5);
    REQUIRE(cfg.max_tokens == 256);
    REQUIRE(cfg.timeout_seconds == 10);
    REQUIRE(cfg.max_json_depth == 64);
    REQUIRE(cfg.chat.history_limit == 4000);
    REQUIRE(cfg.chat.history_keep == 3000);
}

TEST_CASE("Config::load: OLLAMA_BASE_URL overrides config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"base_url": "http://from-file:1"})");
    setenv("OLLAMA_BASE_URL", "http://from-env:2", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://from-env:2");
    REQUIRE(cfg.endpoint().host == "from-env");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.temperature == 0.7);
}

TEST_CASE("Config::load: missing config file uses defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.base_url == "http://localhost:11434");
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));
    auto j = g.read_config();
    REQUIRE(j == Config::defaults_json());
}

TEST_CASE("Config::load: merges missing keys into existing file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": "mistral", "chat": {"history_limit": 900}, "custom": true})");

    Config cfg = Config::load();
    REQUIRE(cfg.model == "mistral");
    REQUIRE(cfg.chat.history_limit == 900);
    REQUIRE(cfg.chat.history_keep == 1500);

    auto j = g.read_config();
    REQUIRE(j["model"] == "mistral");
    REQUIRE(j["custom"] == true);
    REQUIRE(j["chat"]["history_limit"] == 900);
    REQUIRE(j["chat"]["history_keep"] == 1500);
    REQUIRE(j["base_url"] == "http://localhost:11434");
}

TEST_CASE("Config::load: complete file is left untouched", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string content = Config::defaults_json().dump() + "\n";
    g.write_config(content);
    Config::load();

    std::ifstream f(g.config_path());
    std::stringstream ss;
    ss << f.rdbuf();
    REQUIRE(ss.str() == content);
}

// ── modify_config_json / config_get / config_set ─────────────────

TEST_CASE("modify_config_json: writes changes atomically", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    REQUIRE(modify_config_json([](nlohmann::json& j) { j["model"] = "phi3"; }));
    REQUIRE(g.read_config()["model"] == "phi3");
    REQUIRE(Config::load().model == "phi3");

    for (const auto& entry : std::filesystem::directory_iterator(g.dir + "/.forge")) {
        REQUIRE(entry.path().filename() == "config.json");
    }
}

TEST_CASE("config_get: dotted keys", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(config_get(j, "model").value() == "llama3.2");
    REQUIRE(config_get(j, "chat.history_keep").value() == 1500);
    REQUIRE(config_get(j, "chat").value().is_object());
    REQUIRE_FALSE(config_get(j, "chat.nope"));
    REQUIRE_FALSE(config_get(j, "model.inner"));
}

TEST_CASE("config_set: coerces to the default's type", "[config]") {
    auto j = Config::defaults_json();
    std::string error;

    REQUIRE(config_set(j, "model", "mistral", error));
    REQUIRE(j["model"] == "mistral");

    REQUIRE(config_set(j, "temperature", "0.25", error));
    REQUIRE(j["temperature"] == 0.25);

    REQUIRE(config_set(j, "chat.history_limit", "3000", error));
    REQUIRE(j["chat"]["history_limit"] == 3000);

    REQUIRE(Config::from_json(j).chat.history_limit == 3000);
}

TEST_CASE("config_set: rejects unknown keys and bad values", "[config]") {
    auto j = Config::defaults_json();
    std::string error;

    REQUIRE_FALSE(config_set(j, "nope", "1", error));
    REQUIRE(error.find("Unknown") != std::string::npos);

    REQUIRE_FALSE(config_set(j, "chat", "1", error));
    REQUIRE_FALSE(config_set(j, "max_tokens", "-1", error));
    REQUIRE_FALSE(config_set(j, "max_tokens", "12abc", error));
    REQUIRE_FALSE(config_set(j, "max_tokens", "99999999999", error));
    REQUIRE_FALSE(config_set(j, "temperature", "warm", error));
    REQUIRE_FALSE(config_set(j, "temperature", "0.5x", error));

    REQUIRE(j == Config::defaults_json());
}

TEST_CASE("config_set: timeout_seconds limited to 1..86400", "[config]") {
    auto j = Config::defaults_json();
    std::string error;

    REQUIRE_FALSE(config_set(j, "timeout_seconds", "0", error));
    REQUIRE_FALSE(config_set(j, "timeout_seconds", "86401", error));
    REQUIRE_FALSE(config_set(j, "timeout_seconds", "4294967295", error));
    REQUIRE(j["timeout_seconds"] == 30);

    REQUIRE(config_set(j, "timeout_seconds", "1", error));
    REQUIRE(j["timeout_seconds"] == 1);
    REQUIRE(config_set(j, "timeout_seconds", "86400", error));
    REQUIRE(Config::from_json(j).timeout_seconds == 86400);
}
