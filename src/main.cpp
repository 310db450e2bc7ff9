#include "config.hpp"
#include "chat.hpp"
#include "edit.hpp"
#include "errors.hpp"
#include "provider.hpp"
#include "providers/ollama.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <unistd.h>
#include <nlohmann/json.hpp>

#ifndef FORGE_VERSION
#define FORGE_VERSION "dev"
#endif

// Set by SIGINT while a response is streaming; cleared before each request.
static std::atomic<bool> g_interrupt{false};
static std::atomic<bool> g_streaming{false};

static void signal_handler(int /*sig*/) {
    if (!g_streaming.load()) _exit(130);
    g_interrupt.store(true);
}

static void print_usage() {
    std::cout << "Usage: forge [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  chat                 Interactive chat with conversation history\n"
              << "  ask PROMPT...        Send a single prompt and stream the answer\n"
              << "  models               List models installed on the server\n"
              << "  test-ollama          Check the connection and run a short prompt\n"
              << "  edit FILE [INSTR...] Rewrite a file from an instruction (asks before writing)\n"
              << "  config show          Print the configuration file\n"
              << "  config get KEY       Print one setting (dotted keys, e.g. chat.history_limit)\n"
              << "  config set KEY VAL   Change one setting\n"
              << "  config reset         Restore the default configuration\n"
              << "\n"
              << "Options:\n"
              << "  --model NAME         Use specific model\n"
              << "  --url URL            Server base URL (default: http://localhost:11434)\n"
              << "  -v, --version        Show version\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Chat commands:\n"
              << "  /help                Show available commands\n"
              << "  /clear               Clear conversation history\n"
              << "  /history             Show conversation history\n"
              << "  exit, quit           Leave the chat\n"
              << "\n"
              << "Environment variables:\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (overrides config base_url)\n";
}

// A server that is still starting up refuses connections for a moment.
template <typename Fn>
static auto retry_refused(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const forge::ConnectionError& e) {
        if (e.kind() != forge::ConnectionErrorKind::Refused) throw;
        std::cerr << "[forge] Connection refused, retrying in 1s\n";
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
    return fn();
}

// Stream one response to stdout. Ctrl+C stops it and keeps what was printed.
static forge::GenerateResult stream_to_stdout(forge::OllamaClient& client,
                                              const std::string& model,
                                              const std::string& prompt) {
    auto print_delta = [](const std::string& delta) {
        std::cout << delta << std::flush;
        return true;
    };

    g_interrupt.store(false);
    g_streaming.store(true);
    forge::GenerateResult result;
    try {
        result = retry_refused([&] {
            return client.generate(model, prompt, print_delta, &g_interrupt);
        });
    } catch (const std::exception&) {
        g_streaming.store(false);
        throw;
    }
    g_streaming.store(false);

    if (result.status == forge::StreamStatus::Cancelled)
        std::cout << "\n[interrupted]";
    std::cout << "\n";
    return result;
}

static int cmd_ask(forge::OllamaClient& client, const forge::Config& config,
                   const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: forge ask PROMPT...\n";
        return 1;
    }
    std::string prompt;
    for (const auto& a : args) {
        if (!prompt.empty()) prompt += ' ';
        prompt += a;
    }
    stream_to_stdout(client, config.model, prompt);
    return 0;
}

static int cmd_models(forge::OllamaClient& client) {
    auto models = retry_refused([&] { return client.list_models(); });
    if (models.empty()) {
        std::cout << "No models installed. Install one with: ollama pull llama3.2\n";
        return 0;
    }
    for (const auto& name : models) std::cout << name << "\n";
    return 0;
}

static int cmd_test_ollama(forge::OllamaClient& client, const forge::Config& config) {
    const auto& ep = client.endpoint();
    std::cout << "Server: " << ep.host << ":" << ep.port << ep.base_path << "\n";

    auto models = retry_refused([&] { return client.list_models(); });
    std::cout << "Installed models: " << models.size() << "\n";
    for (const auto& name : models) std::cout << "  " << name << "\n";
    if (models.empty()) {
        std::cerr << "Error: no models installed (try: ollama pull " << config.model << ")\n";
        return 1;
    }

    std::string model = forge::pick_model(models, config.model);
    std::cout << "Testing " << model << "...\n";
    std::string reply = client.generate_text(model, "Reply with a one sentence greeting.");
    std::cout << reply << "\n";
    return 0;
}

static bool confirm(const std::string& question) {
    std::cout << question << " (y/N): " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return forge::to_lower(forge::trim(answer)) == "y";
}

static int cmd_edit(forge::OllamaClient& client, const forge::Config& config,
                    const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: forge edit FILE [INSTRUCTION...]\n";
        return 1;
    }
    const std::string& path = args[0];
    std::cout << "File: " << path << "\n";

    auto content = forge::read_text_file(path);
    if (!content) {
        if (!confirm("File does not exist. Create it?")) {
            std::cout << "Operation cancelled.\n";
            return 0;
        }
        if (!forge::atomic_write_file(path, "")) {
            std::cerr << "Error: could not create " << path << "\n";
            return 1;
        }
        content = std::string();
    }
    std::cout << "Current content (" << content->size() << " characters):\n"
              << "---\n" << *content << "\n---\n";

    std::string instruction;
    for (size_t i = 1; i < args.size(); ++i) {
        if (!instruction.empty()) instruction += ' ';
        instruction += args[i];
    }
    if (instruction.empty()) {
        std::cout << "Instruction: " << std::flush;
        std::getline(std::cin, instruction);
        instruction = forge::trim(instruction);
    }
    if (instruction.empty()) {
        std::cout << "No instruction provided.\n";
        return 0;
    }

    std::cout << "Generating changes...\n";
    std::string reply = retry_refused([&] {
        return client.generate_text(config.model, forge::build_edit_prompt(*content, instruction));
    });
    std::string updated = forge::strip_code_fence(reply);

    std::cout << "Proposed changes:\n---\n" << updated << "\n---\n";
    if (!confirm("Apply these changes?")) {
        std::cout << "Changes discarded.\n";
        return 0;
    }

    auto result = forge::apply_edit(path, *content, updated);
    if (!result.success) {
        std::cerr << "Error: " << result.output << "\n";
        return 1;
    }
    std::cout << result.output << "\n";
    return 0;
}

static void print_chat_help() {
    std::cout << "Commands:\n"
              << "  /help     Show this help\n"
              << "  /clear    Clear conversation history\n"
              << "  /history  Show conversation history\n"
              << "  exit      Leave the chat\n"
              << "  quit      Leave the chat\n"
              << "Press Ctrl+C while a response is streaming to stop it.\n";
}

static int cmd_chat(forge::OllamaClient& client, const forge::Config& config) {
    std::string model = config.model;
    try {
        auto models = retry_refused([&] { return client.list_models(); });
        if (models.empty()) {
            std::cerr << "No models installed. Install one with: ollama pull llama3.2\n";
            return 1;
        }
        model = forge::pick_model(models, config.model);
        if (model != config.model && model != config.model + ":latest")
            std::cerr << "[forge] Model " << config.model << " not installed, using " << model << "\n";
    } catch (const forge::ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[forge] Could not list models: " << e.what() << "\n";
    }

    forge::HistoryLimits limits;
    limits.limit = config.chat.history_limit;
    limits.keep = config.chat.history_keep;
    forge::Conversation conversation(limits);

    std::cout << "Forge Chat\n"
              << "Model: " << model << "\n"
              << "Type /help for commands, exit to leave.\n\n";

    std::string line;
    while (true) {
        std::cout << "forge> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        std::string input = forge::trim(line);
        if (input.empty()) continue;

        if (input == "exit" || input == "quit") {
            break;
        } else if (input == "/help") {
            print_chat_help();
            continue;
        } else if (input == "/clear") {
            conversation.clear();
            std::cout << "History cleared.\n";
            continue;
        } else if (input == "/history") {
            if (conversation.empty())
                std::cout << "No conversation history yet.\n";
            else
                std::cout << conversation.transcript();
            continue;
        }

        try {
            auto result = stream_to_stdout(client, model, conversation.build_prompt(input));
            conversation.record(input, result.text);
        } catch (const std::exception& e) {
            std::cerr << "\nError: " << e.what() << "\n";
        }
        std::cout << "\n";
    }
    return 0;
}

static int cmd_config(const std::vector<std::string>& args) {
    std::string action = args.empty() ? "show" : args[0];

    if (action == "show" || action == "get") {
        forge::Config::load(); // creates the file with defaults if needed
        std::ifstream file(forge::Config::path());
        nlohmann::json j = nlohmann::json::parse(file);
        if (action == "show") {
            std::cout << j.dump(4) << "\n";
            return 0;
        }
        if (args.size() != 2) {
            std::cerr << "Usage: forge config get KEY\n";
            return 1;
        }
        auto value = forge::config_get(j, args[1]);
        if (!value) {
            std::cerr << "Error: unknown key " << args[1] << "\n";
            return 1;
        }
        std::cout << (value->is_string() ? value->get<std::string>() : value->dump()) << "\n";
        return 0;
    }

    if (action == "set") {
        if (args.size() != 3) {
            std::cerr << "Usage: forge config set KEY VALUE\n";
            return 1;
        }
        std::string error;
        bool ok = true;
        bool written = forge::modify_config_json([&](nlohmann::json& j) {
            ok = forge::config_set(j, args[1], args[2], error);
        });
        if (!ok) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        if (!written) {
            std::cerr << "Error: could not write " << forge::Config::path() << "\n";
            return 1;
        }
        std::cout << args[1] << " = " << args[2] << "\n";
        return 0;
    }

    if (action == "reset") {
        bool written = forge::modify_config_json([](nlohmann::json& j) {
            j = forge::Config::defaults_json();
        });
        if (!written) {
            std::cerr << "Error: could not write " << forge::Config::path() << "\n";
            return 1;
        }
        std::cout << "Configuration reset to defaults.\n";
        return 0;
    }

    std::cerr << "Unknown config action: " << action << "\n";
    return 1;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string model_name;
    std::string base_url;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "forge " << FORGE_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            base_url = argv[++i];
        } else if (argv[i][0] == '-' && positional.empty()) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    std::string command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "config") return cmd_config(args);

    auto config = forge::Config::load();

    // Override config with CLI args
    if (!model_name.empty()) config.model = model_name;
    if (!base_url.empty()) config.base_url = base_url;

    forge::SocketConnector connector;
    forge::OllamaClient client(connector, config.endpoint(), config.client_options());

    std::signal(SIGINT, signal_handler);

    if (command == "chat") return cmd_chat(client, config);
    if (command == "ask") return cmd_ask(client, config, args);
    if (command == "models") return cmd_models(client);
    if (command == "test-ollama") return cmd_test_ollama(client, config);
    if (command == "edit") return cmd_edit(client, config, args);

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
