#pragma once
#include "../provider.hpp"
#include "../json.hpp"
#include "../stream.hpp"
#include "../transport.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forge {

struct ClientOptions {
    int timeout_ms = 30000; // per read, not per request
    size_t max_json_depth = kDefaultJsonMaxDepth;
    std::optional<double> temperature;
    uint32_t max_tokens = 0; // 0 = server default
};

// What a caller asks for. The body is serialized as JSON; stream selects
// newline-delimited decoding of the response.
struct ApiRequest {
    std::string method = "POST";
    std::string path;
    std::optional<JsonValue> body;
    bool stream = false;
    const std::atomic<bool>* cancel = nullptr;
};

// Client for a local Ollama-compatible inference server. Every call opens
// one connection, sends one request and reads one response; nothing is
// shared between calls, so separate calls may run on separate threads.
class OllamaClient {
public:
    OllamaClient(Connector& connector, Endpoint endpoint, ClientOptions options = {});

    // Send the request and return its decoded response as a lazy sequence.
    // Non-2xx responses throw std::runtime_error with the server's text.
    std::unique_ptr<StreamSession> request(const ApiRequest& req);

    // POST /api/generate. With on_delta set the response is streamed and
    // each "response" fragment is passed on as it arrives.
    GenerateResult generate(const std::string& model,
                            const std::string& prompt,
                            const TextDeltaCallback& on_delta = nullptr,
                            const std::atomic<bool>* cancel = nullptr);

    // Non-streaming generate returning just the text.
    std::string generate_text(const std::string& model, const std::string& prompt);

    // POST /api/chat, streaming "message.content" fragments when on_delta is set.
    GenerateResult chat(const std::string& model,
                        const std::vector<ChatMessage>& messages,
                        const TextDeltaCallback& on_delta = nullptr,
                        const std::atomic<bool>* cancel = nullptr);

    // GET /api/tags: names of installed models.
    std::vector<std::string> list_models();

    const Endpoint& endpoint() const { return endpoint_; }

private:
    JsonValue request_body(const std::string& model, bool stream) const;
    GenerateResult run(const ApiRequest& req, const std::string& model,
                       const TextDeltaCallback& on_delta,
                       std::string (*extract)(const JsonValue&));

    Connector& connector_;
    Endpoint endpoint_;
    ClientOptions options_;
};

} // namespace forge
