#include "ollama.hpp"
#include "../errors.hpp"
#include "../http.hpp"
#include "../util.hpp"
#include <stdexcept>

namespace forge {

OllamaClient::OllamaClient(Connector& connector, Endpoint endpoint, ClientOptions options)
    : connector_(connector), endpoint_(std::move(endpoint)), options_(options) {}

// Ollama reports failures as {"error": "..."}; fall back to the raw text.
static std::string error_text(const std::string& body) {
    try {
        JsonValue v = parse_one(body);
        std::string msg = v.get_string("error");
        if (!msg.empty()) return msg;
    } catch (const JsonError&) {
        // not JSON, use as is
    }
    return trim(body);
}

std::unique_ptr<StreamSession> OllamaClient::request(const ApiRequest& req) {
    HttpRequest http;
    http.method = req.method;
    http.path = endpoint_.base_path + req.path;
    http.headers = {
        {"Accept", "application/json"},
        {"Connection", "close"},
    };
    if (req.body) {
        http.headers.emplace_back("Content-Type", "application/json");
        http.body = serialize(*req.body);
    }

    // Build first so a bad request never opens a socket.
    std::string wire = build_request(http, endpoint_.host_header());

    auto transport = connector_.connect(endpoint_, options_.timeout_ms);
    transport->write(wire);

    StreamOptions so;
    so.mode = req.stream ? StreamMode::LineDelimited : StreamMode::SingleValue;
    so.json.max_depth = options_.max_json_depth;
    so.cancel = req.cancel;

    auto session = std::make_unique<StreamSession>(std::move(transport), so);
    const HttpResponseHead& head = session->read_head();
    if (!head.ok()) {
        std::string body = session->read_body_text();
        throw std::runtime_error("Ollama API error (HTTP " +
            std::to_string(head.status_code) + "): " + error_text(body));
    }
    return session;
}

JsonValue OllamaClient::request_body(const std::string& model, bool stream) const {
    JsonValue body = JsonValue::object();
    body.set("model", model);
    body.set("stream", stream);

    JsonValue opts = JsonValue::object();
    if (options_.temperature) opts.set("temperature", *options_.temperature);
    if (options_.max_tokens > 0) opts.set("num_predict", options_.max_tokens);
    if (opts.size() > 0) body.set("options", std::move(opts));
    return body;
}

GenerateResult OllamaClient::run(const ApiRequest& req, const std::string& model,
                                 const TextDeltaCallback& on_delta,
                                 std::string (*extract)(const JsonValue&)) {
    auto session = request(req);

    GenerateResult result;
    result.model = model;

    while (auto value = session->next()) {
        std::string err = value->get_string("error");
        if (!err.empty()) throw std::runtime_error("Ollama stream error: " + err);

        std::string delta = extract(*value);
        if (!delta.empty()) {
            result.text += delta;
            if (on_delta && !on_delta(delta)) {
                session->cancel();
                break;
            }
        }

        result.model = value->get_string("model", result.model);
        if (value->get_bool("done")) {
            result.done = true;
            result.usage.prompt_tokens =
                static_cast<uint32_t>(value->get_int("prompt_eval_count"));
            result.usage.completion_tokens =
                static_cast<uint32_t>(value->get_int("eval_count"));
            result.usage.total_tokens =
                result.usage.prompt_tokens + result.usage.completion_tokens;
        }
    }

    result.status = session->status();
    return result;
}

static std::string generate_delta(const JsonValue& v) {
    return v.get_string("response");
}

static std::string chat_delta(const JsonValue& v) {
    const JsonValue* msg = v.find("message");
    return msg ? msg->get_string("content") : std::string();
}

GenerateResult OllamaClient::generate(const std::string& model,
                                      const std::string& prompt,
                                      const TextDeltaCallback& on_delta,
                                      const std::atomic<bool>* cancel) {
    bool stream = static_cast<bool>(on_delta);
    JsonValue body = request_body(model, stream);
    body.set("prompt", prompt);

    ApiRequest req;
    req.path = "/api/generate";
    req.body = std::move(body);
    req.stream = stream;
    req.cancel = cancel;
    return run(req, model, on_delta, generate_delta);
}

std::string OllamaClient::generate_text(const std::string& model, const std::string& prompt) {
    return generate(model, prompt).text;
}

GenerateResult OllamaClient::chat(const std::string& model,
                                  const std::vector<ChatMessage>& messages,
                                  const TextDeltaCallback& on_delta,
                                  const std::atomic<bool>* cancel) {
    bool stream = static_cast<bool>(on_delta);
    JsonValue body = request_body(model, stream);

    JsonValue msgs = JsonValue::array();
    for (const auto& msg : messages) {
        JsonValue m = JsonValue::object();
        m.set("role", role_to_string(msg.role));
        m.set("content", msg.content);
        msgs.push_back(std::move(m));
    }
    body.set("messages", std::move(msgs));

    ApiRequest req;
    req.path = "/api/chat";
    req.body = std::move(body);
    req.stream = stream;
    req.cancel = cancel;
    return run(req, model, on_delta, chat_delta);
}

std::vector<std::string> OllamaClient::list_models() {
    ApiRequest req;
    req.method = "GET";
    req.path = "/api/tags";

    auto session = request(req);
    auto value = session->next();

    std::vector<std::string> names;
    const JsonValue* models = value ? value->find("models") : nullptr;
    if (!models || !models->is_array()) return names;

    for (const auto& m : models->as_array()) {
        std::string name = m.get_string("name");
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

} // namespace forge
