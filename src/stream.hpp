#pragma once
#include "http.hpp"
#include "json.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forge {

class Transport;

enum class StreamMode {
    SingleValue,   // whole body is one JSON value
    LineDelimited, // newline-delimited values, decoded as they arrive
};

enum class StreamStatus {
    Active,    // more values may follow
    Completed, // body ended or a value carried "done": true
    Cancelled, // stopped on request; values already yielded stand
    Failed,    // an error was thrown; the connection is closed
};

const char* stream_status_name(StreamStatus status);

struct StreamOptions {
    StreamMode mode = StreamMode::SingleValue;
    JsonParseOptions json;
    // Checked before each value is pulled. Owned by the caller.
    const std::atomic<bool>* cancel = nullptr;
};

struct StreamResult {
    std::vector<JsonValue> values;
    StreamStatus status = StreamStatus::Active;
};

// One request/response exchange. Owns the connection from the moment the
// request has been written until the body is consumed, the session is
// cancelled, or an error occurs; the connection is closed exactly once on
// every one of those paths.
//
// Values are produced on demand by next(): a forward-only sequence that
// cannot be restarted.
class StreamSession {
public:
    StreamSession(std::unique_ptr<Transport> transport, StreamOptions options);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Read the status line and headers. Called at most once before next().
    const HttpResponseHead& read_head();

    // Next decoded value, or nullopt when the sequence is over (check
    // status() to tell completion from cancellation). Throws
    // ConnectionError, ProtocolError or JsonError; calling it again after a
    // cancellation or failure throws ConnectionError::Closed.
    std::optional<JsonValue> next();

    // Stop now: close the connection and mark the session Cancelled.
    void cancel();

    // Pull everything that is left.
    StreamResult collect();

    // Remaining body as raw text (for error responses).
    std::string read_body_text();

    StreamStatus status() const { return status_; }
    StreamMode mode() const { return options_.mode; }

private:
    std::optional<JsonValue> next_single();
    std::optional<JsonValue> next_line_delimited();
    void finish(StreamStatus status);

    std::unique_ptr<Transport> transport_;
    ResponseReader reader_;
    StreamOptions options_;
    StreamStatus status_ = StreamStatus::Active;
    std::string pending_; // body bytes not yet consumed by the JSON parser
    size_t consumed_ = 0; // body bytes before pending_
    bool body_ended_ = false;
};

} // namespace forge
