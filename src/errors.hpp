#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace forge {

// ── Connection failures (socket level) ─────────────────────────

enum class ConnectionErrorKind { Refused, Timeout, Reset, Dns, Closed, Io };

const char* connection_error_kind_name(ConnectionErrorKind kind);

class ConnectionError : public std::runtime_error {
public:
    ConnectionError(ConnectionErrorKind kind, const std::string& detail)
        : std::runtime_error(std::string("connection error (") +
                             connection_error_kind_name(kind) + "): " + detail),
          kind_(kind) {}

    ConnectionErrorKind kind() const { return kind_; }

private:
    ConnectionErrorKind kind_;
};

// ── HTTP framing / protocol violations ─────────────────────────

enum class ProtocolErrorKind {
    InvalidRequest,
    MalformedStatusLine,
    InvalidHeader,
    HeaderTooLarge,
    BadChunkSize,
    MalformedChunk,
    TruncatedBody,
    TrailingData,
    TruncatedJson,
};

const char* protocol_error_kind_name(ProtocolErrorKind kind);

class ProtocolError : public std::runtime_error {
public:
    // phase names where in the exchange the violation was found,
    // e.g. "status line", "chunked body".
    ProtocolError(ProtocolErrorKind kind, std::string phase, const std::string& detail)
        : std::runtime_error("protocol error in " + phase + " (" +
                             protocol_error_kind_name(kind) + "): " + detail),
          kind_(kind), phase_(std::move(phase)) {}

    ProtocolErrorKind kind() const { return kind_; }
    const std::string& phase() const { return phase_; }

private:
    ProtocolErrorKind kind_;
    std::string phase_;
};

// ── JSON syntax errors ─────────────────────────────────────────

enum class JsonErrorKind {
    UnexpectedEnd,
    UnexpectedToken,
    UnterminatedString,
    InvalidEscape,
    InvalidNumber,
    DepthExceeded,
    TrailingData,
};

const char* json_error_kind_name(JsonErrorKind kind);

class JsonError : public std::runtime_error {
public:
    JsonError(JsonErrorKind kind, size_t offset, const std::string& detail)
        : std::runtime_error("JSON error at byte " + std::to_string(offset) + " (" +
                             json_error_kind_name(kind) + "): " + detail),
          kind_(kind), offset_(offset), detail_(detail) {}

    JsonErrorKind kind() const { return kind_; }
    size_t offset() const { return offset_; }
    const std::string& detail() const { return detail_; }

    // True when the input ran out before a value was complete, i.e. more
    // bytes could still turn it into valid JSON.
    bool incomplete() const {
        return kind_ == JsonErrorKind::UnexpectedEnd ||
               kind_ == JsonErrorKind::UnterminatedString;
    }

private:
    JsonErrorKind kind_;
    size_t offset_;
    std::string detail_;
};

} // namespace forge
