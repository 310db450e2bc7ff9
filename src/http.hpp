#pragma once
#include "chunked.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace forge {

class Transport;

using Header = std::pair<std::string, std::string>;

// Case-insensitive header name comparison.
bool header_name_equals(std::string_view a, std::string_view b);

// Last header with the given name (case-insensitive), or nullptr.
const std::string* find_header(const std::vector<Header>& headers, std::string_view name);

// Replace every header with that name by a single one, or append it.
void set_header(std::vector<Header>& headers, const std::string& name, const std::string& value);

// ── Request ────────────────────────────────────────────────────

struct HttpRequest {
    std::string method = "GET";
    std::string path = "/";
    std::vector<Header> headers;
    std::optional<std::string> body;
};

// Serialize a request for the wire. Adds Host (unless the caller set one)
// and an exact Content-Length when a body is present. Throws
// ProtocolError::InvalidRequest on CR/LF in the method, path or headers.
std::string build_request(const HttpRequest& request, const std::string& host);

// ── Response head ──────────────────────────────────────────────

struct FixedLength { uint64_t length = 0; };
struct Chunked {};
struct UntilClose {};

// Where the body ends. Chosen once from the headers.
using TransferFraming = std::variant<FixedLength, Chunked, UntilClose>;

struct HttpResponseHead {
    int status_code = 0;
    std::string reason;
    std::vector<Header> headers; // names lowercased, arrival order
    TransferFraming framing = UntilClose{};

    // Last value wins for repeated headers.
    const std::string* header(std::string_view name) const { return find_header(headers, name); }
    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Chunked beats Content-Length; neither means read until close. Responses
// that cannot carry a body (1xx, 204, 304) get FixedLength{0}.
// Throws ProtocolError::InvalidHeader on a malformed Content-Length.
TransferFraming select_framing(const std::vector<Header>& headers, int status_code);

// Parse the status line and header block (everything before the blank
// line). Throws ProtocolError.
HttpResponseHead parse_response_head(std::string_view head);

// Reads one response from a transport: first the head, then the body as a
// byte stream with the framing already removed.
class ResponseReader {
public:
    explicit ResponseReader(Transport& transport, size_t read_size = 4096);

    // Read and parse the head, tolerating it arriving across many reads.
    const HttpResponseHead& read_head();
    const HttpResponseHead& head() const { return head_; }

    // Next run of body bytes; empty once the body is complete.
    // Throws ProtocolError::TruncatedBody if the connection closes early.
    std::string read_body_some();

    // Drain the rest of the body.
    std::string read_body_all();

    bool body_done() const { return body_done_; }

private:
    bool fill();

    Transport& transport_;
    size_t read_size_;
    std::string buffer_; // received but not yet handed out
    HttpResponseHead head_;
    bool head_read_ = false;
    bool body_done_ = false;
    uint64_t remaining_ = 0; // FixedLength only
    ChunkedDecoder chunked_;
};

} // namespace forge
