#include "http.hpp"
#include "errors.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace forge {

namespace {
constexpr size_t kMaxHeadBytes = 64 * 1024;
} // namespace

bool header_name_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

const std::string* find_header(const std::vector<Header>& headers, std::string_view name) {
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        if (header_name_equals(it->first, name)) return &it->second;
    }
    return nullptr;
}

void set_header(std::vector<Header>& headers, const std::string& name, const std::string& value) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const Header& h) { return header_name_equals(h.first, name); }),
                  headers.end());
    headers.emplace_back(name, value);
}

// ── Request building ───────────────────────────────────────────

static bool has_line_break(std::string_view s) {
    return s.find_first_of("\r\n") != std::string_view::npos;
}

static bool is_token(std::string_view s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (c <= 0x20 || c >= 0x7f || c == ':' || c == '(' || c == ')' || c == ',' ||
            c == '/' || c == ';' || c == '<' || c == '>' || c == '=' || c == '?' ||
            c == '@' || c == '[' || c == ']' || c == '\\' || c == '{' || c == '}' || c == '"')
            return false;
    }
    return true;
}

static void reject(const std::string& detail) {
    throw ProtocolError(ProtocolErrorKind::InvalidRequest, "request", detail);
}

std::string build_request(const HttpRequest& request, const std::string& host) {
    if (!is_token(request.method)) reject("invalid method '" + request.method + "'");
    if (request.path.empty() || request.path[0] != '/' ||
        request.path.find_first_of(" \t\r\n") != std::string::npos)
        reject("invalid request path '" + request.path + "'");

    for (const auto& [name, value] : request.headers) {
        if (!is_token(name)) reject("invalid header name '" + name + "'");
        if (has_line_break(value)) reject("CR/LF in value of header " + name);
        if (header_name_equals(name, "Transfer-Encoding"))
            reject("request bodies are always sent with Content-Length");
    }

    const std::string* host_value = find_header(request.headers, "Host");
    if (!host_value && (host.empty() || has_line_break(host)))
        reject("missing or invalid Host");

    std::string req;
    req.reserve(256 + (request.body ? request.body->size() : 0));
    req += request.method + " " + request.path + " HTTP/1.1\r\n";
    if (!host_value) req += "Host: " + host + "\r\n";

    for (const auto& [name, value] : request.headers) {
        if (header_name_equals(name, "Content-Length")) continue;
        req += name + ": " + value + "\r\n";
    }
    if (request.body)
        req += "Content-Length: " + std::to_string(request.body->size()) + "\r\n";
    req += "\r\n";
    if (request.body) req += *request.body;
    return req;
}

// ── Response head parsing ──────────────────────────────────────

TransferFraming select_framing(const std::vector<Header>& headers, int status_code) {
    if ((status_code >= 100 && status_code < 200) || status_code == 204 || status_code == 304)
        return FixedLength{0};

    if (const std::string* te = find_header(headers, "transfer-encoding")) {
        // chunked must be the final coding; anything else is read to close.
        auto codings = split(to_lower(*te), ',');
        if (!codings.empty() && trim(codings.back()) == "chunked") return Chunked{};
        return UntilClose{};
    }

    if (const std::string* cl = find_header(headers, "content-length")) {
        std::string digits = trim(*cl);
        if (digits.empty() || digits.size() > 18 ||
            digits.find_first_not_of("0123456789") != std::string::npos) {
            throw ProtocolError(ProtocolErrorKind::InvalidHeader, "headers",
                                "invalid Content-Length '" + *cl + "'");
        }
        return FixedLength{std::stoull(digits)};
    }
    return UntilClose{};
}

static void parse_status_line(std::string_view line, HttpResponseHead& head) {
    auto bad = [&](const std::string& why) {
        throw ProtocolError(ProtocolErrorKind::MalformedStatusLine, "status line",
                            why + ": '" + std::string(line) + "'");
    };

    // "HTTP/1.1 200 OK"
    if (line.size() < 12 || line.substr(0, 5) != "HTTP/") bad("missing HTTP version");
    if (!std::isdigit(static_cast<unsigned char>(line[5])) || line[6] != '.' ||
        !std::isdigit(static_cast<unsigned char>(line[7])) || line[5] != '1')
        bad("unsupported HTTP version");
    if (line[8] != ' ') bad("expected space after version");

    std::string_view code = line.substr(9, 3);
    for (char c : code) {
        if (!std::isdigit(static_cast<unsigned char>(c))) bad("non-numeric status code");
    }
    head.status_code = (code[0] - '0') * 100 + (code[1] - '0') * 10 + (code[2] - '0');
    if (head.status_code < 100) bad("status code out of range");

    if (line.size() > 12) {
        if (line[12] != ' ') bad("expected space after status code");
        head.reason = std::string(line.substr(13));
    }
}

HttpResponseHead parse_response_head(std::string_view head_text) {
    HttpResponseHead head;
    size_t pos = 0;
    bool first = true;

    while (pos < head_text.size()) {
        size_t eol = head_text.find('\n', pos);
        if (eol == std::string_view::npos) eol = head_text.size();
        std::string_view line = head_text.substr(pos, eol - pos);
        pos = eol + 1;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (first) {
            parse_status_line(line, head);
            first = false;
            continue;
        }
        if (line.empty()) break;

        if (line[0] == ' ' || line[0] == '\t') {
            throw ProtocolError(ProtocolErrorKind::InvalidHeader, "headers",
                                "folded header lines are not supported");
        }
        size_t colon = line.find(':');
        if (colon == std::string_view::npos || !is_token(line.substr(0, colon))) {
            throw ProtocolError(ProtocolErrorKind::InvalidHeader, "headers",
                                "malformed header line '" + std::string(line) + "'");
        }

        std::string name = to_lower(std::string(line.substr(0, colon)));
        std::string value = trim(std::string(line.substr(colon + 1)));
        head.headers.emplace_back(std::move(name), std::move(value));
    }

    if (first) {
        throw ProtocolError(ProtocolErrorKind::MalformedStatusLine, "status line",
                            "empty response head");
    }
    head.framing = select_framing(head.headers, head.status_code);
    return head;
}

// ── ResponseReader ─────────────────────────────────────────────

ResponseReader::ResponseReader(Transport& transport, size_t read_size)
    : transport_(transport), read_size_(std::max<size_t>(read_size, 1)) {}

// One transport read appended to buffer_; false on orderly close.
bool ResponseReader::fill() {
    std::string chunk = transport_.read(read_size_);
    if (chunk.empty()) return false;
    buffer_ += chunk;
    return true;
}

const HttpResponseHead& ResponseReader::read_head() {
    if (head_read_) return head_;

    size_t scan_from = 0;
    while (true) {
        // End of head: a blank line, CRLF or bare LF.
        size_t end = std::string::npos;
        size_t body_start = 0;
        for (size_t i = scan_from; i < buffer_.size(); ++i) {
            if (buffer_[i] != '\n') continue;
            if (i + 1 < buffer_.size() && buffer_[i + 1] == '\n') {
                end = i + 1;
                body_start = i + 2;
                break;
            }
            if (i + 2 < buffer_.size() && buffer_[i + 1] == '\r' && buffer_[i + 2] == '\n') {
                end = i + 1;
                body_start = i + 3;
                break;
            }
        }

        if (end != std::string::npos) {
            head_ = parse_response_head(std::string_view(buffer_).substr(0, end));
            buffer_.erase(0, body_start);
            break;
        }

        if (buffer_.size() > kMaxHeadBytes) {
            throw ProtocolError(ProtocolErrorKind::HeaderTooLarge, "headers",
                                "response head exceeds " + std::to_string(kMaxHeadBytes) + " bytes");
        }
        scan_from = buffer_.size() >= 2 ? buffer_.size() - 2 : 0;

        if (!fill()) {
            if (buffer_.empty()) {
                throw ConnectionError(ConnectionErrorKind::Closed,
                                      "server closed the connection without a response");
            }
            throw ProtocolError(ProtocolErrorKind::TruncatedBody, "headers",
                                "connection closed inside the response head");
        }
    }

    head_read_ = true;
    if (const auto* fixed = std::get_if<FixedLength>(&head_.framing)) {
        remaining_ = fixed->length;
        body_done_ = (remaining_ == 0);
    }
    return head_;
}

std::string ResponseReader::read_body_some() {
    if (!head_read_) read_head();
    if (body_done_) return {};

    std::string out;

    if (std::holds_alternative<Chunked>(head_.framing)) {
        while (true) {
            if (!buffer_.empty()) {
                size_t used = chunked_.feed(buffer_, out);
                buffer_.erase(0, used);
                if (chunked_.done()) {
                    body_done_ = true;
                    buffer_.clear();
                }
                if (!out.empty() || body_done_) return out;
            }
            if (!fill()) {
                chunked_.finish();
                body_done_ = true;
                return out;
            }
        }
    }

    if (std::holds_alternative<FixedLength>(head_.framing)) {
        if (buffer_.empty() && !fill()) {
            throw ProtocolError(ProtocolErrorKind::TruncatedBody, "body",
                                "connection closed with " + std::to_string(remaining_) +
                                " body bytes outstanding");
        }
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, buffer_.size()));
        out.assign(buffer_, 0, take);
        buffer_.erase(0, take);
        remaining_ -= take;
        if (remaining_ == 0) {
            body_done_ = true;
            buffer_.clear();
        }
        return out;
    }

    // UntilClose
    if (buffer_.empty() && !fill()) {
        body_done_ = true;
        return out;
    }
    out.swap(buffer_);
    return out;
}

std::string ResponseReader::read_body_all() {
    std::string body;
    while (!body_done_) body += read_body_some();
    return body;
}

} // namespace forge
