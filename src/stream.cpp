#include "stream.hpp"
#include "errors.hpp"
#include "transport.hpp"

namespace forge {

const char* stream_status_name(StreamStatus status) {
    switch (status) {
        case StreamStatus::Active:    return "active";
        case StreamStatus::Completed: return "completed";
        case StreamStatus::Cancelled: return "cancelled";
        case StreamStatus::Failed:    return "failed";
    }
    return "unknown";
}

StreamSession::StreamSession(std::unique_ptr<Transport> transport, StreamOptions options)
    : transport_(std::move(transport)), reader_(*transport_), options_(options) {}

StreamSession::~StreamSession() {
    transport_->close();
}

void StreamSession::finish(StreamStatus status) {
    status_ = status;
    transport_->close();
}

void StreamSession::cancel() {
    if (status_ == StreamStatus::Active) finish(StreamStatus::Cancelled);
}

const HttpResponseHead& StreamSession::read_head() {
    try {
        return reader_.read_head();
    } catch (const std::exception&) {
        finish(StreamStatus::Failed);
        throw;
    }
}

std::string StreamSession::read_body_text() {
    if (status_ != StreamStatus::Active)
        throw ConnectionError(ConnectionErrorKind::Closed, "session is no longer active");
    try {
        std::string body = reader_.read_body_all();
        finish(StreamStatus::Completed);
        return body;
    } catch (const std::exception&) {
        finish(StreamStatus::Failed);
        throw;
    }
}

std::optional<JsonValue> StreamSession::next() {
    switch (status_) {
        case StreamStatus::Completed:
            return std::nullopt;
        case StreamStatus::Cancelled:
            throw ConnectionError(ConnectionErrorKind::Closed, "session was cancelled");
        case StreamStatus::Failed:
            throw ConnectionError(ConnectionErrorKind::Closed, "session failed earlier");
        case StreamStatus::Active:
            break;
    }

    if (options_.cancel && options_.cancel->load(std::memory_order_relaxed)) {
        finish(StreamStatus::Cancelled);
        return std::nullopt;
    }

    try {
        return options_.mode == StreamMode::SingleValue ? next_single()
                                                        : next_line_delimited();
    } catch (const std::exception&) {
        finish(StreamStatus::Failed);
        throw;
    }
}

std::optional<JsonValue> StreamSession::next_single() {
    std::string body = reader_.read_body_all();

    JsonPrefix parsed = parse_value_prefix(body, options_.json);
    size_t rest = body.find_first_not_of(" \t\r\n", parsed.consumed);
    if (rest != std::string::npos) {
        throw ProtocolError(ProtocolErrorKind::TrailingData, "body",
                            "unexpected data after JSON value at byte " + std::to_string(rest));
    }

    finish(StreamStatus::Completed);
    return std::move(parsed.value);
}

std::optional<JsonValue> StreamSession::next_line_delimited() {
    while (true) {
        size_t start = pending_.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            consumed_ += pending_.size();
            pending_.clear();
        } else if (start > 0) {
            consumed_ += start;
            pending_.erase(0, start);
        }

        if (!pending_.empty()) {
            try {
                JsonPrefix parsed = parse_value_prefix(pending_, options_.json);

                // A number touching the end of the buffer may still grow.
                bool may_grow = parsed.value.is_number() && parsed.consumed == pending_.size();
                if (!may_grow || body_ended_) {
                    consumed_ += parsed.consumed;
                    pending_.erase(0, parsed.consumed);
                    if (parsed.value.get_bool("done")) finish(StreamStatus::Completed);
                    return std::move(parsed.value);
                }
            } catch (const JsonError& e) {
                // Offsets count from the start of the body.
                if (!e.incomplete())
                    throw JsonError(e.kind(), consumed_ + e.offset(), e.detail());
                if (body_ended_) {
                    throw ProtocolError(ProtocolErrorKind::TruncatedJson, "stream",
                                        "body ended inside a JSON value (" +
                                        std::to_string(pending_.size()) + " bytes pending)");
                }
            }
        } else if (body_ended_) {
            finish(StreamStatus::Completed);
            return std::nullopt;
        }

        std::string chunk = reader_.read_body_some();
        if (chunk.empty()) {
            body_ended_ = true;
        } else {
            pending_ += chunk;
        }
    }
}

StreamResult StreamSession::collect() {
    StreamResult result;
    while (auto value = next()) {
        result.values.push_back(std::move(*value));
    }
    result.status = status_;
    return result;
}

} // namespace forge
