#include "chunked.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cstdio>

namespace forge {

namespace {
constexpr size_t kMaxChunkLine = 4096;
constexpr size_t kMaxHexDigits = 15;  // keeps the size within 60 bits
constexpr const char* kPhase = "chunked body";
} // namespace

// Accumulate bytes into line_ until '\n'. Returns true once a full line
// (without its CR/LF) is in line_.
bool ChunkedDecoder::take_line(std::string_view input, size_t& pos) {
    while (pos < input.size()) {
        char c = input[pos++];
        if (c == '\n') {
            if (!line_.empty() && line_.back() == '\r') line_.pop_back();
            return true;
        }
        line_ += c;
        if (line_.size() > kMaxChunkLine) {
            if (state_ == State::ReadingSize)
                throw ProtocolError(ProtocolErrorKind::BadChunkSize, kPhase,
                                    "chunk size line too long");
            throw ProtocolError(ProtocolErrorKind::MalformedChunk, kPhase,
                                "trailer line too long");
        }
    }
    return false;
}

void ChunkedDecoder::parse_size_line() {
    // Chunk extensions after ';' are ignored.
    std::string_view digits(line_);
    size_t semi = digits.find(';');
    if (semi != std::string_view::npos) digits = digits.substr(0, semi);
    while (!digits.empty() && (digits.back() == ' ' || digits.back() == '\t'))
        digits.remove_suffix(1);

    if (digits.empty())
        throw ProtocolError(ProtocolErrorKind::BadChunkSize, kPhase, "empty chunk size");
    if (digits.size() > kMaxHexDigits)
        throw ProtocolError(ProtocolErrorKind::BadChunkSize, kPhase,
                            "chunk size too large: " + std::string(digits));

    uint64_t size = 0;
    for (char h : digits) {
        size <<= 4;
        if (h >= '0' && h <= '9')      size |= static_cast<uint64_t>(h - '0');
        else if (h >= 'a' && h <= 'f') size |= static_cast<uint64_t>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') size |= static_cast<uint64_t>(h - 'A' + 10);
        else
            throw ProtocolError(ProtocolErrorKind::BadChunkSize, kPhase,
                                "non-hex chunk size: " + line_);
    }

    remaining_ = size;
    state_ = (size == 0) ? State::ReadingTrailers : State::ReadingData;
}

size_t ChunkedDecoder::feed(std::string_view input, std::string& out) {
    size_t pos = 0;
    while (pos < input.size() && state_ != State::Done) {
        switch (state_) {
            case State::ReadingSize:
                if (!take_line(input, pos)) break;
                parse_size_line();
                line_.clear();
                break;

            case State::ReadingData: {
                size_t take = static_cast<size_t>(
                    std::min<uint64_t>(remaining_, input.size() - pos));
                out.append(input.data() + pos, take);
                pos += take;
                remaining_ -= take;
                if (remaining_ == 0) {
                    state_ = State::ReadingChunkCRLF;
                    saw_cr_ = false;
                }
                break;
            }

            case State::ReadingChunkCRLF: {
                char c = input[pos++];
                if (c == '\r' && !saw_cr_) {
                    saw_cr_ = true;
                } else if (c == '\n') {
                    state_ = State::ReadingSize;
                } else {
                    throw ProtocolError(ProtocolErrorKind::MalformedChunk, kPhase,
                                        "missing CRLF after chunk data");
                }
                break;
            }

            case State::ReadingTrailers:
                if (!take_line(input, pos)) break;
                // Trailer headers are ignored; a blank line ends the body.
                if (line_.empty()) state_ = State::Done;
                line_.clear();
                break;

            case State::Done:
                break;
        }
    }
    return pos;
}

void ChunkedDecoder::finish() const {
    if (state_ != State::Done) {
        throw ProtocolError(ProtocolErrorKind::TruncatedBody, kPhase,
                            "connection closed before the final chunk");
    }
}

std::string chunked_encode(std::string_view payload, const std::vector<size_t>& sizes) {
    std::string out;
    size_t pos = 0;
    size_t turn = 0;
    bool cut = std::any_of(sizes.begin(), sizes.end(), [](size_t s) { return s > 0; });
    while (pos < payload.size()) {
        size_t want = payload.size() - pos;
        if (cut) {
            size_t s = sizes[turn++ % sizes.size()];
            if (s == 0) continue;
            want = std::min(want, s);
        }
        char head[32];
        std::snprintf(head, sizeof(head), "%zx\r\n", want);
        out += head;
        out.append(payload.data() + pos, want);
        out += "\r\n";
        pos += want;
    }
    out += "0\r\n\r\n";
    return out;
}

} // namespace forge
