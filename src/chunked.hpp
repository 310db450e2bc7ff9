#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

// Incremental decoder for HTTP/1.1 chunked transfer-encoding.
// Input may arrive in fragments of any size; partial size lines and partial
// chunk data are carried over between feed() calls.
class ChunkedDecoder {
public:
    enum class State { ReadingSize, ReadingData, ReadingChunkCRLF, ReadingTrailers, Done };

    // Decode as much of input as possible, appending payload bytes to out.
    // Returns the number of input bytes consumed. That is input.size()
    // unless the terminating chunk completed partway through, in which case
    // the bytes after it are left unconsumed.
    // Throws ProtocolError (BadChunkSize, MalformedChunk).
    size_t feed(std::string_view input, std::string& out);

    // The underlying stream closed. Throws ProtocolError::TruncatedBody
    // unless the zero-size chunk and trailers were seen.
    void finish() const;

    bool done() const { return state_ == State::Done; }
    State state() const { return state_; }

private:
    bool take_line(std::string_view input, size_t& pos);
    void parse_size_line();

    State state_ = State::ReadingSize;
    uint64_t remaining_ = 0;
    std::string line_;
    bool saw_cr_ = false;
};

// Encode payload as a chunked body, cutting chunks with the given sizes in
// turn (cycling when they run out), then the zero-size terminator.
// An empty sizes list sends the payload as one chunk.
std::string chunked_encode(std::string_view payload, const std::vector<size_t>& sizes = {});

} // namespace forge
