#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace forge {

// Where the inference server lives. Resolved once from configuration and
// passed explicitly to whoever opens connections.
struct Endpoint {
    std::string host = "localhost";
    uint16_t port = 11434;
    std::string base_path; // prefix prepended to API paths, no trailing '/'

    // Value for the Host header ("host" or "host:port").
    std::string host_header() const;
};

// Parse "http://host[:port][/prefix]". Throws std::invalid_argument on a
// malformed URL or a scheme other than http.
Endpoint parse_base_url(const std::string& url);

// Blocking byte stream over one connection.
class Transport {
public:
    virtual ~Transport() = default;

    // Write all bytes. Throws ConnectionError.
    virtual void write(std::string_view bytes) = 0;

    // Read up to max_bytes. An empty result means the peer closed the
    // connection. Throws ConnectionError (Timeout when no byte arrives
    // within the per-read timeout, Closed after close()) and
    // std::invalid_argument when max_bytes is zero.
    virtual std::string read(size_t max_bytes) = 0;

    // Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// POSIX TCP socket. Owns exactly one file descriptor.
class SocketTransport : public Transport {
public:
    // Resolve and connect; no retries. Throws ConnectionError
    // (Dns, Refused, Timeout, Io).
    static std::unique_ptr<SocketTransport> connect(const std::string& host,
                                                    uint16_t port,
                                                    int timeout_ms);

    // Adopt an already-connected descriptor.
    SocketTransport(int fd, int timeout_ms);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void write(std::string_view bytes) override;
    std::string read(size_t max_bytes) override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }

private:
    void wait_for(short events, const char* what);

    int fd_;
    int timeout_ms_;
};

// Opens transports to an endpoint (injectable for testing).
class Connector {
public:
    virtual ~Connector() = default;
    virtual std::unique_ptr<Transport> connect(const Endpoint& endpoint, int timeout_ms) = 0;
};

class SocketConnector : public Connector {
public:
    std::unique_ptr<Transport> connect(const Endpoint& endpoint, int timeout_ms) override;
};

} // namespace forge
