// POSIX socket transport: non-blocking connect with a timeout, then
// poll()-guarded blocking reads and writes with a per-call timeout.
#include "transport.hpp"
#include "errors.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace forge {

// ── URL parsing ────────────────────────────────────────────────

std::string Endpoint::host_header() const {
    if (port == 80) return host;
    return host + ":" + std::to_string(port);
}

Endpoint parse_base_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL (missing scheme): " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https")
        throw std::invalid_argument("https is not supported, use http://: " + url);
    if (scheme != "http")
        throw std::invalid_argument("unsupported URL scheme '" + scheme + "': " + url);

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    Endpoint ep;
    ep.base_path = (path_start == std::string::npos) ? "" : url.substr(path_start);
    while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos) {
        ep.host = host_port.substr(0, colon);
        std::string port = host_port.substr(colon + 1);
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos)
            throw std::invalid_argument("invalid port in URL: " + url);
        unsigned long p = std::stoul(port);
        if (p == 0 || p > 65535)
            throw std::invalid_argument("port out of range in URL: " + url);
        ep.port = static_cast<uint16_t>(p);
    } else {
        ep.host = host_port;
        ep.port = 80;
    }
    if (ep.host.empty())
        throw std::invalid_argument("invalid URL (missing host): " + url);
    return ep;
}

// ── SocketTransport ────────────────────────────────────────────

static ConnectionErrorKind kind_for_errno(int err) {
    switch (err) {
        case ECONNREFUSED: return ConnectionErrorKind::Refused;
        case ETIMEDOUT:    return ConnectionErrorKind::Timeout;
        case ECONNRESET:
        case EPIPE:
        case ECONNABORTED: return ConnectionErrorKind::Reset;
        default:           return ConnectionErrorKind::Io;
    }
}

std::unique_ptr<SocketTransport> SocketTransport::connect(const std::string& host,
                                                          uint16_t port,
                                                          int timeout_ms) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw ConnectionError(ConnectionErrorKind::Dns,
                              "cannot resolve " + host + ": " + gai_strerror(rc));
    }

    int fd = -1;
    int last_err = 0;
    bool timed_out = false;
    for (auto* ai = res; ai && fd < 0; ai = ai->ai_next) {
        int s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0) { last_err = errno; continue; }

        // Non-blocking connect so we can honour timeout_ms.
        int flags = fcntl(s, F_GETFL, 0);
        fcntl(s, F_SETFL, flags | O_NONBLOCK);

        bool connected = false;
        rc = ::connect(s, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd{s, POLLOUT, 0};
            int ready;
            do {
                ready = ::poll(&pfd, 1, timeout_ms);
            } while (ready < 0 && errno == EINTR);

            if (ready > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(s, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) connected = true;
                else last_err = err;
            } else if (ready == 0) {
                timed_out = true;
            } else {
                last_err = errno;
            }
        } else {
            last_err = errno;
        }

        if (connected) {
            fcntl(s, F_SETFL, flags);
            fd = s;
        } else {
            ::close(s);
        }
    }
    freeaddrinfo(res);

    std::string target = host + ":" + std::to_string(port);
    if (fd < 0) {
        if (last_err == 0 && timed_out)
            throw ConnectionError(ConnectionErrorKind::Timeout, "connect to " + target + " timed out");
        throw ConnectionError(kind_for_errno(last_err),
                              "connect to " + target + ": " + std::strerror(last_err));
    }

#ifdef SO_NOSIGPIPE  // macOS
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    return std::make_unique<SocketTransport>(fd, timeout_ms);
}

SocketTransport::SocketTransport(int fd, int timeout_ms)
    : fd_(fd), timeout_ms_(timeout_ms) {}

SocketTransport::~SocketTransport() {
    close();
}

void SocketTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// Block until the socket is ready for events, or throw Timeout.
void SocketTransport::wait_for(short events, const char* what) {
    struct pollfd pfd{fd_, events, 0};
    while (true) {
        int ready = ::poll(&pfd, 1, timeout_ms_);
        if (ready > 0) return;
        if (ready == 0) {
            throw ConnectionError(ConnectionErrorKind::Timeout,
                                  std::string(what) + " timed out after " +
                                  std::to_string(timeout_ms_) + " ms");
        }
        if (errno != EINTR)
            throw ConnectionError(kind_for_errno(errno), std::string(what) + ": " + std::strerror(errno));
    }
}

void SocketTransport::write(std::string_view bytes) {
    if (fd_ < 0) throw ConnectionError(ConnectionErrorKind::Closed, "write on closed transport");

    const char* buf = bytes.data();
    size_t len = bytes.size();
    while (len > 0) {
        wait_for(POLLOUT, "write");
        ssize_t n = ::send(fd_, buf, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw ConnectionError(kind_for_errno(errno), std::string("send: ") + std::strerror(errno));
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
}

std::string SocketTransport::read(size_t max_bytes) {
    if (fd_ < 0) throw ConnectionError(ConnectionErrorKind::Closed, "read on closed transport");
    // An empty result is reserved for end of stream.
    if (max_bytes == 0) throw std::invalid_argument("read of zero bytes");

    std::string out(max_bytes, '\0');
    while (true) {
        wait_for(POLLIN, "read");
        ssize_t n = ::recv(fd_, &out[0], max_bytes, 0);
        if (n >= 0) {
            out.resize(static_cast<size_t>(n));
            return out;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        throw ConnectionError(kind_for_errno(errno), std::string("recv: ") + std::strerror(errno));
    }
}

// ── SocketConnector ────────────────────────────────────────────

std::unique_ptr<Transport> SocketConnector::connect(const Endpoint& endpoint, int timeout_ms) {
    return SocketTransport::connect(endpoint.host, endpoint.port, timeout_ms);
}

} // namespace forge
