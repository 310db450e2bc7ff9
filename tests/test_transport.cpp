#include <catch2/catch_test_macros.hpp>
#include "transport.hpp"
#include "errors.hpp"
#include "loopback_server.hpp"
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <stdexcept>

using namespace forge;

static const char* kRequest = "GET / HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";

// A port nothing listens on: bind one, note it, release it.
static uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

static std::string read_all(Transport& t) {
    std::string out;
    while (true) {
        std::string chunk = t.read(1024);
        if (chunk.empty()) return out;
        out += chunk;
    }
}

// ── parse_base_url ───────────────────────────────────────────────

TEST_CASE("parse_base_url: host and port", "[transport]") {
    auto ep = parse_base_url("http://localhost:11434");
    REQUIRE(ep.host == "localhost");
    REQUIRE(ep.port == 11434);
    REQUIRE(ep.base_path.empty());
    REQUIRE(ep.host_header() == "localhost:11434");
}

TEST_CASE("parse_base_url: default port and path prefix", "[transport]") {
    auto ep = parse_base_url("http://gpu-box/ollama/");
    REQUIRE(ep.host == "gpu-box");
    REQUIRE(ep.port == 80);
    REQUIRE(ep.base_path == "/ollama");
    REQUIRE(ep.host_header() == "gpu-box");
}

TEST_CASE("parse_base_url: rejects unsupported or malformed URLs", "[transport]") {
    REQUIRE_THROWS_AS(parse_base_url("https://localhost:11434"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("ftp://host"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("localhost:11434"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("http://:11434"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("http://host:"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("http://host:abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("http://host:70000"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_base_url("http://host:0"), std::invalid_argument);
}

// ── SocketTransport over loopback ────────────────────────────────

TEST_CASE("SocketTransport: request and response over loopback", "[transport]") {
    LoopbackServer server;
    server.pieces = {"HTTP/1.1 200 OK\r\n", "Content-Length: 2\r\n\r\n", "ok"};
    server.start();

    auto t = SocketTransport::connect("127.0.0.1", server.port(), 2000);
    REQUIRE(t->is_open());
    t->write(kRequest);

    std::string response = read_all(*t);
    REQUIRE(response == "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    REQUIRE(server.received() == kRequest);
}

TEST_CASE("SocketTransport: orderly close reads as empty", "[transport]") {
    LoopbackServer server;
    server.start();

    auto t = SocketTransport::connect("127.0.0.1", server.port(), 2000);
    t->write(kRequest);
    REQUIRE(t->read(64).empty());
}

TEST_CASE("SocketTransport: zero-byte read is rejected", "[transport]") {
    LoopbackServer server;
    server.pieces = {"HTTP/1.1 200 OK\r\n\r\n"};
    server.start();

    auto t = SocketTransport::connect("127.0.0.1", server.port(), 2000);
    t->write(kRequest);
    REQUIRE_THROWS_AS(t->read(0), std::invalid_argument);
    REQUIRE(read_all(*t) == "HTTP/1.1 200 OK\r\n\r\n");
}

TEST_CASE("SocketTransport: connection refused", "[transport]") {
    uint16_t port = unused_port();
    try {
        SocketTransport::connect("127.0.0.1", port, 2000);
        FAIL("expected ConnectionError");
    } catch (const ConnectionError& e) {
        REQUIRE(e.kind() == ConnectionErrorKind::Refused);
    }
}

TEST_CASE("SocketTransport: silent server times out", "[transport]") {
    LoopbackServer server;
    server.hold_open = true;
    server.start();

    auto t = SocketTransport::connect("127.0.0.1", server.port(), 150);
    t->write(kRequest);
    try {
        t->read(64);
        FAIL("expected ConnectionError");
    } catch (const ConnectionError& e) {
        REQUIRE(e.kind() == ConnectionErrorKind::Timeout);
    }
}

TEST_CASE("SocketTransport: use after close", "[transport]") {
    LoopbackServer server;
    server.start();

    auto t = SocketTransport::connect("127.0.0.1", server.port(), 2000);
    t->write(kRequest);
    t->close();
    t->close(); // idempotent
    REQUIRE_FALSE(t->is_open());

    try {
        t->read(64);
        FAIL("expected ConnectionError");
    } catch (const ConnectionError& e) {
        REQUIRE(e.kind() == ConnectionErrorKind::Closed);
    }
    REQUIRE_THROWS_AS(t->write("x"), ConnectionError);
}

TEST_CASE("SocketConnector: connects to the endpoint", "[transport]") {
    LoopbackServer server;
    server.pieces = {"HTTP/1.1 204 No Content\r\n\r\n"};
    server.start();

    Endpoint ep;
    ep.host = "127.0.0.1";
    ep.port = server.port();

    SocketConnector connector;
    auto t = connector.connect(ep, 2000);
    t->write(kRequest);
    REQUIRE(read_all(*t) == "HTTP/1.1 204 No Content\r\n\r\n");
}
