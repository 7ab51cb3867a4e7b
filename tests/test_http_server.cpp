#include <catch2/catch_test_macros.hpp>
#include "http_server.hpp"
#include "mcp_server.hpp"
#include "note_store.hpp"
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

using namespace ptrnotes;

// Per-process port so parallel test runs do not collide.
static uint16_t test_port(uint16_t offset) {
    return static_cast<uint16_t>(20000 + (getpid() % 20000) + offset);
}

static std::string test_addr(uint16_t port) {
    return "127.0.0.1:" + std::to_string(port);
}

// Send a raw request and read the full response (server closes the connection).
static std::string roundtrip(uint16_t port, const std::string& raw) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return "";
    }
    ::send(fd, raw.data(), raw.size(), 0);

    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}

// Open a connection without reading from it.
static int connect_to(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

static std::string post_request(const std::string& path, const std::string& body,
                                const std::string& extra_headers = "") {
    return "POST " + path + " HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: application/json\r\n" + extra_headers +
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

static std::string body_of(const std::string& response) {
    auto pos = response.find("\r\n\r\n");
    return pos == std::string::npos ? "" : response.substr(pos + 4);
}

// ── parse_listen_addr ─────────────────────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[http_server]") {
    std::string host; uint16_t port;
    REQUIRE(parse_listen_addr("127.0.0.1:8000", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8000);
}

TEST_CASE("parse_listen_addr: missing colon returns false", "[http_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1", host, port));
}

TEST_CASE("parse_listen_addr: non-numeric port returns false", "[http_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:notaport", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:80x", host, port));
}

TEST_CASE("parse_listen_addr: empty string and empty host return false", "[http_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8000", host, port));
}

TEST_CASE("parse_listen_addr: out of range ports are rejected", "[http_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:0", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:65536", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:", host, port));
}

// ── HttpRequest accessors ─────────────────────────────────────────────────────

TEST_CASE("HttpRequest::header: case-insensitive lookup", "[http_server]") {
    HttpRequest req;
    req.headers = {{"mcp-session-id", "abc"}};
    REQUIRE(req.header("Mcp-Session-Id") == "abc");
    REQUIRE(req.header("mcp-session-id") == "abc");
    REQUIRE(req.header("Accept").empty());
}

TEST_CASE("http_reason_phrase: common statuses", "[http_server]") {
    REQUIRE(std::string(http_reason_phrase(200)) == "OK");
    REQUIRE(std::string(http_reason_phrase(202)) == "Accepted");
    REQUIRE(std::string(http_reason_phrase(404)) == "Not Found");
    REQUIRE(std::string(http_reason_phrase(413)) == "Payload Too Large");
}

// ── HttpServer lifecycle ──────────────────────────────────────────────────────

TEST_CASE("HttpServer: invalid listen address fails to start", "[http_server]") {
    HttpServer server("nonsense", 1024, 1, [](const HttpRequest&) { return HttpResponse{}; });
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid listen address") != std::string::npos);
    REQUIRE_FALSE(server.running());
}

TEST_CASE("HttpServer: unparseable bind host fails to start", "[http_server]") {
    HttpServer server("not-an-ip:" + std::to_string(test_port(0)), 1024, 1,
                      [](const HttpRequest&) { return HttpResponse{}; });
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid bind address") != std::string::npos);
}

TEST_CASE("HttpServer: parses request and returns handler response", "[http_server]") {
    uint16_t port = test_port(1);
    HttpRequest seen;
    std::mutex seen_mutex;
    HttpServer server(test_addr(port), 1024, 2, [&](const HttpRequest& req) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen = req;
        HttpResponse resp;
        resp.status = 200;
        resp.content_type = "application/json";
        resp.headers.emplace_back("X-Test", "yes");
        resp.body = R"({"ok":true})";
        return resp;
    });
    std::string error;
    REQUIRE(server.start(error));

    auto raw = roundtrip(port, post_request("/mcp?x=a%20b", "hello", "X-Custom: Value\r\n"));
    server.stop();

    REQUIRE(raw.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(raw.find("X-Test: yes\r\n") != std::string::npos);
    REQUIRE(raw.find("Content-Length: 11\r\n") != std::string::npos);
    REQUIRE(body_of(raw) == R"({"ok":true})");

    std::lock_guard<std::mutex> lock(seen_mutex);
    REQUIRE(seen.method == "POST");
    REQUIRE(seen.path == "/mcp");
    REQUIRE(seen.header("x-custom") == "Value");
    REQUIRE(seen.body == "hello");
}

TEST_CASE("HttpServer: oversized body gets 413", "[http_server]") {
    uint16_t port = test_port(2);
    std::atomic<int> calls{0};
    HttpServer server(test_addr(port), 8, 1, [&](const HttpRequest&) {
        calls++;
        return HttpResponse{};
    });
    std::string error;
    REQUIRE(server.start(error));

    auto raw = roundtrip(port, post_request("/mcp", "0123456789"));
    server.stop();

    REQUIRE(raw.rfind("HTTP/1.1 413", 0) == 0);
    REQUIRE(calls.load() == 0);
}

TEST_CASE("HttpServer: handler exception becomes 500", "[http_server]") {
    uint16_t port = test_port(3);
    HttpServer server(test_addr(port), 1024, 1, [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("boom");
    });
    std::string error;
    REQUIRE(server.start(error));

    auto raw = roundtrip(port, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    server.stop();

    REQUIRE(raw.rfind("HTTP/1.1 500", 0) == 0);
}

TEST_CASE("HttpServer: stop is idempotent and start after stop works", "[http_server]") {
    uint16_t port = test_port(4);
    HttpServer server(test_addr(port), 1024, 3, [](const HttpRequest&) { return HttpResponse{}; });
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(server.running());
    server.stop();
    server.stop();
    REQUIRE_FALSE(server.running());

    REQUIRE(server.start(error));
    auto raw = roundtrip(port, "GET / HTTP/1.1\r\n\r\n");
    REQUIRE(raw.rfind("HTTP/1.1 200", 0) == 0);
}

// ── Slow clients ─────────────────────────────────────────────────────────────

TEST_CASE("HttpServer: query string is stripped from the path", "[http_server]") {
    uint16_t port = test_port(7);
    std::string seen_path;
    std::mutex seen_mutex;
    HttpServer server(test_addr(port), 1024, 1, [&](const HttpRequest& req) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen_path = req.path;
        return HttpResponse{};
    });
    std::string error;
    REQUIRE(server.start(error));
    auto raw = roundtrip(port, "GET /health?verbose=1 HTTP/1.1\r\n\r\n");
    server.stop();

    REQUIRE(raw.rfind("HTTP/1.1 200", 0) == 0);
    std::lock_guard<std::mutex> lock(seen_mutex);
    REQUIRE(seen_path == "/health");
}

TEST_CASE("HttpServer: trickling request body does not hold the worker", "[http_server]") {
    uint16_t port = test_port(8);
    HttpServer server(test_addr(port), 1024, 1, [](const HttpRequest&) { return HttpResponse{}; });
    server.set_io_timeout(std::chrono::milliseconds(300));
    std::string error;
    REQUIRE(server.start(error));

    int slow = connect_to(port);
    REQUIRE(slow >= 0);
    std::string head = "POST /mcp HTTP/1.1\r\nContent-Length: 100\r\n\r\n";
    ::send(slow, head.data(), head.size(), MSG_NOSIGNAL);

    // One byte every 50ms keeps each recv() well inside any per-call timeout.
    std::atomic<bool> done{false};
    std::thread trickle([&]() {
        for (int i = 0; i < 100 && !done.load(); ++i) {
            if (::send(slow, "x", 1, MSG_NOSIGNAL) != 1) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    auto raw = roundtrip(port, "GET / HTTP/1.1\r\n\r\n");
    long waited = elapsed_ms(start);

    done.store(true);
    trickle.join();
    ::close(slow);
    server.stop();

    REQUIRE(raw.rfind("HTTP/1.1 200", 0) == 0);
    REQUIRE(waited < 2500);
}

TEST_CASE("HttpServer: client that never reads does not hold the worker", "[http_server]") {
    uint16_t port = test_port(9);
    const std::string big(32 * 1024 * 1024, 'a');
    HttpServer server(test_addr(port), 1024, 1, [&big](const HttpRequest& req) {
        HttpResponse resp;
        resp.body = req.path == "/big" ? big : "small";
        return resp;
    });
    server.set_io_timeout(std::chrono::milliseconds(300));
    std::string error;
    REQUIRE(server.start(error));

    int stalled = connect_to(port);
    REQUIRE(stalled >= 0);
    std::string req = "GET /big HTTP/1.1\r\n\r\n";
    ::send(stalled, req.data(), req.size(), MSG_NOSIGNAL);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    auto raw = roundtrip(port, "GET /small HTTP/1.1\r\n\r\n");
    long waited = elapsed_ms(start);

    ::close(stalled);
    server.stop();

    REQUIRE(raw.rfind("HTTP/1.1 200", 0) == 0);
    REQUIRE(body_of(raw) == "small");
    REQUIRE(waited < 3000);
}

// ── End to end with the MCP server ────────────────────────────────────────────

TEST_CASE("HttpServer + McpServer: tool calls over the wire", "[http_server]") {
    uint16_t port = test_port(5);
    NoteStore store;
    McpServer mcp(create_note_tools(store));
    HttpServer server(test_addr(port), 1048576, 4,
                      [&mcp](const HttpRequest& req) { return mcp.handle_http(req); });
    std::string error;
    REQUIRE(server.start(error));

    auto init = roundtrip(port, post_request("/mcp",
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})"));
    REQUIRE(init.rfind("HTTP/1.1 200", 0) == 0);
    REQUIRE(init.find("Mcp-Session-Id: ") != std::string::npos);

    auto add = roundtrip(port, post_request("/mcp",
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"add_note","arguments":{"text":"Call Bob"}}})"));
    auto add_json = nlohmann::json::parse(body_of(add));
    REQUIRE(add_json["result"]["isError"] == false);

    auto sse = roundtrip(port, post_request("/mcp",
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"read_notes","arguments":{}}})",
        "Accept: application/json, text/event-stream\r\n"));
    server.stop();

    REQUIRE(sse.find("Content-Type: text/event-stream") != std::string::npos);
    auto body = body_of(sse);
    auto data = body.find("data: ");
    REQUIRE(data != std::string::npos);
    auto payload = nlohmann::json::parse(body.substr(data + 6, body.find('\n', data) - data - 6));
    REQUIRE(payload["result"]["structuredContent"]["notes"][0]["text"] == "Call Bob");
}

TEST_CASE("HttpServer + McpServer: concurrent clients never duplicate ids", "[http_server]") {
    uint16_t port = test_port(6);
    NoteStore store;
    McpServer mcp(create_note_tools(store));
    HttpServer server(test_addr(port), 1048576, 4,
                      [&mcp](const HttpRequest& req) { return mcp.handle_http(req); });
    std::string error;
    REQUIRE(server.start(error));

    std::vector<std::thread> clients;
    std::atomic<int> ok{0};
    for (int i = 0; i < 20; ++i) {
        clients.emplace_back([port, i, &ok]() {
            nlohmann::json req = {
                {"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                {"params", {{"name", "add_note"}, {"arguments", {{"text", "note " + std::to_string(i)}}}}}
            };
            auto raw = roundtrip(port, post_request("/mcp", req.dump()));
            if (raw.rfind("HTTP/1.1 200", 0) == 0) ok++;
        });
    }
    for (auto& t : clients) t.join();
    server.stop();

    REQUIRE(ok.load() == 20);
    auto notes = store.list();
    REQUIRE(notes.size() == 20);
    std::set<uint64_t> ids;
    for (const auto& n : notes) ids.insert(n.id);
    REQUIRE(ids.size() == 20);
}
