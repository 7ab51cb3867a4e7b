#pragma once
#include <string>
#include <functional>
#include <map>
#include <vector>
#include <utility>
#include <atomic>
#include <chrono>
#include <thread>
#include <cstdint>

namespace ptrnotes {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", "DELETE", ...
    std::string path;     // e.g. "/mcp", query string stripped
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a header value (name is matched case-insensitively), or "" if absent.
    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::vector<std::pair<std::string, std::string>> headers; // extra response headers
    std::string body;
};

// Minimal HTTP/1.1 server on POSIX sockets. One request per connection
// (Connection: close). `workers` threads share the listening socket, so up
// to `workers` requests are handled concurrently; the handler must be
// thread-safe.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8000"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t workers, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start the worker threads. Returns false and populates
    // error on failure.
    bool start(std::string& error);

    // Signal the workers to stop and join them.
    void stop();

    bool running() const { return running_.load(); }

    // Bound on reading a whole request and, separately, on writing the
    // response. Slow or stalled clients are dropped. Set before start().
    void set_io_timeout(std::chrono::milliseconds timeout) { io_timeout_ = timeout; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;
    void close_fds();

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    workers_;
    Handler     handler_;
    std::chrono::milliseconds io_timeout_{10000};

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Standard reason phrase for a status code ("OK", "Not Found", ...).
const char* http_reason_phrase(int status);

} // namespace ptrnotes
