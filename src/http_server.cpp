#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace ptrnotes {

// ── Request accessors ─────────────────────────────────────────────────────────

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string port_str = addr.substr(pos + 1);
    if (port_str.empty() || port_str.size() > 5) return false;
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
    }
    int p = std::stoi(port_str);
    if (p <= 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

const char* http_reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr,
                       uint32_t max_body,
                       uint32_t workers,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , workers_(workers == 0 ? 1 : workers)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::close_fds() {
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

bool HttpServer::start(std::string& error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_fds();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    // Several workers poll the same socket; the ones that lose the race for a
    // connection must get EAGAIN instead of blocking in accept().
    int flags = ::fcntl(server_fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
        error = "Failed to make server socket non-blocking";
        close_fds();
        return false;
    }

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_fds();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    if (::listen(server_fd_, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    running_.store(true);
    threads_.reserve(workers_);
    for (uint32_t i = 0; i < workers_; ++i) {
        threads_.emplace_back([this]() { accept_loop(); });
    }
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    // The byte is never consumed, so every worker sees the pipe readable.
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) != 1) {
        std::cerr << "[server] Failed to signal shutdown pipe: " << std::strerror(errno) << "\n";
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    close_fds();
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;  // another worker took it

        // Accepted sockets may inherit O_NONBLOCK (BSD); serve them blocking.
        int cflags = ::fcntl(cfd, F_GETFL, 0);
        if (cflags >= 0) ::fcntl(cfd, F_SETFL, cflags & ~O_NONBLOCK);

        struct timeval tv{};
        tv.tv_sec  = static_cast<time_t>(io_timeout_.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((io_timeout_.count() % 1000) * 1000);
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(cfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        handle_connection(cfd);
        ::close(cfd);
    }
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

using Deadline = std::chrono::steady_clock::time_point;

static int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Wait for the socket to become ready, at most until the deadline.
static bool wait_ready(int fd, short events, Deadline deadline) {
    for (;;) {
        int ms = remaining_ms(deadline);
        if (ms == 0) return false;
        struct pollfd p{};
        p.fd = fd;
        p.events = events;
        int ret = ::poll(&p, 1, ms);
        if (ret > 0) return true;
        if (ret == 0 || errno != EINTR) return false;
    }
}

// recv() bounded by the deadline. Returns <= 0 on close, error or timeout.
static ssize_t recv_before(int fd, char* buf, size_t len, Deadline deadline) {
    if (!wait_ready(fd, POLLIN, deadline)) return -1;
    return ::recv(fd, buf, len, 0);
}

static bool send_all(int fd, const std::string& data, Deadline deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        if (!wait_ready(fd, POLLOUT, deadline)) return false;
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent,
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

static void send_http_response(int fd, const HttpResponse& resp, Deadline deadline) {
    std::string out =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + http_reason_phrase(resp.status) + "\r\n";
    if (!resp.content_type.empty()) {
        out += "Content-Type: " + resp.content_type + "\r\n";
    }
    for (const auto& [name, value] : resp.headers) {
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n"
           "Connection: close\r\n\r\n" + resp.body;

    if (!send_all(fd, out, deadline)) {
        std::cerr << "[server] Dropped response " << resp.status
                  << ": client did not read it in time\n";
    }
}

static void send_http_response(int fd, int status, const std::string& body, Deadline deadline) {
    HttpResponse resp;
    resp.status = status;
    resp.body = body;
    send_http_response(fd, resp, deadline);
}

void HttpServer::handle_connection(int fd) const {
    // The whole request (headers and body) must arrive within one timeout.
    const Deadline read_deadline = std::chrono::steady_clock::now() + io_timeout_;
    auto write_deadline = [this]() { return std::chrono::steady_clock::now() + io_timeout_; };

    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv_before(fd, tmp, sizeof(tmp), read_deadline);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_http_response(fd, 400, "Headers too large", write_deadline());
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_http_response(fd, 400, "Malformed request line", write_deadline());
            return;
        }
        req.path = pq.substr(0, pq.find('?'));
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read body if one is announced.
    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        try {
            content_len = std::stoul(it->second);
        } catch (const std::exception&) {
            send_http_response(fd, 400, "Invalid Content-Length", write_deadline());
            return;
        }
    }

    if (content_len > max_body_) {
        send_http_response(fd, 413, "Payload too large", write_deadline());
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = recv_before(fd, tmp, sizeof(tmp), read_deadline);
        if (n <= 0) return;  // truncated or too slow
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    HttpResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error for " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        resp = HttpResponse{};
        resp.status = 500;
        resp.body = "Internal server error";
    }
    send_http_response(fd, resp, write_deadline());
}

} // namespace ptrnotes
