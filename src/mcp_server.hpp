#pragma once
#include "tool.hpp"
#include "http_server.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace ptrnotes {

constexpr const char* kServerName = "ptrnotes";
constexpr const char* kServerVersion = "0.1.0";

// Newest first; initialize falls back to the first entry.
extern const std::vector<std::string> kSupportedProtocolVersions;

// JSON-RPC 2.0 error codes
namespace rpc_error {
constexpr int ParseError     = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams  = -32602;
constexpr int InternalError  = -32603;
constexpr int SessionNotFound = -32001;
} // namespace rpc_error

nlohmann::json make_rpc_error(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json make_rpc_result(const nlohmann::json& id, nlohmann::json result);

// Model Context Protocol server over the streamable HTTP transport.
// Owns the tools; all entry points are safe to call from several HTTP
// worker threads at once.
class McpServer {
public:
    McpServer(std::vector<std::unique_ptr<Tool>> tools, std::string endpoint_path = "/mcp");

    // HTTP entry point: routes the endpoint path, manages sessions and
    // chooses JSON or SSE framing from the Accept header.
    HttpResponse handle_http(const HttpRequest& req);

    // Handle one JSON-RPC message. Returns std::nullopt for notifications.
    std::optional<nlohmann::json> dispatch(const nlohmann::json& message);

    // Sessions idle longer than idle_timeout are dropped; when max_sessions
    // are live, creating another evicts the least recently used one.
    void set_session_limits(size_t max_sessions, std::chrono::milliseconds idle_timeout);

    const std::string& endpoint_path() const { return endpoint_path_; }
    size_t session_count() const;
    bool has_session(const std::string& session_id) const;

    static constexpr size_t kDefaultMaxSessions = 1024;

private:
    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& params);
    void handle_notification(const std::string& method);

    HttpResponse handle_post(const HttpRequest& req);
    HttpResponse handle_delete(const HttpRequest& req);

    using Clock = std::chrono::steady_clock;

    std::string create_session();
    bool end_session(const std::string& session_id);
    // Refresh a live session's last-seen time. False if unknown or expired.
    bool touch_session(const std::string& session_id);
    bool expired(Clock::time_point last_seen, Clock::time_point now) const;
    void prune_sessions(Clock::time_point now); // session_mutex_ held

    std::vector<std::unique_ptr<Tool>> tools_;
    std::unordered_map<std::string, Tool*> tool_index_; // name -> tools_ entry
    std::string endpoint_path_;

    mutable std::mutex session_mutex_;
    std::unordered_map<std::string, Clock::time_point> sessions_; // id -> last seen
    size_t max_sessions_ = kDefaultMaxSessions;
    std::chrono::milliseconds session_idle_timeout_{std::chrono::minutes(30)};
};

} // namespace ptrnotes
