#include "mcp_server.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace ptrnotes {

const std::vector<std::string> kSupportedProtocolVersions = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

namespace {

// Thrown inside dispatch to produce a JSON-RPC error response.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

const char* kInstructions =
    "Note-taking tools. Use add_note to save a note, read_notes to list all "
    "notes, and delete_random_notes to remove a number of notes at random. "
    "Notes are kept in memory only and are lost when the server restarts.";

} // namespace

nlohmann::json make_rpc_error(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

nlohmann::json make_rpc_result(const nlohmann::json& id, nlohmann::json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

McpServer::McpServer(std::vector<std::unique_ptr<Tool>> tools, std::string endpoint_path)
    : tools_(std::move(tools))
    , endpoint_path_(std::move(endpoint_path))
{
    for (auto& tool : tools_) {
        tool_index_[tool->tool_name()] = tool.get();
    }
}

// ── JSON-RPC dispatch ────────────────────────────────────────────

std::optional<nlohmann::json> McpServer::dispatch(const nlohmann::json& message) {
    if (!message.is_object()) {
        return make_rpc_error(nullptr, rpc_error::InvalidRequest,
                              message.is_array() ? "Batch requests are not supported"
                                                 : "Request must be a JSON object");
    }

    bool is_notification = !message.contains("id");
    nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return make_rpc_error(id, rpc_error::InvalidRequest, "Invalid JSON-RPC envelope");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        // Responses from the client (e.g. to server requests) are accepted and ignored.
        if (is_notification || message.contains("result") || message.contains("error")) {
            return std::nullopt;
        }
        return make_rpc_error(id, rpc_error::InvalidRequest, "Missing method");
    }

    const std::string method = message["method"].get<std::string>();
    nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

    if (is_notification) {
        handle_notification(method);
        return std::nullopt;
    }

    if (!params.is_object()) {
        return make_rpc_error(id, rpc_error::InvalidParams, "params must be an object");
    }

    try {
        if (method == "initialize") {
            return make_rpc_result(id, handle_initialize(params));
        }
        if (method == "ping") {
            return make_rpc_result(id, nlohmann::json::object());
        }
        if (method == "tools/list") {
            return make_rpc_result(id, handle_tools_list());
        }
        if (method == "tools/call") {
            return make_rpc_result(id, handle_tools_call(params));
        }
        return make_rpc_error(id, rpc_error::MethodNotFound, "Method not found: " + method);
    } catch (const RpcError& e) {
        return make_rpc_error(id, e.code(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[mcp] Internal error in " << method << ": " << e.what() << "\n";
        return make_rpc_error(id, rpc_error::InternalError, std::string("Internal error: ") + e.what());
    }
}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) {
    std::string client_name = "unknown";
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        client_name = params["clientInfo"].value("name", client_name);
    }

    std::string version = kSupportedProtocolVersions.front();
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        if (std::find(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(),
                      requested) != kSupportedProtocolVersions.end()) {
            version = requested;
        }
    }

    std::cerr << "[mcp] Initialize from '" << client_name << "' (protocol " << version << ")\n";

    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
        {"instructions", kInstructions}
    };
}

void McpServer::handle_notification(const std::string& method) {
    if (method == "notifications/initialized") {
        std::cerr << "[mcp] Client initialized\n";
    }
    // Other notifications (cancelled, progress, ...) need no action.
}

nlohmann::json McpServer::handle_tools_list() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools_) {
        auto spec = tool->spec();
        list.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", nlohmann::json::parse(spec.parameters_json)}
        });
    }
    return {{"tools", std::move(list)}};
}

nlohmann::json McpServer::handle_tools_call(const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw RpcError(rpc_error::InvalidParams, "tools/call requires a string 'name'");
    }
    const std::string name = params["name"].get<std::string>();

    auto it = tool_index_.find(name);
    if (it == tool_index_.end()) {
        throw RpcError(rpc_error::InvalidParams, "Unknown tool: " + name);
    }

    nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    if (args.is_null()) args = nlohmann::json::object();

    ToolResult result = it->second->execute(args);
    if (!result.success) {
        std::cerr << "[mcp] Tool " << name << " failed: " << result.output << "\n";
    } else {
        std::cerr << "[mcp] Tool " << name << " ok\n";
    }

    nlohmann::json out = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", result.output}}})},
        {"isError", !result.success}
    };
    if (result.success && result.data.is_object()) {
        out["structuredContent"] = result.data;
    }
    return out;
}

// ── Sessions ─────────────────────────────────────────────────────

void McpServer::set_session_limits(size_t max_sessions, std::chrono::milliseconds idle_timeout) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    max_sessions_ = max_sessions == 0 ? 1 : max_sessions;
    session_idle_timeout_ = idle_timeout;
}

bool McpServer::expired(Clock::time_point last_seen, Clock::time_point now) const {
    return now - last_seen > session_idle_timeout_;
}

void McpServer::prune_sessions(Clock::time_point now) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (expired(it->second, now)) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string McpServer::create_session() {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(session_mutex_);
    prune_sessions(now);
    while (!sessions_.empty() && sessions_.size() >= max_sessions_) {
        auto oldest = sessions_.begin();
        for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
            if (it->second < oldest->second) oldest = it;
        }
        std::cerr << "[mcp] Session " << oldest->first << " evicted (table full)\n";
        sessions_.erase(oldest);
    }

    std::string id;
    do {
        id = generate_id() + generate_id();
    } while (sessions_.count(id) > 0);
    sessions_.emplace(id, now);
    return id;
}

bool McpServer::touch_session(const std::string& session_id) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    if (expired(it->second, now)) {
        sessions_.erase(it);
        return false;
    }
    it->second = now;
    return true;
}

bool McpServer::end_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return sessions_.erase(session_id) > 0;
}

bool McpServer::has_session(const std::string& session_id) const {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && !expired(it->second, now);
}

size_t McpServer::session_count() const {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(session_mutex_);
    size_t live = 0;
    for (const auto& entry : sessions_) {
        if (!expired(entry.second, now)) ++live;
    }
    return live;
}

// ── HTTP transport ───────────────────────────────────────────────

static HttpResponse json_response(int status, const nlohmann::json& body, bool sse) {
    HttpResponse resp;
    resp.status = status;
    if (sse) {
        resp.content_type = "text/event-stream";
        resp.headers.emplace_back("Cache-Control", "no-cache");
        resp.body = "event: message\ndata: " + body.dump() + "\n\n";
    } else {
        resp.content_type = "application/json";
        resp.body = body.dump();
    }
    return resp;
}

HttpResponse McpServer::handle_http(const HttpRequest& req) {
    if (req.path != endpoint_path_) {
        if (req.method == "GET" && req.path == "/health") {
            return HttpResponse{200, "text/plain", {}, "ok"};
        }
        return HttpResponse{404, "text/plain", {}, "Not found"};
    }

    if (req.method == "POST") return handle_post(req);
    if (req.method == "DELETE") return handle_delete(req);

    // No server-initiated SSE stream is offered.
    HttpResponse resp{405, "text/plain", {}, "Method not allowed"};
    resp.headers.emplace_back("Allow", "POST, DELETE");
    return resp;
}

HttpResponse McpServer::handle_post(const HttpRequest& req) {
    bool sse = req.header("accept").find("text/event-stream") != std::string::npos;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        return json_response(400, make_rpc_error(nullptr, rpc_error::ParseError,
                                                 std::string("Parse error: ") + e.what()), sse);
    }

    bool is_initialize = message.is_object() && message.contains("method") &&
                         message["method"] == "initialize";

    std::string session_id = req.header("mcp-session-id");
    if (!session_id.empty() && !is_initialize && !touch_session(session_id)) {
        return json_response(404, make_rpc_error(nullptr, rpc_error::SessionNotFound,
                                                 "Session not found"), sse);
    }

    auto response = dispatch(message);
    if (!response) {
        return HttpResponse{202, "", {}, ""};
    }

    HttpResponse resp = json_response(200, *response, sse);
    if (is_initialize && response->contains("result")) {
        std::string new_session = create_session();
        resp.headers.emplace_back("Mcp-Session-Id", new_session);
        std::cerr << "[mcp] Session " << new_session << " created\n";
    }
    return resp;
}

HttpResponse McpServer::handle_delete(const HttpRequest& req) {
    std::string session_id = req.header("mcp-session-id");
    if (session_id.empty()) {
        return HttpResponse{400, "text/plain", {}, "Missing Mcp-Session-Id header"};
    }
    if (!end_session(session_id)) {
        return HttpResponse{404, "text/plain", {}, "Session not found"};
    }
    std::cerr << "[mcp] Session " << session_id << " terminated\n";
    return HttpResponse{200, "text/plain", {}, ""};
}

} // namespace ptrnotes
