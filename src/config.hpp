#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ptrnotes {

struct ServerConfig {
    std::string listen = "127.0.0.1:8000";
    std::string path = "/mcp";
    uint32_t workers = 4;
    uint32_t max_body = 1048576; // 1 MiB
    uint32_t max_sessions = 1024;
    uint32_t session_idle_timeout = 1800; // seconds
};

struct NotesConfig {
    uint32_t max_text_length = 4096;
};

struct Config {
    ServerConfig server;
    NotesConfig notes;

    // Load from ~/.ptrnotes/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created with
    // defaults; a malformed one falls back to defaults.
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from already-merged JSON (no env vars applied).
    static Config from_json(const nlohmann::json& j);

    // Apply PTRNOTES_* environment variable overrides.
    void apply_env();
};

// Recursively add keys from `defaults` missing in `existing`.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace ptrnotes
