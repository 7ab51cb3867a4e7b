#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace ptrnotes {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "127.0.0.1:8000"},
            {"path", "/mcp"},
            {"workers", 4},
            {"max_body", 1048576},
            {"max_sessions", 1024},
            {"session_idle_timeout", 1800}
        }},
        {"notes", {
            {"max_text_length", 4096}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    return load_from(expand_home("~/.ptrnotes/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } else {
            std::cerr << "[config] Could not write default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

// Zero and values that do not fit in 32 bits keep the default.
static uint32_t positive_or(const nlohmann::json& v, uint32_t fallback) {
    uint64_t n = v.get<uint64_t>();
    if (n == 0 || n > UINT32_MAX) {
        std::cerr << "[config] Ignoring out-of-range value " << n << "\n";
        return fallback;
    }
    return static_cast<uint32_t>(n);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        if (s.contains("path") && s["path"].is_string())
            cfg.server.path = s["path"].get<std::string>();
        if (s.contains("workers") && s["workers"].is_number_unsigned())
            cfg.server.workers = positive_or(s["workers"], cfg.server.workers);
        if (s.contains("max_body") && s["max_body"].is_number_unsigned())
            cfg.server.max_body = positive_or(s["max_body"], cfg.server.max_body);
        if (s.contains("max_sessions") && s["max_sessions"].is_number_unsigned())
            cfg.server.max_sessions = positive_or(s["max_sessions"], cfg.server.max_sessions);
        if (s.contains("session_idle_timeout") && s["session_idle_timeout"].is_number_unsigned())
            cfg.server.session_idle_timeout =
                positive_or(s["session_idle_timeout"], cfg.server.session_idle_timeout);
    }

    if (j.contains("notes") && j["notes"].is_object()) {
        auto& n = j["notes"];
        if (n.contains("max_text_length") && n["max_text_length"].is_number_unsigned())
            cfg.notes.max_text_length = positive_or(n["max_text_length"], cfg.notes.max_text_length);
    }

    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("PTRNOTES_LISTEN"))
        server.listen = v;
    if (const char* v = std::getenv("PTRNOTES_PATH"))
        server.path = v;
    if (const char* v = std::getenv("PTRNOTES_MAX_TEXT_LENGTH")) {
        try {
            unsigned long n = std::stoul(v);
            if (n > 0 && n <= UINT32_MAX) {
                notes.max_text_length = static_cast<uint32_t>(n);
            } else {
                std::cerr << "[config] PTRNOTES_MAX_TEXT_LENGTH out of range, ignored\n";
            }
        } catch (const std::exception&) {
            std::cerr << "[config] PTRNOTES_MAX_TEXT_LENGTH is not a number, ignored\n";
        }
    }
}

} // namespace ptrnotes
