#include "config.hpp"
#include "note_store.hpp"
#include "tool.hpp"
#include "mcp_server.hpp"
#include "http_server.hpp"
#include <iostream>
#include <string>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: ptrnotes [options]\n"
              << "\n"
              << "Serves note-taking tools (add_note, read_notes, delete_random_notes)\n"
              << "over the Model Context Protocol (streamable HTTP).\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to listen on (default: 127.0.0.1:8000)\n"
              << "  --path PATH          MCP endpoint path (default: /mcp)\n"
              << "  --workers N          Concurrent request workers (default: 4)\n"
              << "  --config FILE        Config file (default: ~/.ptrnotes/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  PTRNOTES_LISTEN            Listen address\n"
              << "  PTRNOTES_PATH              MCP endpoint path\n"
              << "  PTRNOTES_MAX_TEXT_LENGTH   Maximum note length in bytes\n"
              << "\n"
              << "Notes are kept in memory and are lost when the server exits.\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string listen;
    std::string path;
    std::string config_path;
    uint32_t workers = 0;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n <= 0) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return 1;
            }
            workers = static_cast<uint32_t>(n);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? ptrnotes::Config::load()
                                      : ptrnotes::Config::load_from(config_path);

    // Override config with CLI args
    if (!listen.empty()) config.server.listen = listen;
    if (!path.empty()) config.server.path = path;
    if (workers > 0) config.server.workers = workers;

    ptrnotes::NoteStore store(config.notes.max_text_length);
    ptrnotes::McpServer mcp(ptrnotes::create_note_tools(store), config.server.path);
    mcp.set_session_limits(config.server.max_sessions,
                           std::chrono::seconds(config.server.session_idle_timeout));

    ptrnotes::HttpServer http(config.server.listen, config.server.max_body,
                              config.server.workers,
                              [&mcp](const ptrnotes::HttpRequest& req) {
                                  return mcp.handle_http(req);
                              });

    std::string error;
    if (!http.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "[server] Listening on http://" << config.server.listen
              << config.server.path << " (" << config.server.workers << " workers)\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    http.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
