#include "auth.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "mime.hpp"
#include "router.hpp"

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#ifndef SWIV_VERSION
#define SWIV_VERSION "dev"
#endif

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: swiv [options]\n"
              << "Options:\n"
              << "  -d, --dir <path>       Gallery root (default: current directory)\n"
              << "  -a, --auth <secret>    Basic-Auth secret (default: $AUTH, none)\n"
              << "  -p, --port <port>      Listen port (default: 8000)\n"
              << "  -c, --config <path>    Optional YAML config file\n"
              << "  -h, --help             Show this help\n"
              << "\nEnvironment variables:\n"
              << "  AUTH                   Basic-Auth secret\n"
              << "  SWIV_HOST              Listen address\n"
              << "  SWIV_PORT              Listen port\n"
              << "  SWIV_DIR               Gallery root\n"
              << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path;
    std::string dir_arg, auth_arg, port_arg;
    bool auth_given = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--dir" || arg == "-d") && i + 1 < argc) {
            dir_arg = argv[++i];
        } else if ((arg == "--auth" || arg == "-a") && i + 1 < argc) {
            auth_arg = argv[++i];
            auth_given = true;
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    swiv::AppConfig config;
    try {
        config = swiv::load_config(config_path);
        if (!dir_arg.empty()) config.server.base_dir = dir_arg;
        if (auth_given) config.auth.secret = auth_arg;
        if (!port_arg.empty()) config.server.port = swiv::parse_port(port_arg, "--port");
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    swiv::init_logger(config.logging);
    spdlog::info("swiv {}", SWIV_VERSION);

    // ─── Enter the gallery root ───────────────────────────────────────────────
    std::error_code ec;
    std::filesystem::current_path(config.server.base_dir, ec);
    if (ec) {
        spdlog::critical("Cannot enter {}: {}", config.server.base_dir, ec.message());
        return 1;
    }
    std::string base = std::filesystem::current_path().string();

    spdlog::info("Configuration:");
    spdlog::info("  Listen          : {}:{}", config.server.host, config.server.port);
    spdlog::info("  Gallery root    : {}", base);
    spdlog::info("  Authentication  : {}", config.auth.secret.empty() ? "disabled" : "basic");

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Create components ────────────────────────────────────────────────────
    swiv::MimeDetector mime;
    std::unique_ptr<swiv::Router> router;
    try {
        router = std::make_unique<swiv::Router>(base, swiv::AuthGate(config.auth.secret), mime);
    } catch (const std::exception& e) {
        spdlog::critical("Invalid gallery root {}: {}", base, e.what());
        return 1;
    }

    swiv::HttpServer http_server(config.server.host, config.server.port, *router,
                                 config.server.read_timeout_ms);
    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config.server.port);
        return 1;
    }

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    spdlog::info("Shutdown complete");

    return 0;
}
