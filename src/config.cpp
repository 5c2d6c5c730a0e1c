#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace swiv {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static uint16_t checked_port(long value, const std::string& source) {
    if (value < 0 || value > 65535) {
        throw std::runtime_error("Port out of range in " + source + ": " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

uint16_t parse_port(const std::string& text, const std::string& source) {
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port in " + source + ": " + text);
    }
    if (used != text.size()) {
        throw std::runtime_error("Invalid port in " + source + ": " + text);
    }
    return checked_port(value, source);
}

static AppConfig from_node(const YAML::Node& root) {
    AppConfig cfg;

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.host = s["host"].as<std::string>(cfg.server.host);
            if (auto port = s["port"]) {
                cfg.server.port = parse_port(port.as<std::string>(), "server.port");
            }
            cfg.server.base_dir = s["base_dir"].as<std::string>(cfg.server.base_dir);
            cfg.server.read_timeout_ms = s["read_timeout_ms"].as<int>(cfg.server.read_timeout_ms);
        }

        // Auth
        if (auto a = root["auth"]) {
            cfg.auth.secret = a["secret"].as<std::string>("");
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.console_pattern = l["console_pattern"].as<std::string>(cfg.logging.console_pattern);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.file_pattern = l["file_pattern"].as<std::string>(cfg.logging.file_pattern);
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config: " + std::string(e.what()));
    }

    // Environment variable overrides (systemd unit / launcher)
    cfg.auth.secret = env_or("AUTH", cfg.auth.secret);
    cfg.server.host = env_or("SWIV_HOST", cfg.server.host);
    if (const char* port = std::getenv("SWIV_PORT")) {
        cfg.server.port = parse_port(port, "SWIV_PORT");
    }
    cfg.server.base_dir = env_or("SWIV_DIR", cfg.server.base_dir);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    return cfg;
}

AppConfig load_config(const std::string& path) {
    YAML::Node root;

    if (!path.empty()) {
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config: " + std::string(e.what()));
        }
    }

    return from_node(root);
}

AppConfig load_config_from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config: " + std::string(e.what()));
    }
    return from_node(root);
}

} // namespace swiv
