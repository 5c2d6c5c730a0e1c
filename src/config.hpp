#pragma once

#include <string>
#include <cstdint>

namespace swiv {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    std::string base_dir = ".";
    int read_timeout_ms = 10000;
};

struct AuthConfig {
    std::string secret;  // empty = no authentication
};

struct LoggingConfig {
    std::string level = "info";
    std::string console_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    std::string file;  // empty = console only
    std::string file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    AuthConfig auth;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides.
// An empty path skips the file.
AppConfig load_config(const std::string& path);

// Same, from YAML text
AppConfig load_config_from_string(const std::string& yaml);

// Decimal port 0-65535; throws std::runtime_error naming `source` otherwise
uint16_t parse_port(const std::string& text, const std::string& source);

} // namespace swiv
