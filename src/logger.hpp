#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace swiv {

// Unknown names fall back to info
inline spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

// Console sink always, rotating file sink when cfg.file is set
inline std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                   const LoggingConfig& cfg) {
    auto logger = std::make_shared<spdlog::logger>(name);

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(cfg.console_pattern);
    logger->sinks().push_back(console);

    if (!cfg.file.empty()) {
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files));
        rotating->set_pattern(cfg.file_pattern);
        logger->sinks().push_back(rotating);
    }

    logger->set_level(parse_log_level(cfg.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

inline void init_logger(const LoggingConfig& cfg) {
    spdlog::set_default_logger(make_logger("swiv", cfg));
}

} // namespace swiv
