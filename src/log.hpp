// src/log.hpp
// Library logger.

#pragma once

#include "pushgate/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace pushgate {

// Shared "pushgate" stderr logger. Not registered with spdlog so it never
// collides with an application logger of the same name.
inline std::shared_ptr<spdlog::logger> default_logger() {
    static const std::shared_ptr<spdlog::logger> logger = std::make_shared<spdlog::logger>(
        "pushgate", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    return logger;
}

// The config's logger, or the shared default.
inline std::shared_ptr<spdlog::logger> logger_for(const ClientConfig& config) {
    return config.logger() ? config.logger() : default_logger();
}

} // namespace pushgate
