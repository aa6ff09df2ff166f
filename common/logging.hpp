#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace coasterpath {
namespace logging {

inline spdlog::level::level_enum level_from_name(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "warn") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("coasterpath");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        const char* level_env = std::getenv("COASTERPATH_LOG_LEVEL");
        log->set_level(level_env ? level_from_name(level_env) : spdlog::level::info);

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace coasterpath
