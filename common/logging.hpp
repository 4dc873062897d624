#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace keyshape {
namespace logging {

namespace detail {

constexpr const char* ROOT_NAME = "keyshape";

// KEYSHAPE_LOG_LEVEL, or info when unset or unrecognised
inline spdlog::level::level_enum level_from_env() {
    const char* level_env = std::getenv("KEYSHAPE_LOG_LEVEL");
    if (!level_env) {
        return spdlog::level::info;
    }
    std::string level(level_env);
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                   spdlog::level::level_enum level) {
    auto log = spdlog::get(name);
    if (!log) {
        log = spdlog::stderr_color_mt(name);
        log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        log->set_level(level);
    }
    return log;
}

}  // namespace detail

// Logger for the command line front end
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger =
        detail::make_logger(detail::ROOT_NAME, detail::level_from_env());
    return logger;
}

// Logger named keyshape.<component>, created at the front end's current level
inline std::shared_ptr<spdlog::logger> get_logger(const std::string& component) {
    return detail::make_logger(std::string(detail::ROOT_NAME) + "." + component,
                               get_logger()->level());
}

// Applies to the front end and every component logger created so far
inline void set_level(spdlog::level::level_enum level) {
    get_logger()->set_level(level);
    const std::string prefix = std::string(detail::ROOT_NAME) + ".";
    spdlog::apply_all([&](std::shared_ptr<spdlog::logger> log) {
        if (log->name().rfind(prefix, 0) == 0) {
            log->set_level(level);
        }
    });
}

}  // namespace logging
}  // namespace keyshape
