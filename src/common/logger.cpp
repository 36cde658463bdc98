#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace chandb {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";
constexpr const char* kDefaultName = "chandb";

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    spdlog::drop(kDefaultName);
    auto logger = spdlog::stderr_color_mt(kDefaultName);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level)
{
    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

std::shared_ptr<spdlog::logger> logger_or_default(
    std::shared_ptr<spdlog::logger> logger)
{
    if (logger) {
        return logger;
    }
    return spdlog::default_logger();
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace chandb
