#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace chandb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (CLI, early startup messages, tests
// and any component constructed without its own logger).
// Safe to call more than once; the previous default logger is replaced.
// Log lines go to stderr so that stdout carries only command output.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger.
//   name   – embedded in every log line as [<name>]
//   level  – initial log level (ignored when the logger already exists)
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Returns `logger` if set, otherwise the current default logger.
std::shared_ptr<spdlog::logger> logger_or_default(
    std::shared_ptr<spdlog::logger> logger);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace chandb
