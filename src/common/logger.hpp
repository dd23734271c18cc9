#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace projstate {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (for components that don't belong to a
// specific project: CLI, early startup messages, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-project store logger.
//   project_name – embedded in every log line as [store-<project_name>]
//   level        – initial log level
// Returns a shared_ptr to the created logger.
std::shared_ptr<spdlog::logger> make_store_logger(
    const std::string& project_name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace projstate
