#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace shardb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (used by the storage layer, the CLI
// tool and tests).  Safe to call more than once: later calls only adjust the
// level of the already-installed logger.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-database logger.
//   db_name  – database name embedded in every log line as [db-<name>]
//   level    – initial log level
// Returns a shared_ptr to the created logger.
std::shared_ptr<spdlog::logger> make_database_logger(
    const std::string& db_name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace shardb
