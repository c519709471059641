#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace rkv {

// ── Logging ───────────────────────────────────────────────────────────────────
//
// Every rkv logger writes to stderr; stdout belongs to command results.

// Install the process-wide "rkv" logger.  Idempotent; a second call only
// changes the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Logger for one database, named "db-<name>".  Shares the sinks of the
// default logger when one is installed.  Returns the registered logger if it
// already exists.
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& db_name,
    spdlog::level::level_enum level = spdlog::level::info);

// "trace", "debug", "info", "warn", "error", "critical" or "off";
// std::nullopt for anything else.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace rkv
