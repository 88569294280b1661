// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <vector>

namespace devbridge {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Console, ///< stderr only
    Journal, ///< systemd journal (syslog when built without libsystemd)
    Syslog,  ///< syslog(3)
    File     ///< Rotating file at LogConfig::file_path
};

/// Used by LogTarget::File when no path is configured
constexpr const char* DEFAULT_LOG_FILE = "devbridge.log";

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Console;
    bool enable_console = true;
    std::string file_path; ///< Empty means DEFAULT_LOG_FILE
    std::string logger_name = "devbridge";
    std::vector<spdlog::sink_ptr> extra_sinks; ///< e.g. a LogCaptureSink
};

/**
 * @brief Build the default logger from @p config
 *
 * The console sink writes to stderr; stdout belongs to the MCP transport.
 * When the target sink cannot be opened, logging continues on the console.
 */
void init(const LogConfig& config);

/// Map -v count to a level: 0=warn, 1=info, 2=debug, 3+=trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", ...)
 *
 * @return @p fallback for empty or unrecognized names
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback = spdlog::level::warn);

/// CLI verbosity wins over the config level; warn when neither is set
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level);

/**
 * @brief Map an spdlog level to libhv's numeric level
 *
 * libhv has no trace level, so trace maps to DEBUG.
 */
int to_hv_level(spdlog::level::level_enum level);

/// @return nullopt for names other than console, journal, syslog and file
std::optional<LogTarget> parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

/// Comma separated list of accepted target names, for help and error text
std::string log_target_names();

} // namespace logging
} // namespace devbridge
