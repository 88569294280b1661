// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "hv/hlog.h"

#include <cstdio>

#ifdef __linux__
#ifdef DEVBRIDGE_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace devbridge {
namespace logging {

namespace {

struct TargetName {
    LogTarget target;
    const char* name;
};

constexpr TargetName kTargetNames[] = {
    {LogTarget::Console, "console"},
    {LogTarget::Journal, "journal"},
    {LogTarget::Syslog, "syslog"},
    {LogTarget::File, "file"},
};

constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

/// Sink for @p target, or null when the console alone is enough
spdlog::sink_ptr make_target_sink(LogTarget target, const LogConfig& config) {
    switch (target) {
    case LogTarget::Console:
        return nullptr;
    case LogTarget::File: {
        std::string path = config.file_path.empty() ? DEFAULT_LOG_FILE : config.file_path;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, kMaxLogFileBytes,
                                                                      kMaxLogFiles);
    }
#ifdef __linux__
    case LogTarget::Journal:
#ifdef DEVBRIDGE_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(config.logger_name);
#else
        // Without libsystemd the journal picks messages up through syslog
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(config.logger_name, LOG_PID,
                                                               LOG_USER, false);
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
        return nullptr;
#endif
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout belongs to the MCP transport
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget effective_target = config.target;
    try {
        if (auto sink = make_target_sink(config.target, config)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        effective_target = LogTarget::Console;
        std::fprintf(stderr, "devbridge: %s log unavailable, using console: %s\n",
                     log_target_name(config.target), e.what());
        if (!config.enable_console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
    }

    for (const auto& sink : config.extra_sinks) {
        if (sink) {
            sinks.push_back(sink);
        }
    }

    auto logger =
        std::make_shared<spdlog::logger>(config.logger_name, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Recent messages are dumped by spdlog::dump_backtrace() on fatal errors
    spdlog::enable_backtrace(32);

    spdlog::debug("[Logging] Initialized: level={}, target={}, console={}, extra sinks={}",
                  spdlog::level::to_string_view(config.level), log_target_name(effective_target),
                  config.enable_console ? "yes" : "no", config.extra_sinks.size());
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    switch (verbosity) {
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback) {
    if (str.empty()) {
        return fallback;
    }
    // from_str() maps unknown names to off; only accept names that round-trip
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return fallback;
    }
    return level;
}

spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level) {
    if (verbosity > 0) {
        return verbosity_to_level(verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

std::optional<LogTarget> parse_log_target(const std::string& str) {
    for (const auto& entry : kTargetNames) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return std::nullopt;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : kTargetNames) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

std::string log_target_names() {
    std::string names;
    for (const auto& entry : kTargetNames) {
        if (!names.empty()) {
            names += ", ";
        }
        names += entry.name;
    }
    return names;
}

} // namespace logging
} // namespace devbridge
