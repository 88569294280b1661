// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_setup.h"

#include "logging_init.h"

#include "hv/hlog.h"

#include <cstdio>

namespace devbridge {

void init_config(const CliArgs& args, Config& config) {
    std::string config_path = args.config_path.empty() ? default_config_path() : args.config_path;
    config.init(config_path);
    config.apply_env_overrides();
}

void init_logging(const CliArgs& args, Config& config, std::vector<spdlog::sink_ptr> extra_sinks) {
    logging::LogConfig log_config;

    std::string level_str = config.get<std::string>("/logging/level", "");

    // CLI -v flags override config
    log_config.level = logging::resolve_log_level(args.verbosity, level_str);

    std::string log_dest_str = args.log_dest;
    if (log_dest_str.empty()) {
        log_dest_str = config.get<std::string>("/logging/target", "console");
    }
    auto target = logging::parse_log_target(log_dest_str);
    if (!target) {
        std::fprintf(stderr, "devbridge: unknown /logging/target '%s', using console\n",
                     log_dest_str.c_str());
    }
    log_config.target = target.value_or(logging::LogTarget::Console);

    log_config.file_path = args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = config.get<std::string>("/logging/file", "");
    }
    log_config.extra_sinks = std::move(extra_sinks);

    logging::init(log_config);

    // libhv follows the config level only
    int hv_level = logging::to_hv_level(logging::parse_level(level_str, spdlog::level::warn));
    hlog_set_level(hv_level);
}

} // namespace devbridge
