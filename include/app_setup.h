// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "config.h"

#include <spdlog/spdlog.h>

#include <vector>

namespace devbridge {

/**
 * @brief Load the config file named on the command line (or the default)
 *
 * Applies environment overrides after loading.
 */
void init_config(const CliArgs& args, Config& config);

/**
 * @brief Configure spdlog and libhv logging
 *
 * Level precedence: -v flags, then DEVBRIDGE_LOG_LEVEL, then /logging/level.
 * libhv's own logger follows the config level only.
 */
void init_logging(const CliArgs& args, Config& config,
                  std::vector<spdlog::sink_ptr> extra_sinks = {});

} // namespace devbridge
