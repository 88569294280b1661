// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the coordinator and demo client
 *
 * Values left unset here fall back to the config file.
 */

#include <string>

namespace devbridge {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; // -c/--config (empty = default location)

    // Coordinator
    std::string host;           // --host (empty = not set)
    int port = -1;              // -p/--port (-1 = not set)
    int request_timeout_ms = -1; // --request-timeout (-1 = not set)
    bool no_stdio = false;      // --no-stdio: serve devices without the MCP front end

    // Demo client
    std::string url;       // --url
    std::string device_id; // --device-id

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest (empty = not set)
    std::string log_file; // --log-file

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 *         (check args.help_requested to tell them apart)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/// Print usage to stdout
void print_help(const char* program_name);

/// Default config path: $XDG_CONFIG_HOME/devbridge/devbridge.json
std::string default_config_path();

} // namespace devbridge
