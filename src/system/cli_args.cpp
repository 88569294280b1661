// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "logging_init.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace devbridge {

namespace {

// Helper to parse integer with validation
bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        fprintf(stderr, "Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

/**
 * @brief Match `--name value` or `--name=value`
 *
 * @return 1 if matched with a value, 0 if not this option, -1 if the value is missing
 */
int option_value(int argc, char** argv, int& i, const char* long_name, const char* short_name,
                 const char*& value) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return 1;
    }
    if (strcmp(argv[i], long_name) == 0 || (short_name && strcmp(argv[i], short_name) == 0)) {
        if (i + 1 >= argc) {
            fprintf(stderr, "Error: %s requires an argument\n", long_name);
            return -1;
        }
        value = argv[++i];
        return 1;
    }
    return 0;
}

} // namespace

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>       Config file (default: %s)\n",
           default_config_path().c_str());
    printf("  -p, --port <n>            Coordinator port (1-65535)\n");
    printf("  --host <addr>             Coordinator bind address\n");
    printf("  --request-timeout <ms>    Per-request timeout (100-600000)\n");
    printf("  --no-stdio                Serve devices without the MCP stdio front end\n");
    printf("  --url <ws-url>            Coordinator URL (demo client)\n");
    printf("  --device-id <id>          Device id to advertise (demo client)\n");
    printf("  -v, --verbose             Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>         Log destination: %s\n",
           logging::log_target_names().c_str());
    printf("  --log-file <path>         Log file path (when --log-dest=file, default %s)\n",
           logging::DEFAULT_LOG_FILE);
    printf("  -h, --help                Show this help\n");
    printf("\nEnvironment:\n");
    printf("  DEVBRIDGE_PORT            Overrides /server/port\n");
    printf("  DEVBRIDGE_LOG_LEVEL       Overrides /logging/level\n");
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/devbridge/devbridge.json";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/devbridge/devbridge.json";
    }
    return "devbridge.json";
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* value = nullptr;
        int matched = 0;

        if ((matched = option_value(argc, argv, i, "--config", "-c", value)) != 0) {
            if (matched < 0)
                return false;
            args.config_path = value;
        } else if ((matched = option_value(argc, argv, i, "--port", "-p", value)) != 0) {
            if (matched < 0 || !parse_int(value, 1, 65535, args.port, "port"))
                return false;
        } else if ((matched = option_value(argc, argv, i, "--host", nullptr, value)) != 0) {
            if (matched < 0)
                return false;
            args.host = value;
        } else if ((matched = option_value(argc, argv, i, "--request-timeout", nullptr, value)) !=
                   0) {
            if (matched < 0 ||
                !parse_int(value, 100, 600000, args.request_timeout_ms, "request timeout"))
                return false;
        } else if (strcmp(argv[i], "--no-stdio") == 0) {
            args.no_stdio = true;
        } else if ((matched = option_value(argc, argv, i, "--url", nullptr, value)) != 0) {
            if (matched < 0)
                return false;
            args.url = value;
            // Accept host:port as shorthand
            if (args.url.find("://") == std::string::npos) {
                args.url = "ws://" + args.url;
            }
        } else if ((matched = option_value(argc, argv, i, "--device-id", nullptr, value)) != 0) {
            if (matched < 0)
                return false;
            args.device_id = value;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if ((matched = option_value(argc, argv, i, "--log-dest", nullptr, value)) != 0) {
            if (matched < 0)
                return false;
            args.log_dest = value;
            if (!logging::parse_log_target(args.log_dest)) {
                fprintf(stderr, "Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                fprintf(stderr, "Valid values: %s\n", logging::log_target_names().c_str());
                return false;
            }
        } else if ((matched = option_value(argc, argv, i, "--log-file", nullptr, value)) != 0) {
            if (matched < 0)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.help_requested = true;
            print_help(argv[0]);
            return false;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            fprintf(stderr, "Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace devbridge
