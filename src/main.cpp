// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief devbridge-coordinator: device endpoint plus MCP stdio front end
 *
 * stdout carries MCP traffic only; all logging goes to stderr or the
 * configured system sink.
 */

#include "app_setup.h"
#include "bridge_server.h"
#include "cli_args.h"
#include "config.h"
#include "coordinator_tools.h"
#include "mcp_stdio_server.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <signal.h>
#include <thread>

#ifndef DEVBRIDGE_VERSION
#define DEVBRIDGE_VERSION "0.0.0-dev"
#endif

using namespace devbridge;

// SIGTERM/SIGINT: graceful shutdown in --no-stdio mode
static volatile sig_atomic_t g_quit = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

static void log_bridge_event(const BridgeEvent& evt) {
    switch (evt.type) {
    case BridgeEventType::DEVICE_CONNECTED:
    case BridgeEventType::DEVICE_DISCONNECTED:
    case BridgeEventType::DEVICE_REPLACED:
        spdlog::info("[Coordinator] {}", evt.message);
        break;
    case BridgeEventType::DEVICE_EVENT:
    case BridgeEventType::LATE_RESPONSE:
        spdlog::debug("[Coordinator] {}", evt.message);
        break;
    default:
        if (evt.is_error) {
            spdlog::error("[Coordinator] {}", evt.message);
        } else {
            spdlog::warn("[Coordinator] {}", evt.message);
        }
        break;
    }
}

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? 0 : 1;
    }

    Config config;
    init_config(args, config);
    init_logging(args, config);

    BridgeServerOptions options;
    options.host = args.host.empty() ? config.get<std::string>("/server/host", options.host)
                                     : args.host;
    options.port = args.port > 0 ? args.port : config.get<int>("/server/port", options.port);
    options.request_timeout_ms =
        args.request_timeout_ms > 0
            ? static_cast<uint32_t>(args.request_timeout_ms)
            : config.get<uint32_t>("/server/request_timeout_ms", options.request_timeout_ms);
    options.handshake_timeout_ms =
        config.get<uint32_t>("/server/handshake_timeout_ms", options.handshake_timeout_ms);

    spdlog::info("[Coordinator] devbridge {} starting (config: {})", DEVBRIDGE_VERSION,
                 config.get_path());

    BridgeServer server(options);
    server.register_event_handler(log_bridge_event);
    server.router().on_event([](const std::string& device_id, const EventFrame& event) {
        spdlog::info("[Coordinator] Event '{}' from {}: {}", event.event, device_id,
                     event.data.dump());
    });

    if (server.start() != 0) {
        spdlog::critical("[Coordinator] Could not listen on {}:{}", options.host, options.port);
        spdlog::dump_backtrace();
        return 1;
    }

    if (args.no_stdio) {
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);
        spdlog::info("[Coordinator] Running without MCP front end (Ctrl+C to quit)");
        while (!g_quit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } else {
        McpStdioServer mcp(std::cin, std::cout, "devbridge", DEVBRIDGE_VERSION);
        register_coordinator_tools(mcp, server.router(), server.devices());
        mcp.run();
    }

    spdlog::info("[Coordinator] Shutting down");
    server.stop();
    return 0;
}
