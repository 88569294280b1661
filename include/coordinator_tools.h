// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_router.h"
#include "device_registry.h"
#include "json_utils.h"
#include "mcp_stdio_server.h"

#include <string>

namespace devbridge {

/// Tool answered by the coordinator itself, never forwarded
constexpr const char* LIST_DEVICES_TOOL = "list_connected_devices";

/**
 * @brief Input schema advertised for a forwarded command
 *
 * Every schema carries an optional `deviceId` selecting the target device.
 */
[[nodiscard]] json command_input_schema(const std::string& method);

/**
 * @brief Run one forwarded tool call and format its outcome for MCP
 *
 * Blocks until the router settles the request.
 */
McpToolResult forward_tool_call(CommandRouter& router, const std::string& method,
                                const json& arguments);

/// Result of `list_connected_devices`
[[nodiscard]] json connected_devices_json(const DeviceRegistry& devices);

/**
 * @brief Register every bridge command plus `list_connected_devices`
 */
void register_coordinator_tools(McpStdioServer& server, CommandRouter& router,
                                DeviceRegistry& devices);

} // namespace devbridge
