// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "coordinator_tools.h"

#include "bridge_command.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace devbridge {

namespace {

// Grace period past the router timeout; the router always settles first
constexpr uint32_t FUTURE_GRACE_MS = 2000;

json prop(const char* type, const char* description) {
    return {{"type", type}, {"description", description}};
}

json command_properties(BridgeCommand cmd) {
    switch (cmd) {
    case BridgeCommand::GET_APP_STATE:
        return {{"key", prop("string", "Specific state key to retrieve. Omit for all state.")}};
    case BridgeCommand::QUERY_STORAGE:
        return {{"key", prop("string", "Storage key to read")},
                {"pattern", prop("string", "Regex over storage keys")}};
    case BridgeCommand::EXECUTE_ACTION:
        return {{"action", prop("string", "Name of the registered action")},
                {"params", prop("object", "Parameters passed to the action")}};
    case BridgeCommand::NAVIGATE_TO:
        return {{"route", prop("string", "Route or screen name")},
                {"params", prop("object", "Route parameters")}};
    case BridgeCommand::TOGGLE_FEATURE_FLAG:
        return {{"flagName", prop("string", "Name of the feature flag")},
                {"enabled", prop("boolean", "New state of the flag (omit to flip)")}};
    case BridgeCommand::GET_COMPONENT_TREE:
        return {{"includeProps", prop("boolean", "Include component props (default true)")}};
    case BridgeCommand::GET_LAYOUT_TREE:
        return {{"includeHidden", prop("boolean", "Include hidden components")}};
    case BridgeCommand::INSPECT_ELEMENT:
        return {{"x", prop("number", "X coordinate")}, {"y", prop("number", "Y coordinate")}};
    case BridgeCommand::FIND_ELEMENT:
        return {{"testId", prop("string", "Test id to match")},
                {"type", prop("string", "Component type to match")},
                {"text", prop("string", "Exact text to match")}};
    case BridgeCommand::GET_ELEMENT_TEXT:
        return {{"testId", prop("string", "Test id of the element")}};
    case BridgeCommand::SIMULATE_INTERACTION:
        return {{"type", prop("string", "tap, long_press, type_text or swipe")},
                {"target", prop("object", "{testId} or {x, y}")},
                {"value", prop("string", "Text for type_text, direction for swipe")}};
    case BridgeCommand::LIST_NETWORK_REQUESTS:
        return {{"filter", prop("object", "{url, method} filters")},
                {"limit", prop("number", "Maximum records (default 50)")}};
    case BridgeCommand::MOCK_NETWORK_REQUEST:
        return {{"urlPattern", prop("string", "Regex matched against request URLs")},
                {"mockResponse", prop("object", "{statusCode, body, headers, delay}")}};
    case BridgeCommand::CLEAR_NETWORK_MOCKS:
        return {{"mockId", prop("string", "Mock to remove. Omit to clear all.")}};
    case BridgeCommand::REPLAY_NETWORK_REQUEST:
        return {{"requestId", prop("string", "Recorded request id")},
                {"modifications", prop("object", "Overrides for url, method, headers, body")}};
    case BridgeCommand::GET_LOGS:
        return {{"level", prop("string", "Exact level to match")},
                {"minLevel", prop("string", "Minimum level")},
                {"filter", prop("string", "Substring the message must contain")},
                {"limit", prop("number", "Maximum entries (default 100)")}};
    case BridgeCommand::GET_RECENT_ERRORS:
        return {{"limit", prop("number", "Maximum entries (default 20)")}};
    case BridgeCommand::GET_TRACES:
        return {{"filter", prop("object", "{name, file, minDuration, since, inProgress}")},
                {"limit", prop("number", "Maximum entries (default 100)")}};
    default:
        return json::object();
    }
}

std::vector<std::string> required_properties(BridgeCommand cmd) {
    switch (cmd) {
    case BridgeCommand::EXECUTE_ACTION:
        return {"action"};
    case BridgeCommand::NAVIGATE_TO:
        return {"route"};
    case BridgeCommand::TOGGLE_FEATURE_FLAG:
        return {"flagName"};
    case BridgeCommand::INSPECT_ELEMENT:
        return {"x", "y"};
    case BridgeCommand::GET_ELEMENT_TEXT:
        return {"testId"};
    case BridgeCommand::SIMULATE_INTERACTION:
        return {"type", "target"};
    case BridgeCommand::MOCK_NETWORK_REQUEST:
        return {"urlPattern"};
    case BridgeCommand::REPLAY_NETWORK_REQUEST:
        return {"requestId"};
    default:
        return {};
    }
}

} // namespace

json command_input_schema(const std::string& method) {
    json properties = json::object();
    std::vector<std::string> required;
    if (auto info = BridgeCommandRegistry::from_name(method)) {
        properties = command_properties(info->command);
        required = required_properties(info->command);
    }
    properties["deviceId"] = prop("string", "Target device. Omit for the most recently active.");

    json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

McpToolResult forward_tool_call(CommandRouter& router, const std::string& method,
                                const json& arguments) {
    json params = arguments.is_object() ? arguments : json::object();
    std::string device_id = json_util::safe_string(params, "deviceId");
    params.erase("deviceId");

    auto future = router.send_command_sync(device_id, method, params);
    uint32_t wait_ms = router.get_default_timeout() + FUTURE_GRACE_MS;
    if (future.wait_for(std::chrono::milliseconds(wait_ms)) != std::future_status::ready) {
        spdlog::error("[MCP Tools] {} was not settled within {}ms", method, wait_ms);
        return {BridgeError::timeout(method, router.get_default_timeout()).user_message(), true};
    }

    CommandResult outcome = future.get();
    if (outcome.ok()) {
        return {outcome.result.dump(2), false};
    }

    const BridgeError& error = outcome.error;
    spdlog::debug("[MCP Tools] {} failed: {} ({})", method, error.message,
                  error.get_type_string());
    if (error.type == BridgeErrorType::NO_DEVICE) {
        std::string text = error.user_message() +
                           "\n\nTo connect a device:\n"
                           "1. Start the instrumented application\n"
                           "2. Point its bridge client at this coordinator";
        if (!device_id.empty()) {
            text += "\n3. Check that deviceId '" + device_id +
                    "' matches a device from list_connected_devices";
        }
        return {text, true};
    }
    return {"Error: " + error.user_message() + " [" + error.get_type_string() + "]", true};
}

json connected_devices_json(const DeviceRegistry& devices) {
    json list = json::array();
    for (const auto& device : devices.list()) {
        list.push_back(device.to_json());
    }
    return {{"devices", list}, {"count", list.size()}};
}

void register_coordinator_tools(McpStdioServer& server, CommandRouter& router,
                                DeviceRegistry& devices) {
    for (const auto& info : BridgeCommandRegistry::all()) {
        std::string method = info.name;
        McpTool tool;
        tool.name = method;
        tool.description = info.description;
        tool.input_schema = command_input_schema(method);
        tool.handler = [&router, method](const json& arguments) {
            return forward_tool_call(router, method, arguments);
        };
        server.register_tool(std::move(tool));
    }

    McpTool list_devices;
    list_devices.name = LIST_DEVICES_TOOL;
    list_devices.description = "List all devices currently connected to the coordinator";
    list_devices.input_schema = {{"type", "object"}, {"properties", json::object()}};
    list_devices.handler = [&devices](const json&) {
        return McpToolResult{connected_devices_json(devices).dump(2), false};
    };
    server.register_tool(std::move(list_devices));

    spdlog::debug("[MCP Tools] Registered {} tools", server.tool_count());
}

} // namespace devbridge
