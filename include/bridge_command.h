// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace devbridge {

/**
 * @brief Built-in commands every instrumented instance understands
 *
 * Method names not in this table fall back to registered actions.
 */
enum class BridgeCommand {
    GET_APP_STATE,
    QUERY_STORAGE,
    LIST_ACTIONS,
    EXECUTE_ACTION,
    NAVIGATE_TO,
    LIST_FEATURE_FLAGS,
    TOGGLE_FEATURE_FLAG,
    GET_COMPONENT_TREE,
    GET_LAYOUT_TREE,
    INSPECT_ELEMENT,
    FIND_ELEMENT,
    GET_ELEMENT_TEXT,
    SIMULATE_INTERACTION,
    CAPTURE_SCREENSHOT,
    GET_NAVIGATION_STATE,
    LIST_NETWORK_REQUESTS,
    MOCK_NETWORK_REQUEST,
    CLEAR_NETWORK_MOCKS,
    REPLAY_NETWORK_REQUEST,
    GET_LOGS,
    GET_RECENT_ERRORS,
    GET_TRACES,
    GET_ACTIVE_TRACES,
    CLEAR_TRACES,
    GET_DEVICE_INFO,
    GET_APP_INFO,
};

/**
 * @brief Metadata for a built-in command
 */
struct CommandInfo {
    BridgeCommand command;   ///< The command enum
    std::string name;        ///< Wire method name (e.g., "get_app_state")
    std::string capability;  ///< Capability group advertised in the handshake
    std::string description; ///< One-line description for tool listings
};

/**
 * @brief Registry of built-in bridge commands
 *
 * Provides lookup by enum and by wire name, and iteration in a fixed order.
 */
class BridgeCommandRegistry {
  public:
    /**
     * @brief Get command info by enum
     */
    static const CommandInfo& get(BridgeCommand cmd) {
        return all()[static_cast<size_t>(cmd)];
    }

    /**
     * @brief Reverse lookup by wire method name
     *
     * @param name Method name from a request frame
     * @return CommandInfo if built in, nullopt otherwise
     */
    static std::optional<CommandInfo> from_name(const std::string& name) {
        for (const auto& info : all()) {
            if (info.name == name) {
                return info;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Get all built-in commands, ordered as the enum
     */
    static const std::vector<CommandInfo>& all() {
        // Meyer's singleton for thread-safe lazy initialization
        static const std::vector<CommandInfo> commands = build_all();
        return commands;
    }

    /**
     * @brief Distinct capability groups, in first-seen order
     */
    static std::vector<std::string> capabilities() {
        std::vector<std::string> result;
        for (const auto& info : all()) {
            bool seen = false;
            for (const auto& c : result) {
                if (c == info.capability) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                result.push_back(info.capability);
            }
        }
        return result;
    }

  private:
    static const char* command_name(BridgeCommand cmd) {
        switch (cmd) {
        case BridgeCommand::GET_APP_STATE:
            return "get_app_state";
        case BridgeCommand::QUERY_STORAGE:
            return "query_storage";
        case BridgeCommand::LIST_ACTIONS:
            return "list_actions";
        case BridgeCommand::EXECUTE_ACTION:
            return "execute_action";
        case BridgeCommand::NAVIGATE_TO:
            return "navigate_to";
        case BridgeCommand::LIST_FEATURE_FLAGS:
            return "list_feature_flags";
        case BridgeCommand::TOGGLE_FEATURE_FLAG:
            return "toggle_feature_flag";
        case BridgeCommand::GET_COMPONENT_TREE:
            return "get_component_tree";
        case BridgeCommand::GET_LAYOUT_TREE:
            return "get_layout_tree";
        case BridgeCommand::INSPECT_ELEMENT:
            return "inspect_element";
        case BridgeCommand::FIND_ELEMENT:
            return "find_element";
        case BridgeCommand::GET_ELEMENT_TEXT:
            return "get_element_text";
        case BridgeCommand::SIMULATE_INTERACTION:
            return "simulate_interaction";
        case BridgeCommand::CAPTURE_SCREENSHOT:
            return "capture_screenshot";
        case BridgeCommand::GET_NAVIGATION_STATE:
            return "get_navigation_state";
        case BridgeCommand::LIST_NETWORK_REQUESTS:
            return "list_network_requests";
        case BridgeCommand::MOCK_NETWORK_REQUEST:
            return "mock_network_request";
        case BridgeCommand::CLEAR_NETWORK_MOCKS:
            return "clear_network_mocks";
        case BridgeCommand::REPLAY_NETWORK_REQUEST:
            return "replay_network_request";
        case BridgeCommand::GET_LOGS:
            return "get_logs";
        case BridgeCommand::GET_RECENT_ERRORS:
            return "get_recent_errors";
        case BridgeCommand::GET_TRACES:
            return "get_traces";
        case BridgeCommand::GET_ACTIVE_TRACES:
            return "get_active_traces";
        case BridgeCommand::CLEAR_TRACES:
            return "clear_traces";
        case BridgeCommand::GET_DEVICE_INFO:
            return "get_device_info";
        case BridgeCommand::GET_APP_INFO:
            return "get_app_info";
        }
        return "unknown";
    }

    static const char* command_capability(BridgeCommand cmd) {
        switch (cmd) {
        case BridgeCommand::GET_APP_STATE:
        case BridgeCommand::QUERY_STORAGE:
            return "state";
        case BridgeCommand::LIST_ACTIONS:
        case BridgeCommand::EXECUTE_ACTION:
        case BridgeCommand::NAVIGATE_TO:
            return "actions";
        case BridgeCommand::LIST_FEATURE_FLAGS:
        case BridgeCommand::TOGGLE_FEATURE_FLAG:
            return "feature_flags";
        case BridgeCommand::GET_COMPONENT_TREE:
        case BridgeCommand::GET_LAYOUT_TREE:
        case BridgeCommand::INSPECT_ELEMENT:
        case BridgeCommand::FIND_ELEMENT:
        case BridgeCommand::GET_ELEMENT_TEXT:
        case BridgeCommand::SIMULATE_INTERACTION:
        case BridgeCommand::CAPTURE_SCREENSHOT:
            return "ui";
        case BridgeCommand::GET_NAVIGATION_STATE:
            return "navigation";
        case BridgeCommand::LIST_NETWORK_REQUESTS:
        case BridgeCommand::MOCK_NETWORK_REQUEST:
        case BridgeCommand::CLEAR_NETWORK_MOCKS:
        case BridgeCommand::REPLAY_NETWORK_REQUEST:
            return "network";
        case BridgeCommand::GET_LOGS:
        case BridgeCommand::GET_RECENT_ERRORS:
            return "logs";
        case BridgeCommand::GET_TRACES:
        case BridgeCommand::GET_ACTIVE_TRACES:
        case BridgeCommand::CLEAR_TRACES:
            return "tracing";
        case BridgeCommand::GET_DEVICE_INFO:
        case BridgeCommand::GET_APP_INFO:
            return "device";
        }
        return "unknown";
    }

    static const char* command_description(BridgeCommand cmd) {
        switch (cmd) {
        case BridgeCommand::GET_APP_STATE:
            return "Get registered application state, optionally a single (dotted) key";
        case BridgeCommand::QUERY_STORAGE:
            return "Query the app's key-value storage by key or key pattern";
        case BridgeCommand::LIST_ACTIONS:
            return "List actions registered by the app";
        case BridgeCommand::EXECUTE_ACTION:
            return "Execute a registered action with parameters";
        case BridgeCommand::NAVIGATE_TO:
            return "Navigate the app to a route";
        case BridgeCommand::LIST_FEATURE_FLAGS:
            return "List feature flags and their values";
        case BridgeCommand::TOGGLE_FEATURE_FLAG:
            return "Set or flip a feature flag";
        case BridgeCommand::GET_COMPONENT_TREE:
            return "Get the registered UI component tree";
        case BridgeCommand::GET_LAYOUT_TREE:
            return "Get components with their layout bounds";
        case BridgeCommand::INSPECT_ELEMENT:
            return "Find the component at a screen coordinate";
        case BridgeCommand::FIND_ELEMENT:
            return "Find components by testId, type and/or text";
        case BridgeCommand::GET_ELEMENT_TEXT:
            return "Get the text content of a component";
        case BridgeCommand::SIMULATE_INTERACTION:
            return "Tap or type into a component";
        case BridgeCommand::CAPTURE_SCREENSHOT:
            return "Capture a screenshot of the app";
        case BridgeCommand::GET_NAVIGATION_STATE:
            return "Get current route, params and navigation history";
        case BridgeCommand::LIST_NETWORK_REQUESTS:
            return "List captured outbound HTTP requests";
        case BridgeCommand::MOCK_NETWORK_REQUEST:
            return "Mock responses for requests matching a URL pattern";
        case BridgeCommand::CLEAR_NETWORK_MOCKS:
            return "Remove one network mock or all of them";
        case BridgeCommand::REPLAY_NETWORK_REQUEST:
            return "Re-issue a captured request";
        case BridgeCommand::GET_LOGS:
            return "Get recent log records";
        case BridgeCommand::GET_RECENT_ERRORS:
            return "Get recent error-level log records";
        case BridgeCommand::GET_TRACES:
            return "Get finished function traces, or in-progress ones";
        case BridgeCommand::GET_ACTIVE_TRACES:
            return "Get traces that have not returned yet";
        case BridgeCommand::CLEAR_TRACES:
            return "Clear trace history";
        case BridgeCommand::GET_DEVICE_INFO:
            return "Get device and operating system information";
        case BridgeCommand::GET_APP_INFO:
            return "Get application name, version and capabilities";
        }
        return "";
    }

    static std::vector<CommandInfo> build_all() {
        std::vector<CommandInfo> result;
        constexpr BridgeCommand ordered[] = {
            BridgeCommand::GET_APP_STATE,
            BridgeCommand::QUERY_STORAGE,
            BridgeCommand::LIST_ACTIONS,
            BridgeCommand::EXECUTE_ACTION,
            BridgeCommand::NAVIGATE_TO,
            BridgeCommand::LIST_FEATURE_FLAGS,
            BridgeCommand::TOGGLE_FEATURE_FLAG,
            BridgeCommand::GET_COMPONENT_TREE,
            BridgeCommand::GET_LAYOUT_TREE,
            BridgeCommand::INSPECT_ELEMENT,
            BridgeCommand::FIND_ELEMENT,
            BridgeCommand::GET_ELEMENT_TEXT,
            BridgeCommand::SIMULATE_INTERACTION,
            BridgeCommand::CAPTURE_SCREENSHOT,
            BridgeCommand::GET_NAVIGATION_STATE,
            BridgeCommand::LIST_NETWORK_REQUESTS,
            BridgeCommand::MOCK_NETWORK_REQUEST,
            BridgeCommand::CLEAR_NETWORK_MOCKS,
            BridgeCommand::REPLAY_NETWORK_REQUEST,
            BridgeCommand::GET_LOGS,
            BridgeCommand::GET_RECENT_ERRORS,
            BridgeCommand::GET_TRACES,
            BridgeCommand::GET_ACTIVE_TRACES,
            BridgeCommand::CLEAR_TRACES,
            BridgeCommand::GET_DEVICE_INFO,
            BridgeCommand::GET_APP_INFO,
        };
        for (auto cmd : ordered) {
            result.push_back(
                CommandInfo{cmd, command_name(cmd), command_capability(cmd), command_description(cmd)});
        }
        return result;
    }
};

} // namespace devbridge
