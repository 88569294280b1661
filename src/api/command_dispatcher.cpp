// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file command_dispatcher.cpp
 * @brief Client-side execution of bridge commands
 *
 * @pattern Closed command enum with an exhaustive switch; typed params parsed at the boundary
 * @threading dispatch() runs on the connection's event loop thread; async actions and network
 * replays reply from their own threads through the Responder
 */

#include "command_dispatcher.h"

#include "command_params.h"
#include "device_info.h"
#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <regex>

namespace devbridge {

namespace {

/// Stored values are returned parsed when they hold JSON, verbatim otherwise
json parse_stored_value(const std::string& raw) {
    try {
        return json::parse(raw);
    } catch (const json::parse_error&) {
        return raw;
    }
}

} // namespace

CommandDispatcher::CommandDispatcher(DispatchTargets targets, AppIdentity identity)
    : targets_(std::move(targets)), identity_(std::move(identity)),
      started_(std::chrono::steady_clock::now()) {}

void CommandDispatcher::set_ui_provider(std::shared_ptr<UiProvider> provider) {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    ui_provider_ = std::move(provider);
}

void CommandDispatcher::set_storage_provider(std::shared_ptr<StorageProvider> provider) {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    storage_provider_ = std::move(provider);
}

std::shared_ptr<UiProvider> CommandDispatcher::ui_provider() const {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    return ui_provider_;
}

std::shared_ptr<StorageProvider> CommandDispatcher::storage_provider() const {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    return storage_provider_;
}

void CommandDispatcher::dispatch(const RequestFrame& request, const Responder& responder) {
    spdlog::debug("[Command Dispatcher] {} (id {})", request.method, request.id);

    auto info = BridgeCommandRegistry::from_name(request.method);
    if (!info) {
        fallback_to_action(request, responder);
        return;
    }

    try {
        execute(info->command, request.params, responder);
    } catch (const CommandError& e) {
        spdlog::debug("[Command Dispatcher] {} rejected: {}", request.method, e.what());
        responder.reject(e.to_error(request.method));
    } catch (const json::exception& e) {
        // Typed access on a value of the wrong shape inside a handler
        responder.reject(BridgeError::invalid_params(e.what(), request.method));
    } catch (const std::exception& e) {
        spdlog::warn("[Command Dispatcher] Handler for {} threw: {}", request.method, e.what());
        responder.reject(BridgeError::handler_error(e.what(), request.method));
    }
}

void CommandDispatcher::fallback_to_action(const RequestFrame& request,
                                           const Responder& responder) {
    bool found = targets_.actions.invoke(
        request.method, request.params, [responder](json result) { responder.resolve(result); },
        [responder](const BridgeError& error) { responder.reject(error); });
    if (!found) {
        spdlog::warn("[Command Dispatcher] Unknown method: {}", request.method);
        responder.reject(BridgeError::unknown_method(request.method));
    }
}

void CommandDispatcher::execute(BridgeCommand command, const json& params,
                                const Responder& responder) {
    switch (command) {
    case BridgeCommand::GET_APP_STATE:
        responder.resolve(handle_get_app_state(params));
        return;
    case BridgeCommand::QUERY_STORAGE:
        responder.resolve(handle_query_storage(params));
        return;
    case BridgeCommand::LIST_ACTIONS: {
        auto names = targets_.actions.names();
        responder.resolve({{"actions", names}, {"count", names.size()}});
        return;
    }
    case BridgeCommand::EXECUTE_ACTION:
        handle_execute_action(params, responder);
        return;
    case BridgeCommand::NAVIGATE_TO:
        handle_navigate_to(params, responder);
        return;
    case BridgeCommand::LIST_FEATURE_FLAGS:
        responder.resolve({{"flags", targets_.flags.to_json()}});
        return;
    case BridgeCommand::TOGGLE_FEATURE_FLAG:
        responder.resolve(handle_toggle_feature_flag(params));
        return;
    case BridgeCommand::GET_COMPONENT_TREE:
        responder.resolve(handle_get_component_tree(params));
        return;
    case BridgeCommand::GET_LAYOUT_TREE: {
        auto p = params::GetLayoutTree::parse(params);
        responder.resolve(targets_.components.layout_tree(p.include_hidden));
        return;
    }
    case BridgeCommand::INSPECT_ELEMENT: {
        auto p = params::InspectElement::parse(params);
        responder.resolve(targets_.components.inspect(p.x, p.y));
        return;
    }
    case BridgeCommand::FIND_ELEMENT: {
        auto p = params::FindElement::parse(params);
        responder.resolve(targets_.components.find({p.test_id, p.type, p.text}));
        return;
    }
    case BridgeCommand::GET_ELEMENT_TEXT: {
        auto p = params::GetElementText::parse(params);
        responder.resolve(targets_.components.element_text(p.test_id));
        return;
    }
    case BridgeCommand::SIMULATE_INTERACTION:
        responder.resolve(handle_simulate_interaction(params));
        return;
    case BridgeCommand::CAPTURE_SCREENSHOT:
        responder.resolve(handle_capture_screenshot());
        return;
    case BridgeCommand::GET_NAVIGATION_STATE:
        responder.resolve(targets_.navigation.to_json());
        return;
    case BridgeCommand::LIST_NETWORK_REQUESTS: {
        auto p = params::ListNetworkRequests::parse(params);
        json requests = targets_.network.list_requests(p.filter);
        responder.resolve({{"count", requests.size()}, {"requests", requests}});
        return;
    }
    case BridgeCommand::MOCK_NETWORK_REQUEST:
        responder.resolve(handle_mock_network_request(params));
        return;
    case BridgeCommand::CLEAR_NETWORK_MOCKS:
        responder.resolve(handle_clear_network_mocks(params));
        return;
    case BridgeCommand::REPLAY_NETWORK_REQUEST:
        handle_replay_network_request(params, responder);
        return;
    case BridgeCommand::GET_LOGS:
        responder.resolve(handle_get_logs(params));
        return;
    case BridgeCommand::GET_RECENT_ERRORS:
        responder.resolve(handle_get_recent_errors(params));
        return;
    case BridgeCommand::GET_TRACES: {
        auto p = params::GetTraces::parse(params);
        json traces = targets_.traces.get_traces(p.filter);
        responder.resolve({{"count", traces.size()}, {"traces", traces}});
        return;
    }
    case BridgeCommand::GET_ACTIVE_TRACES: {
        json traces = targets_.traces.get_active();
        responder.resolve({{"count", traces.size()}, {"traces", traces}});
        return;
    }
    case BridgeCommand::CLEAR_TRACES: {
        size_t cleared = targets_.traces.clear();
        responder.resolve({{"success", true}, {"cleared", cleared}});
        return;
    }
    case BridgeCommand::GET_DEVICE_INFO:
        responder.resolve(collect_device_info(identity_.device_id));
        return;
    case BridgeCommand::GET_APP_INFO:
        responder.resolve(handle_app_info());
        return;
    }

    // Unreachable for a valid enum value
    responder.reject(BridgeError::unknown_method(responder.method()));
}

json CommandDispatcher::handle_get_app_state(const json& params) {
    auto p = params::GetAppState::parse(params);
    if (p.key) {
        return {{*p.key, targets_.state.get(*p.key)}};
    }
    return targets_.state.snapshot();
}

json CommandDispatcher::handle_query_storage(const json& params) {
    auto p = params::QueryStorage::parse(params);
    auto storage = storage_provider();
    if (!storage) {
        throw CommandError(BridgeErrorType::HANDLER_ERROR, "No storage provider installed");
    }

    if (p.key) {
        auto value = storage->get(*p.key);
        return {{"key", *p.key},
                {"value", value ? parse_stored_value(*value) : json(nullptr)},
                {"exists", value.has_value()}};
    }

    std::optional<std::regex> re;
    if (p.pattern) {
        try {
            re.emplace(*p.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw CommandError(BridgeErrorType::INVALID_PARAMS,
                               "Invalid pattern '" + *p.pattern + "': " + e.what());
        }
    }

    json keys = json::array();
    json values = json::object();
    for (const auto& key : storage->keys()) {
        if (re && !std::regex_search(key, *re)) {
            continue;
        }
        keys.push_back(key);
        auto value = storage->get(key);
        values[key] = value ? parse_stored_value(*value) : json(nullptr);
    }
    return {{"keyCount", keys.size()}, {"keys", keys}, {"storage", values}};
}

void CommandDispatcher::handle_execute_action(const json& params, const Responder& responder) {
    auto p = params::ExecuteAction::parse(params);
    std::string action = p.action;
    bool found = targets_.actions.invoke(
        action, p.params,
        [responder, action](json result) {
            responder.resolve({{"success", true}, {"action", action}, {"result", result}});
        },
        [responder](const BridgeError& error) { responder.reject(error); });
    if (!found) {
        throw CommandError(BridgeErrorType::INVALID_PARAMS, "Action not registered: " + action);
    }
}

void CommandDispatcher::handle_navigate_to(const json& params, const Responder& responder) {
    auto p = params::NavigateTo::parse(params);
    json action_params = {{"route", p.route}, {"params", p.params}};
    NavigationTracker& navigation = targets_.navigation;
    std::string route = p.route;
    json route_params = p.params;

    bool found = targets_.actions.invoke(
        "navigate", action_params,
        [responder, &navigation, route, route_params](json result) {
            navigation.set_navigation_state(route, route_params);
            responder.resolve({{"success", true}, {"route", route}, {"result", result}});
        },
        [responder](const BridgeError& error) { responder.reject(error); });
    if (!found) {
        throw CommandError(BridgeErrorType::HANDLER_ERROR,
                           "No navigation handler registered (register an action named "
                           "'navigate')");
    }
}

json CommandDispatcher::handle_toggle_feature_flag(const json& params) {
    auto p = params::ToggleFeatureFlag::parse(params);
    bool value = targets_.flags.toggle(p.flag, p.enabled);
    spdlog::info("[Command Dispatcher] Feature flag '{}' -> {}", p.flag, value);
    return {{"flag", p.flag}, {"enabled", value}};
}

json CommandDispatcher::handle_get_component_tree(const json& params) {
    auto p = params::GetComponentTree::parse(params);
    json tree = targets_.components.component_tree(p.include_props);
    if (auto ui = ui_provider()) {
        tree["viewHierarchy"] = ui->view_hierarchy();
    }
    return tree;
}

json CommandDispatcher::handle_simulate_interaction(const json& params) {
    auto p = params::SimulateInteraction::parse(params);
    return targets_.components.simulate(p.type, p.test_id, p.point, p.value);
}

json CommandDispatcher::handle_capture_screenshot() {
    auto ui = ui_provider();
    if (!ui) {
        throw CommandError(BridgeErrorType::HANDLER_ERROR, "No UI provider installed");
    }
    std::string data = ui->capture_screenshot();
    return {{"format", "png"}, {"encoding", "base64"}, {"data", data}};
}

json CommandDispatcher::handle_mock_network_request(const json& params) {
    auto p = params::MockNetworkRequest::parse(params);
    std::string mock_id =
        targets_.network.add_mock(p.url_pattern, p.status, p.body, p.headers, p.delay_ms);
    return {{"success", true},
            {"mockId", mock_id},
            {"urlPattern", p.url_pattern},
            {"activeMocks", targets_.network.mock_count()}};
}

json CommandDispatcher::handle_clear_network_mocks(const json& params) {
    auto p = params::ClearNetworkMocks::parse(params);
    if (p.mock_id) {
        bool removed = targets_.network.remove_mock(*p.mock_id);
        json result = {{"success", removed},
                       {"mockId", *p.mock_id},
                       {"remainingMocks", targets_.network.mock_count()}};
        if (!removed) {
            result["error"] = "Mock not found";
        }
        return result;
    }
    size_t cleared = targets_.network.clear_mocks();
    return {{"success", true}, {"clearedCount", cleared}, {"remainingMocks", 0}};
}

void CommandDispatcher::handle_replay_network_request(const json& params,
                                                      const Responder& responder) {
    auto p = params::ReplayNetworkRequest::parse(params);
    bool started = targets_.network.replay(p.request_id, p.modifications,
                                           [responder](json result) { responder.resolve(result); });
    if (!started) {
        responder.resolve(
            {{"success", false}, {"error", "Request not found"}, {"requestId", p.request_id}});
    }
}

json CommandDispatcher::handle_get_logs(const json& params) {
    auto p = params::GetLogs::parse(params);
    if (!targets_.logs) {
        throw CommandError(BridgeErrorType::HANDLER_ERROR, "Log capture is not enabled");
    }
    json logs = targets_.logs->query(p.query);
    return {{"count", logs.size()}, {"logs", logs}};
}

json CommandDispatcher::handle_get_recent_errors(const json& params) {
    auto p = params::GetRecentErrors::parse(params);
    if (!targets_.logs) {
        throw CommandError(BridgeErrorType::HANDLER_ERROR, "Log capture is not enabled");
    }
    LogQuery query;
    query.min_level = spdlog::level::err;
    query.limit = p.limit;
    json errors = targets_.logs->query(query);
    return {{"count", errors.size()}, {"errors", errors}};
}

json CommandDispatcher::handle_app_info() const {
    auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - started_)
                      .count();
    return {{"appName", identity_.app_name},
            {"appVersion", identity_.app_version},
            {"deviceId", identity_.device_id},
            {"platform", identity_.platform},
            {"bridgeVersion", BRIDGE_PROTOCOL_VERSION},
            {"capabilities", BridgeCommandRegistry::capabilities()},
            {"actions", targets_.actions.names()},
            {"stateKeys", targets_.state.keys()},
            {"uptimeMs", uptime}};
}

} // namespace devbridge
