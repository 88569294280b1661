// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "action_registry.h"
#include "bridge_command.h"
#include "bridge_protocol.h"
#include "bridge_providers.h"
#include "component_registry.h"
#include "feature_flags.h"
#include "log_capture_sink.h"
#include "navigation_tracker.h"
#include "network_interceptor.h"
#include "responder.h"
#include "state_registry.h"
#include "trace_engine.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace devbridge {

/**
 * @brief Identity of the instrumented application
 */
struct AppIdentity {
    std::string app_name;
    std::string app_version;
    std::string device_id;
    std::string platform;
};

/**
 * @brief Registries a dispatcher executes commands against
 *
 * All references must outlive the dispatcher. @c logs may be null when log
 * capture is disabled.
 */
struct DispatchTargets {
    StateRegistry& state;
    ActionRegistry& actions;
    ComponentRegistry& components;
    NavigationTracker& navigation;
    FeatureFlags& flags;
    InterceptingTransport& network;
    TraceEngine& traces;
    std::shared_ptr<LogCaptureSink> logs;
};

/**
 * @brief Executes request frames against the client registries
 *
 * Built-in methods resolve through BridgeCommandRegistry; any other method
 * name falls back to an action registered under that name. Params are parsed
 * into typed structs before a handler runs, and every handler is wrapped so
 * an exception becomes an error response. Each request is answered exactly
 * once through its Responder, possibly later and from another thread for
 * asynchronous commands.
 *
 * Handlers are not serialized: dispatch() may run concurrently.
 */
class CommandDispatcher {
  public:
    CommandDispatcher(DispatchTargets targets, AppIdentity identity);

    // Non-copyable (has mutex)
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /// Execute @p request and reply through @p responder
    void dispatch(const RequestFrame& request, const Responder& responder);

    void set_ui_provider(std::shared_ptr<UiProvider> provider);
    void set_storage_provider(std::shared_ptr<StorageProvider> provider);

    [[nodiscard]] const AppIdentity& identity() const {
        return identity_;
    }

  private:
    void execute(BridgeCommand command, const json& params, const Responder& responder);
    void fallback_to_action(const RequestFrame& request, const Responder& responder);

    json handle_get_app_state(const json& params);
    json handle_query_storage(const json& params);
    void handle_execute_action(const json& params, const Responder& responder);
    void handle_navigate_to(const json& params, const Responder& responder);
    json handle_toggle_feature_flag(const json& params);
    json handle_get_component_tree(const json& params);
    json handle_simulate_interaction(const json& params);
    json handle_capture_screenshot();
    json handle_mock_network_request(const json& params);
    json handle_clear_network_mocks(const json& params);
    void handle_replay_network_request(const json& params, const Responder& responder);
    json handle_get_logs(const json& params);
    json handle_get_recent_errors(const json& params);
    json handle_app_info() const;

    std::shared_ptr<UiProvider> ui_provider() const;
    std::shared_ptr<StorageProvider> storage_provider() const;

    DispatchTargets targets_;
    AppIdentity identity_;
    std::chrono::steady_clock::time_point started_;

    mutable std::mutex providers_mutex_;
    std::shared_ptr<UiProvider> ui_provider_;
    std::shared_ptr<StorageProvider> storage_provider_;
};

} // namespace devbridge
