// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "action_registry.h"
#include "bridge_connection.h"
#include "command_dispatcher.h"
#include "component_registry.h"
#include "feature_flags.h"
#include "http_transport.h"
#include "log_capture_sink.h"
#include "navigation_tracker.h"
#include "network_interceptor.h"
#include "state_registry.h"
#include "trace_engine.h"

#include <memory>
#include <string>

namespace devbridge {

/**
 * @brief Settings for a BridgeClient
 */
struct BridgeClientOptions {
    std::string url = "ws://localhost:8765";
    AppIdentity identity; ///< Empty device_id/platform are filled in automatically
    uint32_t reconnect_delay_ms = ReconnectScheduler::DEFAULT_DELAY_MS;
    uint32_t connect_timeout_ms = 5000;

    /// Sink already attached to the logger (see logging::init); null disables get_logs
    std::shared_ptr<LogCaptureSink> log_sink;

    /// Real outbound path wrapped by http(); LibhvHttpTransport when null
    std::shared_ptr<HttpTransport> http_transport;
};

/**
 * @brief The bridge instance of an instrumented process
 *
 * Owns every client registry, the dispatcher and the connection. Host code
 * keeps one BridgeClient for the life of the process and registers state,
 * actions and components on it; there are no global registries.
 *
 * Typical use:
 * @code
 *   BridgeClient bridge(options);
 *   bridge.state().register_state("cart", [&] { return cart.to_json(); });
 *   bridge.actions().register_action("clear_cart", [&](const json&) { ... });
 *   bridge.start();
 * @endcode
 */
class BridgeClient {
  public:
    explicit BridgeClient(BridgeClientOptions options);
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    /// Connect and keep reconnecting until stop(); @return 0 on success
    int start();

    /// Disconnect and stop reconnecting
    void stop();

    /// Retry the connection immediately instead of waiting for the delay
    void reconnect_now();

    /**
     * @brief Push an event frame to the coordinator
     *
     * @return false if not connected
     */
    bool emit_event(const std::string& event, json data = nullptr);

    StateRegistry& state() {
        return state_;
    }
    ActionRegistry& actions() {
        return actions_;
    }
    ComponentRegistry& components() {
        return components_;
    }
    NavigationTracker& navigation() {
        return navigation_;
    }
    FeatureFlags& flags() {
        return flags_;
    }
    TraceEngine& traces() {
        return traces_;
    }

    /// Route outbound HTTP through this transport to make it visible and mockable
    std::shared_ptr<InterceptingTransport> http() {
        return http_;
    }

    std::shared_ptr<LogCaptureSink> log_sink() {
        return options_.log_sink;
    }

    void set_ui_provider(std::shared_ptr<UiProvider> provider);
    void set_storage_provider(std::shared_ptr<StorageProvider> provider);

    void set_state_change_callback(BridgeConnection::StateCallback cb);

    [[nodiscard]] ConnectionState connection_state() const {
        return connection_->get_connection_state();
    }

    [[nodiscard]] const AppIdentity& identity() const {
        return options_.identity;
    }

    /// Handshake sent on every (re)connect
    [[nodiscard]] HandshakeFrame handshake() const;

    CommandDispatcher& dispatcher() {
        return *dispatcher_;
    }

  private:
    void on_request(const RequestFrame& request);

    BridgeClientOptions options_;

    StateRegistry state_;
    ActionRegistry actions_;
    ComponentRegistry components_;
    NavigationTracker navigation_;
    FeatureFlags flags_;
    TraceEngine traces_;
    std::shared_ptr<InterceptingTransport> http_;

    std::unique_ptr<CommandDispatcher> dispatcher_;
    std::shared_ptr<BridgeConnection> connection_; ///< Shared so late replies can detect teardown
};

} // namespace devbridge
