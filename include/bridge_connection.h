// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_protocol.h"
#include "reconnect_scheduler.h"
#include "timer_service.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "hv/WebSocketClient.h"

namespace devbridge {

/**
 * @brief Connection state of a bridge link
 */
enum class ConnectionState {
    DISCONNECTED, // Not connected
    CONNECTING,   // Connection in progress
    CONNECTED     // Connected and handshake sent
};

const char* connection_state_name(ConnectionState state);

/**
 * @brief Client side of the bridge WebSocket link
 *
 * Sends the handshake as soon as the socket opens, decodes incoming frames
 * and hands requests to the installed handler. After a failure or a dropped
 * connection it retries at a fixed delay through a ReconnectScheduler
 * (libhv's own reconnect is disabled).
 *
 * libhv callbacks run on the client's event loop thread and never let an
 * exception escape. send_*() may be called from any thread.
 *
 * Retry timers come from the TimerService given at construction, or from
 * one bound to the client's event loop when none is given.
 */
class BridgeConnection : public hv::WebSocketClient {
  public:
    using RequestHandler = std::function<void(const RequestFrame&)>;
    using EventHandler = std::function<void(const EventFrame&)>;
    using StateCallback = std::function<void(ConnectionState, ConnectionState)>;

    explicit BridgeConnection(hv::EventLoopPtr loop = nullptr, TimerService* timers = nullptr);
    virtual ~BridgeConnection();

    // Prevent copying (WebSocket client should not be copied)
    BridgeConnection(const BridgeConnection&) = delete;
    BridgeConnection& operator=(const BridgeConnection&) = delete;

    /**
     * @brief Open the link and keep it open until disconnect()
     *
     * Calling it again for the URL already in use is a no-op; a different URL
     * drops the current link first.
     *
     * @param url Coordinator URL (e.g., "ws://localhost:8765")
     * @return 0 on success, non-zero if libhv refused to start the attempt
     */
    int connect(const std::string& url);

    /**
     * @brief Close the link and stop reconnecting
     *
     * Safe to call multiple times (idempotent).
     */
    void disconnect();

    /// Cancel any pending retry and reconnect immediately
    void reconnect_now();

    /// @return false if not connected or the write failed
    bool send_text(const std::string& text);
    bool send_response(const ResponseFrame& frame);
    bool send_event(const EventFrame& frame);

    void set_handshake(HandshakeFrame handshake);
    void set_request_handler(RequestHandler handler);
    void set_event_handler(EventHandler handler);
    void set_state_change_callback(StateCallback cb);

    void set_reconnect_delay(uint32_t delay_ms) {
        reconnect_.set_delay(delay_ms);
    }

    void set_connection_timeout(uint32_t timeout_ms) {
        connection_timeout_ms_ = timeout_ms;
    }

    [[nodiscard]] ConnectionState get_connection_state() const {
        return connection_state_;
    }

    [[nodiscard]] uint32_t reconnect_attempts() const {
        return reconnect_.attempts();
    }

    [[nodiscard]] const std::string& url() const {
        return url_;
    }

  protected:
    // Socket operations, overridable so the state machine runs without a network
    virtual int open_transport(const std::string& url);
    virtual int write_frame(const std::string& text);
    virtual void close_transport();
    virtual bool transport_connected();

  private:
    void set_connection_state(ConnectionState new_state);
    void install_callbacks();
    int open_socket();
    void handle_message(const std::string& msg);

    std::shared_ptr<bool> lifetime_guard_ = std::make_shared<bool>(true);
    std::atomic_bool is_destroying_{false};

    std::unique_ptr<TimerService> owned_timers_;
    TimerService& timers_;
    ReconnectScheduler reconnect_;

    std::atomic<ConnectionState> connection_state_{ConnectionState::DISCONNECTED};
    std::atomic_bool was_connected_{false};
    uint32_t connection_timeout_ms_ = 5000;
    std::string url_;

    std::mutex handlers_mutex_;
    HandshakeFrame handshake_;
    RequestHandler request_handler_;
    EventHandler event_handler_;
    StateCallback state_change_callback_;
};

} // namespace devbridge
