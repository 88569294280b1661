// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_events.h"
#include "bridge_protocol.h"
#include "command_router.h"
#include "device_link.h"
#include "device_registry.h"
#include "timer_service.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "hv/EventLoopThread.h"
#include "hv/WebSocketServer.h"

namespace devbridge {

struct BridgeServerOptions {
    std::string host = "127.0.0.1";
    int port = DEFAULT_BRIDGE_PORT;
    uint32_t handshake_timeout_ms = 5000;
    uint32_t request_timeout_ms = CommandRouter::DEFAULT_TIMEOUT_MS;
};

/**
 * @brief Coordinator endpoint that application instances connect to
 *
 * Accepts WebSocket links, registers each one as a device once its handshake
 * arrives, and feeds responses and events to the CommandRouter. Links that do
 * not handshake within the handshake timeout are closed.
 *
 * Socket callbacks run on libhv server threads; timers run on a private
 * event loop thread owned by this object.
 */
class BridgeServer {
  public:
    explicit BridgeServer(BridgeServerOptions options = {});
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    /**
     * @brief Start listening
     *
     * @return 0 on success, libhv error code otherwise
     */
    int start();

    /// Stop listening, close every link and reject pending requests
    void stop();

    [[nodiscard]] bool is_running() const {
        return running_;
    }

    DeviceRegistry& devices() {
        return devices_;
    }

    CommandRouter& router() {
        return *router_;
    }

    [[nodiscard]] int port() const {
        return options_.port;
    }

    [[nodiscard]] const std::string& host() const {
        return options_.host;
    }

    /// Receives connection lifecycle events and router events
    void register_event_handler(BridgeEventCallback cb);

  private:
    struct PeerState {
        std::shared_ptr<ChannelLink> link;
        TimerHandle handshake_timer = INVALID_TIMER;
        bool handshaken = false;
    };

    void on_open(const hv::WebSocketChannelPtr& channel);
    void on_message(const hv::WebSocketChannelPtr& channel, const std::string& text);
    void on_close(const hv::WebSocketChannelPtr& channel);

    void on_handshake(const hv::WebSocketChannelPtr& channel, const HandshakeFrame& handshake);
    void on_handshake_timeout(const hv::Channel* channel);
    void emit_event(BridgeEventType type, const std::string& message, const std::string& device_id,
                    bool is_error);

    BridgeServerOptions options_;

    // Timer loop first: the router cancels timers on destruction
    std::shared_ptr<hv::EventLoopThread> timer_loop_;
    std::unique_ptr<EventLoopTimerService> timers_;
    DeviceRegistry devices_;
    std::unique_ptr<CommandRouter> router_;

    hv::WebSocketService service_;
    std::unique_ptr<hv::WebSocketServer> server_;

    std::mutex peers_mutex_;
    std::map<const hv::Channel*, PeerState> peers_;

    std::mutex handler_mutex_;
    BridgeEventCallback event_handler_;

    std::atomic_bool running_{false};
};

} // namespace devbridge
