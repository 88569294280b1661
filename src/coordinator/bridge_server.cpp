// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file bridge_server.cpp
 * @brief Coordinator WebSocket endpoint for application instances
 *
 * @pattern libhv WebSocketService callbacks + per-channel PeerState map
 * @threading Socket callbacks on libhv worker threads, timers on timer_loop_
 * @gotchas A superseded link's close arrives after the new registration;
 *          removal is by link so it cannot unregister the newer device
 */

#include "bridge_server.h"

#include "error_reporting.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace devbridge {

BridgeServer::BridgeServer(BridgeServerOptions options)
    : options_(std::move(options)), timer_loop_(std::make_shared<hv::EventLoopThread>()) {
    timer_loop_->start();
    timers_ = std::make_unique<EventLoopTimerService>(timer_loop_->loop());
    router_ = std::make_unique<CommandRouter>(devices_, *timers_);
    router_->set_default_timeout(options_.request_timeout_ms);
    router_->register_event_handler([this](const BridgeEvent& evt) {
        emit_event(evt.type, evt.message, evt.device_id, evt.is_error);
    });

    service_.onopen = [this](const hv::WebSocketChannelPtr& channel, const HttpRequestPtr&) {
        try {
            on_open(channel);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Bridge Server] Exception in onopen callback: {}", e.what());
        } catch (...) {
            LOG_ERROR_INTERNAL("[Bridge Server] Unknown exception in onopen callback");
        }
    };
    service_.onmessage = [this](const hv::WebSocketChannelPtr& channel, const std::string& msg) {
        try {
            on_message(channel, msg);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Bridge Server] Exception in onmessage callback: {}", e.what());
        } catch (...) {
            LOG_ERROR_INTERNAL("[Bridge Server] Unknown exception in onmessage callback");
        }
    };
    service_.onclose = [this](const hv::WebSocketChannelPtr& channel) {
        try {
            on_close(channel);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Bridge Server] Exception in onclose callback: {}", e.what());
        } catch (...) {
            LOG_ERROR_INTERNAL("[Bridge Server] Unknown exception in onclose callback");
        }
    };
}

BridgeServer::~BridgeServer() {
    stop();
    // Router rejects what is left before the timer service goes away
    router_.reset();
    timers_.reset();
    timer_loop_->stop();
    timer_loop_->join();
}

int BridgeServer::start() {
    if (running_) {
        return 0;
    }

    server_ = std::make_unique<hv::WebSocketServer>();
    server_->setHost(options_.host.c_str());
    server_->setPort(options_.port);
    server_->setThreadNum(1);
    server_->registerWebSocketService(&service_);

    int rc = server_->start();
    if (rc != 0) {
        spdlog::error("[Bridge Server] Failed to listen on {}:{} (error {})", options_.host,
                      options_.port, rc);
        server_.reset();
        return rc;
    }

    running_ = true;
    spdlog::info("[Bridge Server] Listening on ws://{}:{}", options_.host, options_.port);
    return 0;
}

void BridgeServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("[Bridge Server] Stopping");
    if (server_) {
        server_->stop();
        server_.reset();
    }

    // Closed channels may not deliver onclose after the server stops
    std::map<const hv::Channel*, PeerState> peers;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        peers.swap(peers_);
    }
    for (auto& [channel, peer] : peers) {
        timers_->cancel(peer.handshake_timer);
        auto device_id = devices_.remove_link(peer.link.get());
        if (device_id) {
            router_->reject_device(*device_id);
        }
    }
    router_->cancel_all();
}

void BridgeServer::register_event_handler(BridgeEventCallback cb) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(cb);
}

void BridgeServer::on_open(const hv::WebSocketChannelPtr& channel) {
    PeerState peer;
    peer.link = std::make_shared<ChannelLink>(channel);
    spdlog::debug("[Bridge Server] Link opened from {}", peer.link->peer());

    const hv::Channel* key = channel.get();
    peer.handshake_timer = timers_->schedule(options_.handshake_timeout_ms,
                                             [this, key]() { on_handshake_timeout(key); });

    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_[key] = std::move(peer);
}

void BridgeServer::on_message(const hv::WebSocketChannelPtr& channel, const std::string& text) {
    std::shared_ptr<ChannelLink> link;
    bool handshaken = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(channel.get());
        if (it == peers_.end()) {
            spdlog::warn("[Bridge Server] Message on unknown link, dropping");
            return;
        }
        link = it->second.link;
        handshaken = it->second.handshaken;
    }

    auto device_id = devices_.device_for(link.get()).value_or("");

    if (text.size() > protocol::MAX_FRAME_SIZE) {
        spdlog::warn("[Bridge Server] Frame of {} bytes from {} exceeds the {} byte limit, "
                     "dropping",
                     text.size(), link->peer(), protocol::MAX_FRAME_SIZE);
        emit_event(BridgeEventType::MESSAGE_OVERSIZED,
                   fmt::format("Frame of {} bytes dropped", text.size()), device_id, false);
        return;
    }

    ParsedFrame frame;
    std::string error;
    if (!protocol::decode(text, frame, error)) {
        spdlog::warn("[Bridge Server] Malformed frame from {}: {}", link->peer(), error);
        emit_event(BridgeEventType::MALFORMED_FRAME, BridgeError::malformed_frame(error).message,
                   device_id, false);
        return;
    }

    if (frame.type == FrameType::HANDSHAKE) {
        on_handshake(channel, frame.handshake);
        return;
    }

    if (!handshaken || device_id.empty()) {
        spdlog::warn("[Bridge Server] {} frame from {} before handshake, dropping",
                     protocol::frame_type_name(frame.type), link->peer());
        return;
    }

    devices_.touch(link.get());

    switch (frame.type) {
    case FrameType::RESPONSE:
        router_->route_response(device_id, frame.response);
        break;
    case FrameType::EVENT:
        router_->route_event(device_id, frame.event);
        break;
    case FrameType::REQUEST:
        // Devices never command the coordinator
        spdlog::warn("[Bridge Server] Ignoring request '{}' from device {}", frame.request.method,
                     device_id);
        break;
    case FrameType::HANDSHAKE:
        break;
    }
}

void BridgeServer::on_handshake(const hv::WebSocketChannelPtr& channel,
                                const HandshakeFrame& handshake) {
    if (handshake.device_id.empty()) {
        spdlog::warn("[Bridge Server] Handshake without deviceId, dropping");
        emit_event(BridgeEventType::MALFORMED_FRAME, "Handshake without deviceId", "", false);
        return;
    }

    std::shared_ptr<ChannelLink> link;
    TimerHandle timer = INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(channel.get());
        if (it == peers_.end()) {
            return;
        }
        link = it->second.link;
        timer = it->second.handshake_timer;
        it->second.handshake_timer = INVALID_TIMER;
        it->second.handshaken = true;
    }
    timers_->cancel(timer);

    std::string previous_id;
    bool replaced = devices_.register_device(handshake, link, &previous_id);
    if (!previous_id.empty()) {
        // Same socket, new identity: the old id is gone with its pending requests
        size_t rejected = router_->reject_device(previous_id);
        emit_event(BridgeEventType::DEVICE_DISCONNECTED,
                   fmt::format("Device {} re-registered as {} ({} pending requests rejected)",
                               previous_id, handshake.device_id, rejected),
                   previous_id, false);
    }
    if (replaced) {
        // Requests in flight on the old link will never be answered
        router_->reject_device(handshake.device_id);
        emit_event(BridgeEventType::DEVICE_REPLACED,
                   "Device " + handshake.device_id + " reconnected, previous link closed",
                   handshake.device_id, false);
    }
    emit_event(BridgeEventType::DEVICE_CONNECTED,
               fmt::format("Device {} connected ({} {} on {})", handshake.device_id,
                           handshake.app_name, handshake.app_version, handshake.platform),
               handshake.device_id, false);

    EventFrame ack;
    ack.event = "handshake_ack";
    ack.data = {{"deviceId", handshake.device_id},
                {"protocolVersion", BRIDGE_PROTOCOL_VERSION},
                {"serverTime", json_util::now_epoch_ms()}};
    if (!link->send(protocol::encode(ack))) {
        spdlog::debug("[Bridge Server] Could not send handshake_ack to {}", handshake.device_id);
    }
}

void BridgeServer::on_handshake_timeout(const hv::Channel* channel) {
    std::shared_ptr<ChannelLink> link;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(channel);
        if (it == peers_.end() || it->second.handshaken) {
            return;
        }
        link = it->second.link;
        it->second.handshake_timer = INVALID_TIMER;
    }

    spdlog::warn("[Bridge Server] No handshake from {} within {}ms, closing", link->peer(),
                 options_.handshake_timeout_ms);
    emit_event(BridgeEventType::HANDSHAKE_TIMEOUT,
               fmt::format("Link {} closed: no handshake within {}ms", link->peer(),
                           options_.handshake_timeout_ms),
               "", false);
    link->close();
}

void BridgeServer::on_close(const hv::WebSocketChannelPtr& channel) {
    PeerState peer;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(channel.get());
        if (it == peers_.end()) {
            return;
        }
        peer = std::move(it->second);
        peers_.erase(it);
    }
    timers_->cancel(peer.handshake_timer);

    auto device_id = devices_.remove_link(peer.link.get());
    if (!device_id) {
        spdlog::debug("[Bridge Server] Link {} closed (no registered device)", peer.link->peer());
        return;
    }

    size_t rejected = router_->reject_device(*device_id);
    emit_event(BridgeEventType::DEVICE_DISCONNECTED,
               fmt::format("Device {} disconnected ({} pending requests rejected)", *device_id,
                           rejected),
               *device_id, false);
}

void BridgeServer::emit_event(BridgeEventType type, const std::string& message,
                              const std::string& device_id, bool is_error) {
    BridgeEventCallback handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = event_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(BridgeEvent{type, message, device_id, is_error});
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Bridge Server] Event handler threw exception: {}", e.what());
    }
}

} // namespace devbridge
