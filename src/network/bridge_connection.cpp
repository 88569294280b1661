// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file bridge_connection.cpp
 * @brief Client WebSocket link to the coordinator
 *
 * @pattern libhv WebSocketClient with atomic state machine
 * @threading Callbacks run on libhv event loop thread; request handlers may reply from any thread
 * @gotchas lifetime_guard_ is reset first in the destructor so late loop callbacks bail out
 */

#include "bridge_connection.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace devbridge {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
    case ConnectionState::DISCONNECTED:
        return "DISCONNECTED";
    case ConnectionState::CONNECTING:
        return "CONNECTING";
    case ConnectionState::CONNECTED:
        return "CONNECTED";
    }
    return "UNKNOWN";
}

BridgeConnection::BridgeConnection(hv::EventLoopPtr loop, TimerService* timers)
    : hv::WebSocketClient(loop),
      owned_timers_(timers ? nullptr : std::make_unique<EventLoopTimerService>(this->loop())),
      timers_(timers ? *timers : *owned_timers_),
      reconnect_(timers_, [this]() {
          spdlog::debug("[Bridge Connection] Reconnecting to {}", url_);
          if (open_socket() != 0) {
              reconnect_.schedule();
          }
      }) {}

BridgeConnection::~BridgeConnection() {
    // Invalidate weak_ptr captures before anything else so loop callbacks
    // that are already queued return early
    lifetime_guard_.reset();
    is_destroying_.store(true);

    reconnect_.disable();
    setReconnect(nullptr);

    onopen = []() {};
    onmessage = [](const std::string&) {};
    onclose = []() {};

    state_change_callback_ = nullptr;
}

void BridgeConnection::set_handshake(HandshakeFrame handshake) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handshake_ = std::move(handshake);
}

void BridgeConnection::set_request_handler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    request_handler_ = std::move(handler);
}

void BridgeConnection::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    event_handler_ = std::move(handler);
}

void BridgeConnection::set_state_change_callback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    state_change_callback_ = std::move(cb);
}

void BridgeConnection::set_connection_state(ConnectionState new_state) {
    ConnectionState old_state = connection_state_.exchange(new_state);
    if (old_state == new_state) {
        return;
    }

    spdlog::debug("[Bridge Connection] Connection state: {} -> {}",
                  connection_state_name(old_state), connection_state_name(new_state));

    // Copy callback under lock, invoke outside it
    StateCallback callback_copy;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        if (!is_destroying_.load()) {
            callback_copy = state_change_callback_;
        }
    }

    if (callback_copy) {
        try {
            callback_copy(old_state, new_state);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Bridge Connection] State change callback threw exception: {}",
                               e.what());
        }
    }
}

int BridgeConnection::connect(const std::string& url) {
    ConnectionState current = connection_state_.load();
    if (current != ConnectionState::DISCONNECTED && url == url_) {
        spdlog::debug("[Bridge Connection] Already {} to {}", connection_state_name(current), url);
        return 0;
    }
    if (current != ConnectionState::DISCONNECTED) {
        disconnect();
    }

    url_ = url;
    install_callbacks();
    reconnect_.enable();

    // Fixed-delay retries are driven by reconnect_, not libhv
    setReconnect(nullptr);

    int result = open_socket();
    if (result != 0) {
        spdlog::warn("[Bridge Connection] Could not start connection to {} ({})", url, result);
        set_connection_state(ConnectionState::DISCONNECTED);
        reconnect_.schedule();
    }
    return result;
}

int BridgeConnection::open_socket() {
    setConnectTimeout(static_cast<int>(connection_timeout_ms_));
    set_connection_state(ConnectionState::CONNECTING);
    spdlog::debug("[Bridge Connection] WebSocket connecting to {}", url_);

    return open_transport(url_);
}

int BridgeConnection::open_transport(const std::string& url) {
    http_headers headers;
    return open(url.c_str(), headers);
}

int BridgeConnection::write_frame(const std::string& text) {
    return send(text);
}

void BridgeConnection::close_transport() {
    close();
}

bool BridgeConnection::transport_connected() {
    return isConnected();
}

void BridgeConnection::disconnect() {
    ConnectionState current = connection_state_.load();
    if (current != ConnectionState::DISCONNECTED) {
        spdlog::info("[Bridge Connection] Disconnecting from {}", url_);
    }

    // Stop retries BEFORE closing so onclose does not schedule one
    reconnect_.disable();
    setReconnect(nullptr);
    set_connection_state(ConnectionState::DISCONNECTED);
    was_connected_ = false;
    close_transport();
}

void BridgeConnection::reconnect_now() {
    if (url_.empty()) {
        spdlog::warn("[Bridge Connection] reconnect_now() called before connect()");
        return;
    }
    if (connection_state_.load() == ConnectionState::CONNECTED) {
        spdlog::debug("[Bridge Connection] reconnect_now() while connected - ignored");
        return;
    }
    install_callbacks();
    reconnect_.retry_now();
}

bool BridgeConnection::send_text(const std::string& text) {
    if (connection_state_.load() != ConnectionState::CONNECTED || !transport_connected()) {
        spdlog::debug("[Bridge Connection] Dropping outbound frame - not connected");
        return false;
    }
    int result = write_frame(text);
    if (result < 0) {
        spdlog::warn("[Bridge Connection] send() failed ({})", result);
        return false;
    }
    return true;
}

bool BridgeConnection::send_response(const ResponseFrame& frame) {
    return send_text(protocol::encode(frame));
}

bool BridgeConnection::send_event(const EventFrame& frame) {
    return send_text(protocol::encode(frame));
}

void BridgeConnection::install_callbacks() {
    // Wrap every callback body in try-catch so no exception reaches libhv.
    // Capture weak_ptr to lifetime_guard_ to detect destruction from the loop thread.
    onopen = [this, weak_guard = std::weak_ptr<bool>(lifetime_guard_)]() {
        try {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }

            spdlog::info("[Bridge Connection] Connected to {}", url_);
            was_connected_ = true;
            reconnect_.on_connected();

            // Handshake goes out before observers see CONNECTED, so anything they
            // send is never the first frame on the link
            HandshakeFrame handshake;
            {
                std::lock_guard<std::mutex> lock(handlers_mutex_);
                handshake = handshake_;
            }
            if (write_frame(protocol::encode(handshake)) < 0) {
                LOG_WARN_INTERNAL("[Bridge Connection] Failed to send handshake");
            }
            set_connection_state(ConnectionState::CONNECTED);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Bridge Connection] onopen callback threw unexpected exception: {}",
                               e.what());
        } catch (...) {
            LOG_ERROR_INTERNAL("[Bridge Connection] onopen callback threw unknown exception");
        }
    };

    onmessage = [this, weak_guard = std::weak_ptr<bool>(lifetime_guard_)](const std::string& msg) {
        try {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }
            handle_message(msg);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL(
                "[Bridge Connection] onmessage callback threw unexpected exception: {}", e.what());
        } catch (...) {
            LOG_ERROR_INTERNAL("[Bridge Connection] onmessage callback threw unknown exception");
        }
    };

    onclose = [this, weak_guard = std::weak_ptr<bool>(lifetime_guard_)]() {
        try {
            auto guard = weak_guard.lock();
            if (!guard || is_destroying_.load()) {
                return;
            }

            if (was_connected_.exchange(false)) {
                spdlog::warn("[Bridge Connection] Connection to {} lost", url_);
            } else {
                spdlog::debug("[Bridge Connection] Connection to {} failed (coordinator not "
                              "available)",
                              url_);
            }
            set_connection_state(ConnectionState::DISCONNECTED);

            // No-op when disconnect() disabled retries or one is already pending
            reconnect_.schedule();
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Bridge Connection] onclose callback threw unexpected exception: {}",
                               e.what());
        } catch (...) {
            LOG_ERROR_INTERNAL("[Bridge Connection] onclose callback threw unknown exception");
        }
    };
}

void BridgeConnection::handle_message(const std::string& msg) {
    spdlog::trace("[Bridge Connection] onmessage received {} bytes", msg.size());

    ParsedFrame frame;
    std::string error;
    if (!protocol::decode(msg, frame, error)) {
        LOG_WARN_INTERNAL("[Bridge Connection] Dropping malformed frame: {}", error);
        return;
    }

    switch (frame.type) {
    case FrameType::REQUEST: {
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = request_handler_;
        }
        if (!handler) {
            // Nobody to execute it; answer so the coordinator does not wait for the timeout
            send_response(ResponseFrame::failure(
                frame.request.id, BridgeError::unknown_method(frame.request.method)));
            return;
        }
        handler(frame.request);
        return;
    }
    case FrameType::EVENT: {
        spdlog::debug("[Bridge Connection] Event from coordinator: {}", frame.event.event);
        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = event_handler_;
        }
        if (handler) {
            handler(frame.event);
        }
        return;
    }
    case FrameType::HANDSHAKE:
    case FrameType::RESPONSE:
        LOG_WARN_INTERNAL("[Bridge Connection] Unexpected {} frame from coordinator - ignored",
                          protocol::frame_type_name(frame.type));
        return;
    }
}

} // namespace devbridge
