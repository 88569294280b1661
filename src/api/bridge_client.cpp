// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_client.h"

#include "bridge_command.h"
#include "device_info.h"
#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace devbridge {

namespace {

AppIdentity complete_identity(AppIdentity identity) {
    if (identity.platform.empty()) {
        identity.platform = detect_platform();
    }
    if (identity.device_id.empty()) {
        identity.device_id = host_name() + "-" + identity.app_name;
    }
    return identity;
}

} // namespace

BridgeClient::BridgeClient(BridgeClientOptions options) : options_(std::move(options)) {
    options_.identity = complete_identity(options_.identity);

    auto inner = options_.http_transport ? options_.http_transport
                                         : std::make_shared<LibhvHttpTransport>();
    http_ = std::make_shared<InterceptingTransport>(std::move(inner));

    dispatcher_ = std::make_unique<CommandDispatcher>(
        DispatchTargets{state_, actions_, components_, navigation_, flags_, *http_, traces_,
                        options_.log_sink},
        options_.identity);

    connection_ = std::make_shared<BridgeConnection>();
    connection_->set_reconnect_delay(options_.reconnect_delay_ms);
    connection_->set_connection_timeout(options_.connect_timeout_ms);
    connection_->set_handshake(handshake());
    connection_->set_request_handler([this](const RequestFrame& request) { on_request(request); });
    connection_->set_event_handler([](const EventFrame& event) {
        if (event.event == "handshake_ack") {
            spdlog::info("[Bridge Client] Coordinator acknowledged handshake");
        }
    });
}

BridgeClient::~BridgeClient() {
    stop();
    // Connection first: its loop thread may still be dispatching into the registries
    connection_.reset();
}

int BridgeClient::start() {
    spdlog::info("[Bridge Client] Starting bridge for {} {} ({}) -> {}",
                 options_.identity.app_name, options_.identity.app_version,
                 options_.identity.device_id, options_.url);
    return connection_->connect(options_.url);
}

void BridgeClient::stop() {
    if (connection_) {
        connection_->disconnect();
    }
}

void BridgeClient::reconnect_now() {
    connection_->reconnect_now();
}

bool BridgeClient::emit_event(const std::string& event, json data) {
    return connection_->send_event(EventFrame{event, std::move(data)});
}

void BridgeClient::set_ui_provider(std::shared_ptr<UiProvider> provider) {
    dispatcher_->set_ui_provider(std::move(provider));
}

void BridgeClient::set_storage_provider(std::shared_ptr<StorageProvider> provider) {
    dispatcher_->set_storage_provider(std::move(provider));
}

void BridgeClient::set_state_change_callback(BridgeConnection::StateCallback cb) {
    connection_->set_state_change_callback(std::move(cb));
}

HandshakeFrame BridgeClient::handshake() const {
    HandshakeFrame hs;
    hs.platform = options_.identity.platform;
    hs.app_name = options_.identity.app_name;
    hs.app_version = options_.identity.app_version;
    hs.device_id = options_.identity.device_id;
    hs.capabilities = BridgeCommandRegistry::capabilities();
    return hs;
}

void BridgeClient::on_request(const RequestFrame& request) {
    // Async actions and replays may answer after the client is gone
    std::weak_ptr<BridgeConnection> weak_connection = connection_;
    Responder responder(request.id, request.method, [weak_connection](const ResponseFrame& frame) {
        auto connection = weak_connection.lock();
        if (!connection || !connection->send_response(frame)) {
            LOG_WARN_INTERNAL("[Bridge Client] Response to request {} could not be sent",
                              frame.id);
        }
    });
    dispatcher_->dispatch(request, responder);
}

} // namespace devbridge
