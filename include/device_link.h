// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

#include "hv/WebSocketChannel.h"

namespace devbridge {

/**
 * @brief Coordinator's handle on one device connection
 *
 * Abstracts the socket so the registry and router can be tested without
 * a network.
 */
class DeviceLink {
  public:
    virtual ~DeviceLink() = default;

    /// Send one text frame; false if the link is closed or the write failed
    virtual bool send(const std::string& text) = 0;

    /// Close the underlying connection (idempotent)
    virtual void close() = 0;

    /// Peer description for logs
    [[nodiscard]] virtual std::string peer() const = 0;
};

/**
 * @brief DeviceLink over a libhv server-side WebSocket channel
 */
class ChannelLink : public DeviceLink {
  public:
    explicit ChannelLink(hv::WebSocketChannelPtr channel) : channel_(std::move(channel)) {}

    bool send(const std::string& text) override {
        if (!channel_ || !channel_->isConnected()) {
            return false;
        }
        return channel_->send(text) >= 0;
    }

    void close() override {
        if (channel_) {
            channel_->close();
        }
    }

    [[nodiscard]] std::string peer() const override {
        return channel_ ? channel_->peeraddr() : std::string("<closed>");
    }

  private:
    hv::WebSocketChannelPtr channel_;
};

} // namespace devbridge
