// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace devbridge {

/**
 * @brief Event types emitted by the coordinator transport
 *
 * Keeps the router and server decoupled from whatever front end reports
 * them (MCP stdio, logs, tests).
 */
enum class BridgeEventType {
    DEVICE_CONNECTED,    ///< Device completed its handshake
    DEVICE_REPLACED,     ///< Same device id handshook again; old link closed
    DEVICE_DISCONNECTED, ///< Registered device link closed
    HANDSHAKE_TIMEOUT,   ///< Link closed for not sending a handshake in time
    MALFORMED_FRAME,     ///< Frame did not match the envelope and was dropped
    MESSAGE_OVERSIZED,   ///< Frame exceeded the size limit
    REQUEST_TIMEOUT,     ///< Routed request timed out
    LATE_RESPONSE,       ///< Response arrived for an id no longer pending
    DEVICE_EVENT         ///< Event frame pushed by a device
};

/**
 * @brief Event structure passed to event handlers
 */
struct BridgeEvent {
    BridgeEventType type;
    std::string message;   ///< Human-readable message
    std::string device_id; ///< Device concerned (may be empty)
    bool is_error;         ///< true for errors, false for warnings/info
};

/**
 * @brief Callback type for event handlers
 */
using BridgeEventCallback = std::function<void(const BridgeEvent&)>;

} // namespace devbridge
