// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "json_utils.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace devbridge {

/// @brief Correlation id for request/response frames (valid IDs > 0)
using RequestId = uint64_t;

/// @brief Invalid request ID constant
constexpr RequestId INVALID_REQUEST_ID = 0;

/// @brief Protocol version advertised in handshakes
constexpr const char* BRIDGE_PROTOCOL_VERSION = "1";

/// @brief Default coordinator port
constexpr int DEFAULT_BRIDGE_PORT = 8765;

/**
 * @brief Discriminator of the wire envelope (`type` member)
 */
enum class FrameType { HANDSHAKE, REQUEST, RESPONSE, EVENT };

/**
 * @brief First frame a client sends after the socket opens
 */
struct HandshakeFrame {
    std::string platform;
    std::string app_name;
    std::string app_version;
    std::string device_id;
    std::vector<std::string> capabilities;
};

/**
 * @brief Command sent by the coordinator to a device
 */
struct RequestFrame {
    RequestId id = INVALID_REQUEST_ID;
    std::string method;
    json params = json::object();
};

/**
 * @brief Reply to a RequestFrame; carries exactly one of result or error
 */
struct ResponseFrame {
    RequestId id = INVALID_REQUEST_ID;
    json result;
    BridgeError error;

    [[nodiscard]] bool is_error() const {
        return error.has_error();
    }

    static ResponseFrame success(RequestId id, json result) {
        ResponseFrame r;
        r.id = id;
        r.result = std::move(result);
        return r;
    }

    static ResponseFrame failure(RequestId id, BridgeError error) {
        ResponseFrame r;
        r.id = id;
        r.error = std::move(error);
        return r;
    }
};

/**
 * @brief Unsolicited notification (device pushes, handshake ack)
 */
struct EventFrame {
    std::string event;
    json data;
};

/**
 * @brief Result of decoding one text frame
 *
 * Only the member matching `type` is meaningful.
 */
struct ParsedFrame {
    FrameType type = FrameType::EVENT;
    HandshakeFrame handshake;
    RequestFrame request;
    ResponseFrame response;
    EventFrame event;
};

namespace protocol {

/// Frames larger than this are rejected without parsing
constexpr size_t MAX_FRAME_SIZE = 5 * 1024 * 1024; // 5 MB

[[nodiscard]] const char* frame_type_name(FrameType type);

[[nodiscard]] json to_json(const HandshakeFrame& frame);
[[nodiscard]] json to_json(const RequestFrame& frame);
[[nodiscard]] json to_json(const ResponseFrame& frame);
[[nodiscard]] json to_json(const EventFrame& frame);

/// Serialize a frame as compact JSON text
template <typename FrameT> [[nodiscard]] std::string encode(const FrameT& frame) {
    return to_json(frame).dump();
}

/**
 * @brief Decode and validate one text frame against the envelope
 *
 * Rejects oversized text, invalid JSON, a missing or unknown `type`,
 * wrongly typed members and responses with both or neither of
 * `result`/`error`.
 *
 * @param text Raw frame text
 * @param out Decoded frame (unchanged on failure)
 * @param error Reason for rejection
 * @return true if the frame is well formed
 */
[[nodiscard]] bool decode(const std::string& text, ParsedFrame& out, std::string& error);

/// Same as decode() but starting from already-parsed JSON
[[nodiscard]] bool decode(const json& j, ParsedFrame& out, std::string& error);

} // namespace protocol
} // namespace devbridge
