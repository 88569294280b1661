// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_protocol.h"

#include <spdlog/fmt/fmt.h>

namespace devbridge {
namespace protocol {

namespace {

bool require_string(const json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key) || !j[key].is_string()) {
        error = fmt::format("'{}' must be a string", key);
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool require_id(const json& j, RequestId& out, std::string& error) {
    if (!j.contains("id") || !j["id"].is_number_integer()) {
        error = "'id' must be a positive integer";
        return false;
    }
    const auto& id = j["id"];
    if (!id.is_number_unsigned() && id.get<int64_t>() <= 0) {
        error = "'id' must be a positive integer";
        return false;
    }
    out = id.get<RequestId>();
    if (out == INVALID_REQUEST_ID) {
        error = "'id' must be a positive integer";
        return false;
    }
    return true;
}

bool decode_handshake(const json& j, HandshakeFrame& out, std::string& error) {
    HandshakeFrame frame;
    if (!require_string(j, "platform", frame.platform, error) ||
        !require_string(j, "appName", frame.app_name, error) ||
        !require_string(j, "appVersion", frame.app_version, error) ||
        !require_string(j, "deviceId", frame.device_id, error)) {
        return false;
    }
    if (frame.device_id.empty()) {
        error = "'deviceId' must not be empty";
        return false;
    }
    if (j.contains("capabilities")) {
        const auto& caps = j["capabilities"];
        if (!caps.is_array()) {
            error = "'capabilities' must be an array";
            return false;
        }
        for (const auto& c : caps) {
            if (!c.is_string()) {
                error = "'capabilities' must contain strings";
                return false;
            }
            frame.capabilities.push_back(c.get<std::string>());
        }
    }
    out = std::move(frame);
    return true;
}

bool decode_request(const json& j, RequestFrame& out, std::string& error) {
    RequestFrame frame;
    if (!require_id(j, frame.id, error) || !require_string(j, "method", frame.method, error)) {
        return false;
    }
    if (j.contains("params") && !j["params"].is_null()) {
        if (!j["params"].is_object()) {
            error = "'params' must be an object";
            return false;
        }
        frame.params = j["params"];
    }
    out = std::move(frame);
    return true;
}

bool decode_response(const json& j, ResponseFrame& out, std::string& error) {
    ResponseFrame frame;
    if (!require_id(j, frame.id, error)) {
        return false;
    }
    bool has_result = j.contains("result");
    bool has_error = j.contains("error");
    if (has_result == has_error) {
        error = "response must carry exactly one of 'result' or 'error'";
        return false;
    }
    if (has_error) {
        const auto& e = j["error"];
        if (!e.is_object() || !e.contains("message") || !e["message"].is_string()) {
            error = "'error' must be an object with a string 'message'";
            return false;
        }
        frame.error = BridgeError::from_wire(e, "");
    } else {
        frame.result = j["result"];
    }
    out = std::move(frame);
    return true;
}

bool decode_event(const json& j, EventFrame& out, std::string& error) {
    EventFrame frame;
    if (!require_string(j, "event", frame.event, error)) {
        return false;
    }
    if (j.contains("data")) {
        frame.data = j["data"];
    }
    out = std::move(frame);
    return true;
}

} // namespace

const char* frame_type_name(FrameType type) {
    switch (type) {
    case FrameType::HANDSHAKE:
        return "handshake";
    case FrameType::REQUEST:
        return "request";
    case FrameType::RESPONSE:
        return "response";
    case FrameType::EVENT:
        return "event";
    }
    return "unknown";
}

json to_json(const HandshakeFrame& frame) {
    return {{"type", "handshake"},
            {"platform", frame.platform},
            {"appName", frame.app_name},
            {"appVersion", frame.app_version},
            {"deviceId", frame.device_id},
            {"capabilities", frame.capabilities},
            {"protocolVersion", BRIDGE_PROTOCOL_VERSION}};
}

json to_json(const RequestFrame& frame) {
    json j = {{"type", "request"}, {"id", frame.id}, {"method", frame.method}};
    if (!frame.params.is_null() && !frame.params.empty()) {
        j["params"] = frame.params;
    }
    return j;
}

json to_json(const ResponseFrame& frame) {
    json j = {{"type", "response"}, {"id", frame.id}};
    if (frame.is_error()) {
        j["error"] = frame.error.to_wire();
    } else {
        j["result"] = frame.result;
    }
    return j;
}

json to_json(const EventFrame& frame) {
    json j = {{"type", "event"}, {"event", frame.event}};
    if (!frame.data.is_null()) {
        j["data"] = frame.data;
    }
    return j;
}

bool decode(const std::string& text, ParsedFrame& out, std::string& error) {
    if (text.size() > MAX_FRAME_SIZE) {
        error = fmt::format("frame too large: {} bytes (max: {})", text.size(), MAX_FRAME_SIZE);
        return false;
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        error = fmt::format("JSON parse error: {}", e.what());
        return false;
    }
    return decode(j, out, error);
}

bool decode(const json& j, ParsedFrame& out, std::string& error) {
    if (!j.is_object()) {
        error = "frame must be a JSON object";
        return false;
    }

    std::string type;
    if (!require_string(j, "type", type, error)) {
        return false;
    }

    if (type == "handshake") {
        if (!decode_handshake(j, out.handshake, error)) {
            return false;
        }
        out.type = FrameType::HANDSHAKE;
    } else if (type == "request") {
        if (!decode_request(j, out.request, error)) {
            return false;
        }
        out.type = FrameType::REQUEST;
    } else if (type == "response") {
        if (!decode_response(j, out.response, error)) {
            return false;
        }
        out.type = FrameType::RESPONSE;
    } else if (type == "event") {
        if (!decode_event(j, out.event, error)) {
            return false;
        }
        out.type = FrameType::EVENT;
    } else {
        error = fmt::format("unknown frame type '{}'", type);
        return false;
    }
    return true;
}

} // namespace protocol
} // namespace devbridge
