// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_protocol.h"

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;

namespace {

bool decode_ok(const std::string& text, ParsedFrame& frame) {
    std::string error;
    bool ok = protocol::decode(text, frame, error);
    INFO("decode error: " << error);
    return ok;
}

bool rejects(const std::string& text) {
    ParsedFrame frame;
    std::string error;
    bool ok = protocol::decode(text, frame, error);
    return !ok && !error.empty();
}

} // namespace

// ============================================================================
// Valid frames
// ============================================================================

TEST_CASE("Protocol: decodes handshake", "[protocol]") {
    ParsedFrame frame;
    REQUIRE(decode_ok(R"({"type":"handshake","platform":"linux","appName":"shop",)"
                      R"("appVersion":"1.2.0","deviceId":"dev-1","capabilities":["state","ui"]})",
                      frame));
    REQUIRE(frame.type == FrameType::HANDSHAKE);
    REQUIRE(frame.handshake.device_id == "dev-1");
    REQUIRE(frame.handshake.app_name == "shop");
    REQUIRE(frame.handshake.capabilities == std::vector<std::string>{"state", "ui"});
}

TEST_CASE("Protocol: decodes request with and without params", "[protocol]") {
    ParsedFrame frame;
    REQUIRE(decode_ok(R"({"type":"request","id":7,"method":"get_app_state","params":{"key":"cart"}})",
                      frame));
    REQUIRE(frame.type == FrameType::REQUEST);
    REQUIRE(frame.request.id == 7);
    REQUIRE(frame.request.method == "get_app_state");
    REQUIRE(frame.request.params["key"] == "cart");

    ParsedFrame bare;
    REQUIRE(decode_ok(R"({"type":"request","id":8,"method":"list_actions"})", bare));
    REQUIRE(bare.request.params.is_object());
    REQUIRE(bare.request.params.empty());
}

TEST_CASE("Protocol: decodes success and error responses", "[protocol]") {
    ParsedFrame ok;
    REQUIRE(decode_ok(R"({"type":"response","id":3,"result":{"count":2}})", ok));
    REQUIRE(ok.type == FrameType::RESPONSE);
    REQUIRE_FALSE(ok.response.is_error());
    REQUIRE(ok.response.result["count"] == 2);

    ParsedFrame failed;
    REQUIRE(decode_ok(
        R"({"type":"response","id":4,"error":{"type":"UNKNOWN_METHOD","message":"Unknown method: x"}})",
        failed));
    REQUIRE(failed.response.is_error());
    REQUIRE(failed.response.error.type == BridgeErrorType::UNKNOWN_METHOD);
    REQUIRE(failed.response.error.message == "Unknown method: x");
}

TEST_CASE("Protocol: null result is still a result", "[protocol]") {
    ParsedFrame frame;
    REQUIRE(decode_ok(R"({"type":"response","id":5,"result":null})", frame));
    REQUIRE_FALSE(frame.response.is_error());
    REQUIRE(frame.response.result.is_null());
}

TEST_CASE("Protocol: unrecognized error type decodes as UNKNOWN", "[protocol]") {
    ParsedFrame frame;
    REQUIRE(decode_ok(R"({"type":"response","id":5,"error":{"message":"boom"}})", frame));
    REQUIRE(frame.response.error.type == BridgeErrorType::UNKNOWN);
    REQUIRE(frame.response.error.message == "boom");
}

TEST_CASE("Protocol: decodes event with optional data", "[protocol]") {
    ParsedFrame frame;
    REQUIRE(decode_ok(R"({"type":"event","event":"cart_updated","data":{"items":3}})", frame));
    REQUIRE(frame.type == FrameType::EVENT);
    REQUIRE(frame.event.event == "cart_updated");
    REQUIRE(frame.event.data["items"] == 3);

    ParsedFrame bare;
    REQUIRE(decode_ok(R"({"type":"event","event":"ping"})", bare));
    REQUIRE(bare.event.data.is_null());
}

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("Protocol: encodes frames in the canonical envelope", "[protocol]") {
    SECTION("request omits empty params") {
        RequestFrame request;
        request.id = 12;
        request.method = "list_actions";
        json j = protocol::to_json(request);
        REQUIRE(j["type"] == "request");
        REQUIRE(j["id"] == 12);
        REQUIRE_FALSE(j.contains("params"));
    }

    SECTION("error response carries type and message only") {
        auto frame = ResponseFrame::failure(9, BridgeError::unknown_method("nope"));
        json j = protocol::to_json(frame);
        REQUIRE(j["type"] == "response");
        REQUIRE_FALSE(j.contains("result"));
        REQUIRE(j["error"]["type"] == "UNKNOWN_METHOD");
        REQUIRE(j["error"]["message"] == "Unknown method: nope");
    }

    SECTION("success response with null result keeps the result member") {
        json j = protocol::to_json(ResponseFrame::success(10, nullptr));
        REQUIRE(j.contains("result"));
        REQUIRE_FALSE(j.contains("error"));
    }

    SECTION("handshake advertises the protocol version") {
        HandshakeFrame handshake;
        handshake.device_id = "dev";
        json j = protocol::to_json(handshake);
        REQUIRE(j["type"] == "handshake");
        REQUIRE(j["protocolVersion"] == BRIDGE_PROTOCOL_VERSION);
    }
}

TEST_CASE("Protocol: encoded frames decode to the same content", "[protocol]") {
    RequestFrame request;
    request.id = 99;
    request.method = "execute_action";
    request.params = {{"action", "clear_cart"}};

    ParsedFrame frame;
    REQUIRE(decode_ok(protocol::encode(request), frame));
    REQUIRE(frame.request.id == 99);
    REQUIRE(frame.request.params["action"] == "clear_cart");
}

// ============================================================================
// Malformed frames
// ============================================================================

TEST_CASE("Protocol: rejects malformed frames", "[protocol][malformed]") {
    SECTION("not JSON") {
        REQUIRE(rejects("{not json"));
    }
    SECTION("not an object") {
        REQUIRE(rejects("[1,2,3]"));
    }
    SECTION("missing type") {
        REQUIRE(rejects(R"({"id":1,"method":"x"})"));
    }
    SECTION("unknown type") {
        REQUIRE(rejects(R"({"type":"command","id":1,"method":"x"})"));
    }
    SECTION("request id not a positive integer") {
        REQUIRE(rejects(R"({"type":"request","id":"1","method":"x"})"));
        REQUIRE(rejects(R"({"type":"request","id":0,"method":"x"})"));
        REQUIRE(rejects(R"({"type":"request","id":-4,"method":"x"})"));
        REQUIRE(rejects(R"({"type":"request","id":1.5,"method":"x"})"));
    }
    SECTION("request params not an object") {
        REQUIRE(rejects(R"({"type":"request","id":1,"method":"x","params":[1]})"));
    }
    SECTION("response with both result and error") {
        REQUIRE(rejects(R"({"type":"response","id":1,"result":1,"error":{"message":"m"}})"));
    }
    SECTION("response with neither result nor error") {
        REQUIRE(rejects(R"({"type":"response","id":1})"));
    }
    SECTION("error without message") {
        REQUIRE(rejects(R"({"type":"response","id":1,"error":{"type":"TIMEOUT"}})"));
    }
    SECTION("handshake without deviceId") {
        REQUIRE(rejects(R"({"type":"handshake","platform":"p","appName":"a","appVersion":"1"})"));
    }
    SECTION("handshake with non-string capability") {
        REQUIRE(rejects(R"({"type":"handshake","platform":"p","appName":"a","appVersion":"1",)"
                        R"("deviceId":"d","capabilities":[1]})"));
    }
    SECTION("event without name") {
        REQUIRE(rejects(R"({"type":"event","data":{}})"));
    }
}

TEST_CASE("Protocol: rejects oversized frames before parsing", "[protocol][malformed]") {
    std::string huge(protocol::MAX_FRAME_SIZE + 1, ' ');
    ParsedFrame frame;
    std::string error;
    REQUIRE_FALSE(protocol::decode(huge, frame, error));
    REQUIRE(error.find("too large") != std::string::npos);
}

TEST_CASE("Protocol: failed decode leaves output untouched", "[protocol][malformed]") {
    ParsedFrame frame;
    frame.request.method = "sentinel";
    std::string error;
    REQUIRE_FALSE(protocol::decode(R"({"type":"request","id":0,"method":"x"})", frame, error));
    REQUIRE(frame.request.method == "sentinel");
}
