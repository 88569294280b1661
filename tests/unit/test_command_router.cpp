// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../mocks/fake_device_link.h"
#include "../mocks/manual_timer_service.h"
#include "command_router.h"

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;

/**
 * @brief Router wired to a fake device and a hand-driven clock
 */
class CommandRouterFixture {
  public:
    CommandRouterFixture() : router(devices, timers) {
        link = connect("dev-1");
        router.register_event_handler([this](const BridgeEvent& e) { events.push_back(e); });
    }

    std::shared_ptr<FakeDeviceLink> connect(const std::string& id) {
        auto l = std::make_shared<FakeDeviceLink>(id);
        HandshakeFrame h;
        h.device_id = id;
        h.platform = "test";
        h.app_name = "app";
        h.app_version = "1";
        devices.register_device(h, l);
        return l;
    }

    RequestId send(const std::string& method, const std::string& device_id = "",
                   uint32_t timeout_ms = 0) {
        return router.send_command(
            device_id, method, json::object(), [this](json r) { results.push_back(r); },
            [this](const BridgeError& e) { errors.push_back(e); }, timeout_ms);
    }

    bool has_event(BridgeEventType type) const {
        for (const auto& e : events) {
            if (e.type == type) {
                return true;
            }
        }
        return false;
    }

    // Outcome sinks outlive the router, whose destructor rejects what is still pending
    std::vector<json> results;
    std::vector<BridgeError> errors;
    std::vector<BridgeEvent> events;
    DeviceRegistry devices;
    ManualTimerService timers;
    CommandRouter router;
    std::shared_ptr<FakeDeviceLink> link;
};

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: request is sent and resolved",
                 "[router]") {
    RequestId id = send("get_app_state");
    REQUIRE(id != INVALID_REQUEST_ID);
    REQUIRE(router.pending_count() == 1);

    RequestFrame sent = link->last_request();
    REQUIRE(sent.id == id);
    REQUIRE(sent.method == "get_app_state");

    REQUIRE(router.route_response("dev-1", ResponseFrame::success(id, {{"cart", 2}})));
    REQUIRE(results.size() == 1);
    REQUIRE(results[0]["cart"] == 2);
    REQUIRE(errors.empty());
    REQUIRE(router.pending_count() == 0);
    REQUIRE(timers.pending() == 0);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: request ids are unique and increasing",
                 "[router]") {
    RequestId a = send("a");
    RequestId b = send("b");
    RequestId c = send("c");
    REQUIRE(a > 0);
    REQUIRE(b > a);
    REQUIRE(c > b);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: error response is delivered as error",
                 "[router]") {
    RequestId id = send("execute_action");
    router.route_response("dev-1",
                          ResponseFrame::failure(id, BridgeError::unknown_method("execute_action")));
    REQUIRE(results.empty());
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].type == BridgeErrorType::UNKNOWN_METHOD);
    REQUIRE(errors[0].method == "execute_action");
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: timeout settles once and late response "
                                       "is discarded",
                 "[router][timeout]") {
    RequestId id = send("slow", "", 2000);

    timers.advance(1999);
    REQUIRE(errors.empty());
    timers.advance(1);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].type == BridgeErrorType::TIMEOUT);
    REQUIRE(errors[0].message == "Request timeout (2s)");
    REQUIRE(has_event(BridgeEventType::REQUEST_TIMEOUT));
    REQUIRE(router.pending_count() == 0);

    REQUIRE_FALSE(router.route_response("dev-1", ResponseFrame::success(id, 1)));
    REQUIRE(results.empty());
    REQUIRE(errors.size() == 1);
    REQUIRE(has_event(BridgeEventType::LATE_RESPONSE));
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: default timeout applies", "[router][timeout]") {
    router.set_default_timeout(500);
    send("x");
    timers.advance(500);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "Request timeout (500ms)");
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: no device sends nothing", "[router]") {
    devices.remove_link(link.get());

    RequestId id = send("get_app_state");
    REQUIRE(id == INVALID_REQUEST_ID);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].type == BridgeErrorType::NO_DEVICE);
    REQUIRE(link->sent_count() == 0);
    REQUIRE(router.pending_count() == 0);
    REQUIRE(timers.scheduled_count() == 0);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: unknown explicit device", "[router]") {
    REQUIRE(send("x", "ghost") == INVALID_REQUEST_ID);
    REQUIRE(errors[0].type == BridgeErrorType::NO_DEVICE);
    REQUIRE(errors[0].message.find("ghost") != std::string::npos);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: send failure settles immediately",
                 "[router]") {
    link->set_fail_sends(true);
    REQUIRE(send("x") == INVALID_REQUEST_ID);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].type == BridgeErrorType::SEND_FAILED);
    REQUIRE(router.pending_count() == 0);
    REQUIRE(timers.pending() == 0);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: losing a device rejects only its requests",
                 "[router]") {
    connect("dev-2");
    send("a", "dev-1");
    send("b", "dev-1");
    send("c", "dev-2");

    REQUIRE(router.reject_device("dev-1") == 2);
    REQUIRE(errors.size() == 2);
    for (const auto& e : errors) {
        REQUIRE(e.type == BridgeErrorType::CONNECTION_LOST);
    }
    REQUIRE(router.pending_count() == 1);
    REQUIRE(timers.pending() == 1);

    // Rejected timers never fire
    timers.advance(CommandRouter::DEFAULT_TIMEOUT_MS);
    REQUIRE(errors.size() == 3);
    REQUIRE(errors[2].type == BridgeErrorType::TIMEOUT);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: response from the wrong device is ignored",
                 "[router]") {
    connect("dev-2");
    RequestId id = send("x", "dev-1");
    REQUIRE_FALSE(router.route_response("dev-2", ResponseFrame::success(id, 1)));
    REQUIRE(router.pending_count() == 1);
    REQUIRE(router.route_response("dev-1", ResponseFrame::success(id, 1)));
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: throwing callback does not break routing",
                 "[router]") {
    RequestId id = router.send_command(
        "", "x", json::object(), [](json) { throw std::runtime_error("consumer bug"); },
        [](const BridgeError&) {});
    REQUIRE_NOTHROW(router.route_response("dev-1", ResponseFrame::success(id, 1)));
    REQUIRE(router.pending_count() == 0);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: cancel_all rejects everything",
                 "[router]") {
    send("a");
    send("b");
    router.cancel_all();
    REQUIRE(errors.size() == 2);
    REQUIRE(router.pending_count() == 0);
    REQUIRE(timers.pending() == 0);
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: events reach the device event handler",
                 "[router]") {
    std::optional<std::string> received;
    router.on_event([&](const std::string& device_id, const EventFrame& e) {
        received = device_id + ":" + e.event;
    });

    EventFrame event;
    event.event = "cart_updated";
    router.route_event("dev-1", event);
    REQUIRE(received == std::string("dev-1:cart_updated"));
    REQUIRE(has_event(BridgeEventType::DEVICE_EVENT));
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: sync send resolves through a future",
                 "[router]") {
    auto future = router.send_command_sync("", "list_actions", json::object());
    RequestId id = link->last_request().id;
    router.route_response("dev-1", ResponseFrame::success(id, json::array({"a"})));

    CommandResult result = future.get();
    REQUIRE(result.ok());
    REQUIRE(result.result == json::array({"a"}));
}

TEST_CASE_METHOD(CommandRouterFixture, "CommandRouter: sync send without device fails at once",
                 "[router]") {
    devices.remove_link(link.get());
    auto future = router.send_command_sync("", "x", json::object());
    REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    REQUIRE(future.get().error.type == BridgeErrorType::NO_DEVICE);
}
