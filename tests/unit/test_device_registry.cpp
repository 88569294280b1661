// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../mocks/fake_device_link.h"
#include "device_registry.h"

#include <memory>
#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;

namespace {

HandshakeFrame handshake(const std::string& device_id, const std::string& app = "shop") {
    HandshakeFrame h;
    h.device_id = device_id;
    h.platform = "linux";
    h.app_name = app;
    h.app_version = "1.0.0";
    h.capabilities = {"state", "ui"};
    return h;
}

} // namespace

TEST_CASE("DeviceRegistry: register and look up", "[devices]") {
    DeviceRegistry registry;
    auto link = std::make_shared<FakeDeviceLink>();
    REQUIRE_FALSE(registry.register_device(handshake("dev-1"), link));

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.link_for("dev-1") == link);
    REQUIRE(registry.link_for("dev-2") == nullptr);
    REQUIRE(registry.device_for(link.get()) == std::string("dev-1"));

    auto info = registry.get("dev-1");
    REQUIRE(info.has_value());
    REQUIRE(info->app_name == "shop");
    REQUIRE(info->connected_at_ms > 0);

    json j = info->to_json();
    REQUIRE(j["deviceId"] == "dev-1");
    REQUIRE(j["capabilities"] == json::array({"state", "ui"}));
}

TEST_CASE("DeviceRegistry: same id supersedes and closes the old link", "[devices]") {
    DeviceRegistry registry;
    auto old_link = std::make_shared<FakeDeviceLink>("old");
    auto new_link = std::make_shared<FakeDeviceLink>("new");

    // The server removes a link when its socket closes
    std::optional<std::string> removed_on_close;
    old_link->set_on_close([&] { removed_on_close = registry.remove_link(old_link.get()); });

    registry.register_device(handshake("dev-1"), old_link);
    REQUIRE(registry.register_device(handshake("dev-1", "shop-v2"), new_link));

    REQUIRE(old_link->is_closed());
    REQUIRE_FALSE(removed_on_close.has_value());
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.link_for("dev-1") == new_link);
    REQUIRE(registry.get("dev-1")->app_name == "shop-v2");
}

TEST_CASE("DeviceRegistry: re-registering the same link is not a supersede", "[devices]") {
    DeviceRegistry registry;
    auto link = std::make_shared<FakeDeviceLink>();
    registry.register_device(handshake("dev-1"), link);
    REQUIRE_FALSE(registry.register_device(handshake("dev-1"), link));
    REQUIRE_FALSE(link->is_closed());
}

TEST_CASE("DeviceRegistry: remove by link", "[devices]") {
    DeviceRegistry registry;
    auto a = std::make_shared<FakeDeviceLink>();
    auto b = std::make_shared<FakeDeviceLink>();
    registry.register_device(handshake("a"), a);
    registry.register_device(handshake("b"), b);

    REQUIRE(registry.remove_link(a.get()) == std::string("a"));
    REQUIRE_FALSE(registry.remove_link(a.get()).has_value());
    REQUIRE(registry.size() == 1);

    FakeDeviceLink stranger;
    REQUIRE_FALSE(registry.remove_link(&stranger).has_value());
}

TEST_CASE("DeviceRegistry: primary device", "[devices]") {
    DeviceRegistry registry;
    REQUIRE_FALSE(registry.primary_device().has_value());

    auto link = std::make_shared<FakeDeviceLink>();
    registry.register_device(handshake("only"), link);
    REQUIRE(registry.primary_device() == std::string("only"));

    registry.remove_link(link.get());
    REQUIRE_FALSE(registry.primary_device().has_value());
}

TEST_CASE("DeviceRegistry: list returns every device", "[devices]") {
    DeviceRegistry registry;
    registry.register_device(handshake("a"), std::make_shared<FakeDeviceLink>());
    registry.register_device(handshake("b"), std::make_shared<FakeDeviceLink>());
    auto devices = registry.list();
    REQUIRE(devices.size() == 2);
    REQUIRE(devices[0].id == "a");
    REQUIRE(devices[1].id == "b");
}

TEST_CASE("DeviceRegistry: new id on the same link drops the old id", "[devices]") {
    DeviceRegistry registry;
    auto link = std::make_shared<FakeDeviceLink>();

    std::string previous;
    registry.register_device(handshake("dev-a"), link, &previous);
    REQUIRE(previous.empty());

    REQUIRE_FALSE(registry.register_device(handshake("dev-b"), link, &previous));
    REQUIRE(previous == "dev-a");
    REQUIRE_FALSE(link->is_closed());
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.link_for("dev-a") == nullptr);
    REQUIRE(registry.device_for(link.get()) == std::string("dev-b"));

    // Socket close leaves nothing behind
    REQUIRE(registry.remove_link(link.get()) == std::string("dev-b"));
    REQUIRE(registry.size() == 0);
    REQUIRE_FALSE(registry.primary_device().has_value());
}

TEST_CASE("DeviceRegistry: taking over another link's id while renaming", "[devices]") {
    DeviceRegistry registry;
    auto first = std::make_shared<FakeDeviceLink>("first");
    auto second = std::make_shared<FakeDeviceLink>("second");
    registry.register_device(handshake("dev-a"), first);
    registry.register_device(handshake("dev-b"), second);

    // second now claims dev-a: it leaves dev-b and supersedes first
    std::string previous;
    REQUIRE(registry.register_device(handshake("dev-a"), second, &previous));
    REQUIRE(previous == "dev-b");
    REQUIRE(first->is_closed());
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.link_for("dev-a") == second);

    REQUIRE(registry.remove_link(second.get()) == std::string("dev-a"));
    REQUIRE(registry.size() == 0);
}
