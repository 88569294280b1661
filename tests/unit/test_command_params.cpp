// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_error.h"
#include "command_params.h"

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;
using namespace devbridge::params;

namespace {

template <typename T> BridgeErrorType parse_error(const json& p) {
    try {
        (void)T::parse(p);
    } catch (const CommandError& e) {
        return e.type();
    }
    return BridgeErrorType::NONE;
}

} // namespace

TEST_CASE("Params: execute_action requires a name", "[params]") {
    auto parsed = ExecuteAction::parse({{"action", "add_to_cart"}, {"params", {{"sku", "A1"}}}});
    REQUIRE(parsed.action == "add_to_cart");
    REQUIRE(parsed.params["sku"] == "A1");

    REQUIRE(ExecuteAction::parse({{"action", "x"}}).params == json::object());
    REQUIRE(parse_error<ExecuteAction>(json::object()) == BridgeErrorType::INVALID_PARAMS);
    REQUIRE(parse_error<ExecuteAction>({{"action", ""}}) == BridgeErrorType::INVALID_PARAMS);
    REQUIRE(parse_error<ExecuteAction>({{"action", 5}}) == BridgeErrorType::INVALID_PARAMS);
    REQUIRE(parse_error<ExecuteAction>({{"action", "x"}, {"params", "nope"}}) ==
            BridgeErrorType::INVALID_PARAMS);
}

TEST_CASE("Params: get_app_state treats empty key as absent", "[params]") {
    REQUIRE_FALSE(GetAppState::parse(json::object()).key.has_value());
    REQUIRE_FALSE(GetAppState::parse({{"key", ""}}).key.has_value());
    REQUIRE(GetAppState::parse({{"key", "cart"}}).key == std::string("cart"));
}

TEST_CASE("Params: toggle_feature_flag name and value aliases", "[params]") {
    REQUIRE(ToggleFeatureFlag::parse({{"flag", "a"}}).flag == "a");
    REQUIRE(ToggleFeatureFlag::parse({{"flagName", "b"}}).flag == "b");
    REQUIRE(ToggleFeatureFlag::parse({{"key", "c"}}).flag == "c");

    REQUIRE_FALSE(ToggleFeatureFlag::parse({{"flag", "a"}}).enabled.has_value());
    REQUIRE(ToggleFeatureFlag::parse({{"flag", "a"}, {"enabled", true}}).enabled == true);
    REQUIRE(ToggleFeatureFlag::parse({{"flag", "a"}, {"value", false}}).enabled == false);

    REQUIRE(parse_error<ToggleFeatureFlag>(json::object()) == BridgeErrorType::INVALID_PARAMS);
    REQUIRE(parse_error<ToggleFeatureFlag>({{"flag", "a"}, {"enabled", "yes"}}) ==
            BridgeErrorType::INVALID_PARAMS);
}

TEST_CASE("Params: inspect_element needs numeric coordinates", "[params]") {
    auto parsed = InspectElement::parse({{"x", 10}, {"y", 20.5}});
    REQUIRE(parsed.x == 10);
    REQUIRE(parsed.y == 20.5);
    REQUIRE(parse_error<InspectElement>({{"x", 1}}) == BridgeErrorType::INVALID_PARAMS);
    REQUIRE(parse_error<InspectElement>({{"x", "1"}, {"y", 1}}) == BridgeErrorType::INVALID_PARAMS);
}

TEST_CASE("Params: find_element needs at least one criterion", "[params]") {
    REQUIRE(parse_error<FindElement>(json::object()) == BridgeErrorType::INVALID_PARAMS);
    auto parsed = FindElement::parse({{"text", "Buy"}});
    REQUIRE(parsed.text == std::string("Buy"));
    REQUIRE_FALSE(parsed.test_id.has_value());
}

TEST_CASE("Params: simulate_interaction target forms", "[params]") {
    SECTION("testId target") {
        auto p = SimulateInteraction::parse({{"type", "tap"}, {"target", {{"testId", "buy"}}}});
        REQUIRE(p.test_id == std::string("buy"));
        REQUIRE_FALSE(p.point.has_value());
    }

    SECTION("coordinate target") {
        auto p = SimulateInteraction::parse({{"type", "tap"}, {"target", {{"x", 5}, {"y", 6}}}});
        REQUIRE(p.point->first == 5);
        REQUIRE(p.point->second == 6);
    }

    SECTION("numeric value is stringified") {
        auto p = SimulateInteraction::parse(
            {{"type", "input"}, {"target", {{"testId", "qty"}}}, {"value", 3}});
        REQUIRE(p.value == std::string("3"));
    }

    SECTION("invalid targets") {
        REQUIRE(parse_error<SimulateInteraction>({{"type", "tap"}}) ==
                BridgeErrorType::INVALID_PARAMS);
        REQUIRE(parse_error<SimulateInteraction>({{"type", "tap"}, {"target", {{"x", 1}}}}) ==
                BridgeErrorType::INVALID_PARAMS);
    }
}

TEST_CASE("Params: mock_network_request response forms", "[params][network]") {
    SECTION("mockResponse with statusCode, body and delay") {
        auto p = MockNetworkRequest::parse(
            {{"urlPattern", "/api"},
             {"mockResponse",
              {{"statusCode", 404}, {"body", {{"error", "nf"}}}, {"delay", 25},
               {"headers", {{"x-mock", "1"}}}}}});
        REQUIRE(p.url_pattern == "/api");
        REQUIRE(p.status == 404);
        REQUIRE(p.body["error"] == "nf");
        REQUIRE(p.delay_ms == 25);
        REQUIRE(p.headers.at("x-mock") == "1");
    }

    SECTION("response alias and top-level delay") {
        auto p = MockNetworkRequest::parse(
            {{"urlPattern", "/api"}, {"response", {{"body", "plain"}}}, {"delay", 10}});
        REQUIRE(p.status == 200);
        REQUIRE(p.body == "plain");
        REQUIRE(p.delay_ms == 10);
    }

    SECTION("validation") {
        REQUIRE(parse_error<MockNetworkRequest>(json::object()) == BridgeErrorType::INVALID_PARAMS);
        REQUIRE(parse_error<MockNetworkRequest>(
                    {{"urlPattern", "x"}, {"mockResponse", {{"statusCode", 42}}}}) ==
                BridgeErrorType::INVALID_PARAMS);
        REQUIRE(parse_error<MockNetworkRequest>({{"urlPattern", "x"}, {"delay", -1}}) ==
                BridgeErrorType::INVALID_PARAMS);
    }
}

TEST_CASE("Params: filters accept top level or nested form", "[params]") {
    auto nested = ListNetworkRequests::parse({{"filter", {{"url", "api"}}}, {"limit", 5}});
    REQUIRE(nested.filter.url == std::string("api"));
    REQUIRE(nested.filter.limit == 5);

    auto flat = ListNetworkRequests::parse({{"method", "POST"}});
    REQUIRE(flat.filter.method == std::string("POST"));

    auto traces = GetTraces::parse({{"filter", {{"name", "fetch"}, {"inProgress", true}}}, {"limit", 3}});
    REQUIRE(traces.filter.name == std::string("fetch"));
    REQUIRE(traces.filter.in_progress);
    REQUIRE(traces.filter.limit == 3);

    REQUIRE(parse_error<GetTraces>({{"limit", -2}}) == BridgeErrorType::INVALID_PARAMS);
    REQUIRE(parse_error<ListNetworkRequests>({{"filter", "api"}}) == BridgeErrorType::INVALID_PARAMS);
}

TEST_CASE("Params: get_logs levels", "[params][logs]") {
    auto p = GetLogs::parse({{"level", "warn"}, {"filter", "cart"}, {"limit", 10}});
    REQUIRE(p.query.level == spdlog::level::warn);
    REQUIRE(p.query.contains == std::string("cart"));
    REQUIRE(p.query.limit == 10);

    REQUIRE(parse_error<GetLogs>({{"level", "loud"}}) == BridgeErrorType::INVALID_PARAMS);
}

TEST_CASE("Params: replay_network_request", "[params][network]") {
    auto p = ReplayNetworkRequest::parse({{"requestId", "req_1"}});
    REQUIRE(p.request_id == "req_1");
    REQUIRE(p.modifications == json::object());
    REQUIRE(parse_error<ReplayNetworkRequest>(json::object()) == BridgeErrorType::INVALID_PARAMS);
}
