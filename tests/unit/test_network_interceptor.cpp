// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../mocks/counting_http_transport.h"
#include "bridge_error.h"
#include "network_interceptor.h"

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;

namespace {

OutboundRequest get(const std::string& url) {
    OutboundRequest req;
    req.method = "get";
    req.url = url;
    return req;
}

class ThrowingTransport : public HttpTransport {
  public:
    OutboundResponse perform(const OutboundRequest&) override {
        throw std::runtime_error("socket exploded");
    }
};

} // namespace

TEST_CASE("Interceptor: unmocked calls reach the wrapped transport and are recorded",
          "[network]") {
    auto inner = std::make_shared<CountingHttpTransport>(201, R"({"id":7})");
    InterceptingTransport transport(inner);

    auto resp = transport.perform(get("https://api.example.com/orders"));
    REQUIRE(resp.status == 201);
    REQUIRE(inner->calls() == 1);

    json records = transport.list_requests(NetworkRequestFilter{});
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["method"] == "GET");
    REQUIRE(records[0]["status"] == 201);
    REQUIRE(records[0]["responseBody"]["id"] == 7);
    REQUIRE(records[0]["duration"].is_number());
    REQUIRE_FALSE(records[0].contains("mocked"));
}

TEST_CASE("Interceptor: a matching mock short-circuits the real call", "[network][mock]") {
    auto inner = std::make_shared<CountingHttpTransport>();
    InterceptingTransport transport(inner);

    std::string mock_id = transport.add_mock("/products$", 503, {{"error", "down"}});
    REQUIRE(mock_id.rfind("mock_", 0) == 0);

    auto resp = transport.perform(get("https://shop.test/products"));
    REQUIRE(resp.status == 503);
    REQUIRE(json::parse(resp.body)["error"] == "down");
    REQUIRE(inner->calls() == 0);

    json records = transport.list_requests(NetworkRequestFilter{});
    REQUIRE(records[0]["mocked"] == true);
    REQUIRE(records[0]["mockId"] == mock_id);
    REQUIRE(records[0]["status"] == 503);

    // Non-matching URL still goes through
    transport.perform(get("https://shop.test/products/1"));
    REQUIRE(inner->calls() == 1);
}

TEST_CASE("Interceptor: first registered mock wins", "[network][mock]") {
    InterceptingTransport transport(std::make_shared<CountingHttpTransport>());
    transport.add_mock("api", 200, "first");
    transport.add_mock("api/users", 404, "second");

    auto resp = transport.perform(get("https://x/api/users"));
    REQUIRE(resp.status == 200);
    REQUIRE(resp.body == "first");
}

TEST_CASE("Interceptor: removing mocks restores the real path", "[network][mock]") {
    auto inner = std::make_shared<CountingHttpTransport>();
    InterceptingTransport transport(inner);
    std::string id = transport.add_mock(".*", 500, nullptr);
    transport.add_mock("other", 500, nullptr);

    REQUIRE(transport.remove_mock(id));
    REQUIRE_FALSE(transport.remove_mock(id));
    REQUIRE(transport.mock_count() == 1);
    REQUIRE(transport.clear_mocks() == 1);

    REQUIRE(transport.perform(get("https://x/y")).status == 200);
    REQUIRE(inner->calls() == 1);
}

TEST_CASE("Interceptor: invalid pattern is rejected", "[network][mock]") {
    InterceptingTransport transport(std::make_shared<CountingHttpTransport>());
    try {
        transport.add_mock("([unclosed", 200, nullptr);
        FAIL("expected CommandError");
    } catch (const CommandError& e) {
        REQUIRE(e.type() == BridgeErrorType::INVALID_PARAMS);
    }
    REQUIRE(transport.mock_count() == 0);
}

TEST_CASE("Interceptor: mock delay is honored", "[network][mock]") {
    InterceptingTransport transport(std::make_shared<CountingHttpTransport>());
    transport.add_mock("slow", 200, "ok", {}, 50);

    auto start = std::chrono::steady_clock::now();
    transport.perform(get("https://x/slow"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed >= std::chrono::milliseconds(50));
}

TEST_CASE("Interceptor: throwing transport is recorded as a failure", "[network]") {
    InterceptingTransport transport(std::make_shared<ThrowingTransport>());
    auto resp = transport.perform(get("https://x/boom"));
    REQUIRE(resp.status == 0);
    REQUIRE(resp.error == "socket exploded");

    json rec = transport.list_requests(NetworkRequestFilter{})[0];
    REQUIRE(rec["status"] == 0);
    REQUIRE(rec["error"] == "socket exploded");
}

TEST_CASE("Interceptor: records are bounded and most recent first", "[network]") {
    InterceptingTransport transport(std::make_shared<CountingHttpTransport>(), 3);
    for (int i = 0; i < 5; ++i) {
        transport.perform(get("https://x/" + std::to_string(i)));
    }
    REQUIRE(transport.record_count() == 3);
    json records = transport.list_requests(NetworkRequestFilter{});
    REQUIRE(records[0]["url"] == "https://x/4");
    REQUIRE(records[2]["url"] == "https://x/2");
}

TEST_CASE("Interceptor: list filters by url, method and limit", "[network]") {
    InterceptingTransport transport(std::make_shared<CountingHttpTransport>());
    transport.perform(get("https://x/users"));
    OutboundRequest post = get("https://x/users");
    post.method = "POST";
    post.body = R"({"name":"ada"})";
    transport.perform(post);
    transport.perform(get("https://x/orders"));

    NetworkRequestFilter by_url;
    by_url.url = "users";
    REQUIRE(transport.list_requests(by_url).size() == 2);

    NetworkRequestFilter by_method;
    by_method.method = "post";
    json posts = transport.list_requests(by_method);
    REQUIRE(posts.size() == 1);
    REQUIRE(posts[0]["requestBody"]["name"] == "ada");

    NetworkRequestFilter limited;
    limited.limit = 1;
    REQUIRE(transport.list_requests(limited).size() == 1);
}

TEST_CASE("Interceptor: replay re-issues with modifications", "[network][replay]") {
    auto inner = std::make_shared<CountingHttpTransport>();
    InterceptingTransport transport(inner);

    OutboundRequest req = get("https://x/cart");
    req.headers["Authorization"] = "old";
    req.body = "original";
    transport.perform(req);
    std::string id = transport.list_requests(NetworkRequestFilter{})[0]["id"].get<std::string>();

    std::promise<json> done;
    auto result = done.get_future();
    REQUIRE(transport.replay(id, {{"headers", {{"Authorization", "new"}}}, {"body", "changed"}},
                             [&](json r) { done.set_value(std::move(r)); }));

    REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    json r = result.get();
    REQUIRE(r["success"] == true);
    REQUIRE(r["requestId"] == id);
    REQUIRE(r["replayId"] != id);
    REQUIRE(r["body"]["real"] == true);

    auto requests = inner->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].headers["Authorization"] == "new");
    REQUIRE(requests[1].body == "changed");
    REQUIRE(transport.record_count() == 2);
}

TEST_CASE("Interceptor: replay goes through active mocks", "[network][replay]") {
    auto inner = std::make_shared<CountingHttpTransport>();
    InterceptingTransport transport(inner);
    transport.perform(get("https://x/flaky"));
    std::string id = transport.list_requests(NetworkRequestFilter{})[0]["id"].get<std::string>();

    transport.add_mock("flaky", 418, {{"teapot", true}});

    std::promise<json> done;
    auto result = done.get_future();
    transport.replay(id, json::object(), [&](json r) { done.set_value(std::move(r)); });
    REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    json r = result.get();
    REQUIRE(r["status"] == 418);
    REQUIRE(inner->calls() == 1);
}

TEST_CASE("Interceptor: replay of unknown id returns false", "[network][replay]") {
    InterceptingTransport transport(std::make_shared<CountingHttpTransport>());
    bool called = false;
    REQUIRE_FALSE(transport.replay("req_missing", json::object(), [&](json) { called = true; }));
    REQUIRE_FALSE(called);
}

// ============================================================================
// Teardown with replays in flight
// ============================================================================

namespace {

/// Transport that blocks each call until release() once armed
class GatedTransport : public HttpTransport {
  public:
    OutboundResponse perform(const OutboundRequest&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !armed_ || released_; });
        OutboundResponse response;
        response.status = 200;
        response.body = "late";
        return response;
    }

    void arm() {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_ = false;
    bool released_ = false;
};

} // namespace

TEST_CASE("Interceptor: destruction cuts a delayed mock replay short", "[network][replay]") {
    auto done = std::make_shared<std::promise<json>>();
    auto result = done->get_future();

    auto started = std::chrono::steady_clock::now();
    {
        InterceptingTransport transport(std::make_shared<CountingHttpTransport>());
        transport.perform(get("https://api.example.com/slow"));
        std::string id = transport.list_requests(NetworkRequestFilter{})[0]["id"].get<std::string>();

        transport.add_mock("api", 200, "mocked", {}, 3000);
        REQUIRE(transport.replay(id, json::object(), [done](json r) { done->set_value(r); }));
    }
    auto elapsed = std::chrono::steady_clock::now() - started;

    // Well under both the mock delay and the join timeout
    REQUIRE(elapsed < std::chrono::milliseconds(1500));
    REQUIRE(result.wait_for(std::chrono::seconds(1)) == std::future_status::ready);
    json r = result.get();
    REQUIRE(r["success"] == false);
    REQUIRE(r["error"] == "Interrupted by shutdown");
}

TEST_CASE("Interceptor: replay outliving the transport completes safely",
          "[network][replay][slow]") {
    auto gate = std::make_shared<GatedTransport>();
    auto done = std::make_shared<std::promise<json>>();
    auto result = done->get_future();

    {
        InterceptingTransport transport(gate);
        transport.perform(get("https://api.example.com/report"));
        std::string id = transport.list_requests(NetworkRequestFilter{})[0]["id"].get<std::string>();

        gate->arm();
        REQUIRE(transport.replay(id, json::object(), [done](json r) { done->set_value(r); }));
        // Destructor gives up on the blocked worker and detaches it
    }

    gate->release();
    REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    json r = result.get();
    REQUIRE(r["success"] == true);
    REQUIRE(r["status"] == 200);
    REQUIRE(r["body"] == "late");
}
