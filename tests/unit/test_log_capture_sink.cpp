// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "log_capture_sink.h"

#include <spdlog/spdlog.h>

#include <memory>

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;

namespace {

struct CaptureFixture {
    std::shared_ptr<LogCaptureSink> sink;
    std::shared_ptr<spdlog::logger> logger;

    explicit CaptureFixture(size_t capacity = 100, std::string ignore = "[Bridge") {
        sink = std::make_shared<LogCaptureSink>(capacity, std::move(ignore));
        logger = std::make_shared<spdlog::logger>("capture_test", sink);
        logger->set_level(spdlog::level::trace);
    }
};

} // namespace

TEST_CASE("LogCaptureSink: records most recent first", "[logs]") {
    CaptureFixture f;
    f.logger->info("first");
    f.logger->warn("second");

    json logs = f.sink->query(LogQuery{});
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[0]["message"] == "second");
    REQUIRE(logs[0]["level"] == "warning");
    REQUIRE(logs[0]["logger"] == "capture_test");
    REQUIRE(logs[1]["message"] == "first");
    REQUIRE(logs[1]["timestamp"].is_number_integer());
}

TEST_CASE("LogCaptureSink: capacity drops the oldest", "[logs]") {
    CaptureFixture f(3);
    for (int i = 0; i < 5; ++i) {
        f.logger->info("msg {}", i);
    }
    REQUIRE(f.sink->size() == 3);
    REQUIRE(f.sink->query(LogQuery{})[2]["message"] == "msg 2");
}

TEST_CASE("LogCaptureSink: bridge chatter is ignored", "[logs]") {
    CaptureFixture f;
    f.logger->info("[Bridge Client] Connected");
    f.logger->info("[Cart] Added item");
    REQUIRE(f.sink->size() == 1);
}

TEST_CASE("LogCaptureSink: query filters", "[logs]") {
    CaptureFixture f;
    f.logger->debug("cache miss");
    f.logger->info("cart loaded");
    f.logger->error("cart failed");
    f.logger->critical("out of memory");

    SECTION("exact level") {
        LogQuery q;
        q.level = spdlog::level::err;
        json logs = f.sink->query(q);
        REQUIRE(logs.size() == 1);
        REQUIRE(logs[0]["message"] == "cart failed");
    }

    SECTION("minimum level") {
        LogQuery q;
        q.min_level = spdlog::level::err;
        REQUIRE(f.sink->query(q).size() == 2);
    }

    SECTION("substring") {
        LogQuery q;
        q.contains = "cart";
        REQUIRE(f.sink->query(q).size() == 2);
    }

    SECTION("limit") {
        LogQuery q;
        q.limit = 1;
        json logs = f.sink->query(q);
        REQUIRE(logs.size() == 1);
        REQUIRE(logs[0]["message"] == "out of memory");
    }
}

TEST_CASE("LogCaptureSink: clear", "[logs]") {
    CaptureFixture f;
    f.logger->info("x");
    f.sink->clear();
    REQUIRE(f.sink->size() == 0);
    REQUIRE(f.sink->query(LogQuery{}).empty());
}
