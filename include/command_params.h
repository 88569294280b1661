// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "http_transport.h"
#include "json_utils.h"
#include "log_capture_sink.h"
#include "network_interceptor.h"
#include "trace_engine.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

/**
 * @file command_params.h
 * @brief Typed parameters for the built-in commands
 *
 * Each struct's parse() validates a request's `params` object and throws
 * CommandError(INVALID_PARAMS) on a missing or mistyped member. Unknown
 * members are ignored.
 */

namespace devbridge::params {

struct GetAppState {
    std::optional<std::string> key;
    static GetAppState parse(const json& p);
};

struct QueryStorage {
    std::optional<std::string> key;
    std::optional<std::string> pattern; ///< Regex over keys
    static QueryStorage parse(const json& p);
};

struct ExecuteAction {
    std::string action;
    json params = json::object();
    static ExecuteAction parse(const json& p);
};

struct NavigateTo {
    std::string route;
    json params = json::object();
    static NavigateTo parse(const json& p);
};

/// Accepts `flag`, `flagName` or `key` for the name and `enabled` or `value` for the value
struct ToggleFeatureFlag {
    std::string flag;
    std::optional<bool> enabled;
    static ToggleFeatureFlag parse(const json& p);
};

struct GetComponentTree {
    bool include_props = true;
    static GetComponentTree parse(const json& p);
};

struct GetLayoutTree {
    bool include_hidden = false;
    static GetLayoutTree parse(const json& p);
};

struct InspectElement {
    double x = 0;
    double y = 0;
    static InspectElement parse(const json& p);
};

struct FindElement {
    std::optional<std::string> test_id;
    std::optional<std::string> type;
    std::optional<std::string> text;
    static FindElement parse(const json& p);
};

struct GetElementText {
    std::string test_id;
    static GetElementText parse(const json& p);
};

/// Target is `target.testId` or `target.x`/`target.y`
struct SimulateInteraction {
    std::string type;
    std::optional<std::string> test_id;
    std::optional<std::pair<double, double>> point;
    std::optional<std::string> value;
    static SimulateInteraction parse(const json& p);
};

/// Filter members may sit at top level or under `filter`
struct ListNetworkRequests {
    NetworkRequestFilter filter;
    static ListNetworkRequests parse(const json& p);
};

/// Response under `mockResponse` or `response`; `delay` there or at top level
struct MockNetworkRequest {
    std::string url_pattern;
    int status = 200;
    json body;
    HeaderMap headers;
    uint32_t delay_ms = 0;
    static MockNetworkRequest parse(const json& p);
};

struct ClearNetworkMocks {
    std::optional<std::string> mock_id;
    static ClearNetworkMocks parse(const json& p);
};

struct ReplayNetworkRequest {
    std::string request_id;
    json modifications = json::object();
    static ReplayNetworkRequest parse(const json& p);
};

struct GetLogs {
    LogQuery query;
    static GetLogs parse(const json& p);
};

struct GetRecentErrors {
    size_t limit = 20;
    static GetRecentErrors parse(const json& p);
};

/// Filter members may sit at top level or under `filter`
struct GetTraces {
    TraceFilter filter;
    static GetTraces parse(const json& p);
};

} // namespace devbridge::params
