// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_params.h"

#include "bridge_error.h"

namespace devbridge::params {

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw CommandError(BridgeErrorType::INVALID_PARAMS, message);
}

const json& member_or_null(const json& p, const char* key) {
    static const json null_value;
    if (!p.is_object()) {
        return null_value;
    }
    auto it = p.find(key);
    return it == p.end() ? null_value : *it;
}

std::optional<std::string> optional_string(const json& p, const char* key) {
    const json& v = member_or_null(p, key);
    if (v.is_null()) {
        return std::nullopt;
    }
    if (!v.is_string()) {
        invalid(std::string("'") + key + "' must be a string");
    }
    return v.get<std::string>();
}

std::string required_string(const json& p, const char* key) {
    auto v = optional_string(p, key);
    if (!v || v->empty()) {
        invalid(std::string("Missing required parameter '") + key + "'");
    }
    return *v;
}

std::optional<bool> optional_bool(const json& p, const char* key) {
    const json& v = member_or_null(p, key);
    if (v.is_null()) {
        return std::nullopt;
    }
    if (!v.is_boolean()) {
        invalid(std::string("'") + key + "' must be a boolean");
    }
    return v.get<bool>();
}

std::optional<double> optional_number(const json& p, const char* key) {
    const json& v = member_or_null(p, key);
    if (v.is_null()) {
        return std::nullopt;
    }
    if (!v.is_number()) {
        invalid(std::string("'") + key + "' must be a number");
    }
    return v.get<double>();
}

double required_number(const json& p, const char* key) {
    auto v = optional_number(p, key);
    if (!v) {
        invalid(std::string("Missing required parameter '") + key + "'");
    }
    return *v;
}

size_t optional_limit(const json& p, const char* key, size_t def) {
    auto v = optional_number(p, key);
    if (!v) {
        return def;
    }
    if (*v < 0) {
        invalid(std::string("'") + key + "' must not be negative");
    }
    return static_cast<size_t>(*v);
}

json optional_object(const json& p, const char* key) {
    const json& v = member_or_null(p, key);
    if (v.is_null()) {
        return json::object();
    }
    if (!v.is_object()) {
        invalid(std::string("'") + key + "' must be an object");
    }
    return v;
}

/// `filter` sub-object when present, else the params themselves
const json& filter_scope(const json& p) {
    const json& f = member_or_null(p, "filter");
    if (f.is_null()) {
        return p;
    }
    if (!f.is_object()) {
        invalid("'filter' must be an object");
    }
    return f;
}

std::optional<spdlog::level::level_enum> optional_level(const json& p, const char* key) {
    auto name = optional_string(p, key);
    if (!name) {
        return std::nullopt;
    }
    auto level = spdlog::level::from_str(*name);
    if (level == spdlog::level::off && *name != "off") {
        invalid("Unknown log level: " + *name);
    }
    return level;
}

} // namespace

GetAppState GetAppState::parse(const json& p) {
    GetAppState r;
    r.key = optional_string(p, "key");
    if (r.key && r.key->empty()) {
        r.key.reset();
    }
    return r;
}

QueryStorage QueryStorage::parse(const json& p) {
    QueryStorage r;
    r.key = optional_string(p, "key");
    r.pattern = optional_string(p, "pattern");
    return r;
}

ExecuteAction ExecuteAction::parse(const json& p) {
    ExecuteAction r;
    r.action = required_string(p, "action");
    r.params = optional_object(p, "params");
    return r;
}

NavigateTo NavigateTo::parse(const json& p) {
    NavigateTo r;
    r.route = required_string(p, "route");
    r.params = optional_object(p, "params");
    return r;
}

ToggleFeatureFlag ToggleFeatureFlag::parse(const json& p) {
    ToggleFeatureFlag r;
    auto flag = optional_string(p, "flag");
    if (!flag) {
        flag = optional_string(p, "flagName");
    }
    if (!flag) {
        flag = optional_string(p, "key");
    }
    if (!flag || flag->empty()) {
        invalid("Missing required parameter 'flag'");
    }
    r.flag = *flag;
    r.enabled = optional_bool(p, "enabled");
    if (!r.enabled) {
        r.enabled = optional_bool(p, "value");
    }
    return r;
}

GetComponentTree GetComponentTree::parse(const json& p) {
    GetComponentTree r;
    r.include_props = optional_bool(p, "includeProps").value_or(true);
    return r;
}

GetLayoutTree GetLayoutTree::parse(const json& p) {
    GetLayoutTree r;
    r.include_hidden = optional_bool(p, "includeHidden").value_or(false);
    return r;
}

InspectElement InspectElement::parse(const json& p) {
    InspectElement r;
    r.x = required_number(p, "x");
    r.y = required_number(p, "y");
    return r;
}

FindElement FindElement::parse(const json& p) {
    FindElement r;
    r.test_id = optional_string(p, "testId");
    r.type = optional_string(p, "type");
    r.text = optional_string(p, "text");
    if (!r.test_id && !r.type && !r.text) {
        invalid("Provide at least one of 'testId', 'type' or 'text'");
    }
    return r;
}

GetElementText GetElementText::parse(const json& p) {
    GetElementText r;
    r.test_id = required_string(p, "testId");
    return r;
}

SimulateInteraction SimulateInteraction::parse(const json& p) {
    SimulateInteraction r;
    r.type = required_string(p, "type");

    const json& target = member_or_null(p, "target");
    if (!target.is_object()) {
        invalid("Missing required parameter 'target'");
    }
    r.test_id = optional_string(target, "testId");
    if (!r.test_id) {
        auto x = optional_number(target, "x");
        auto y = optional_number(target, "y");
        if (!x || !y) {
            invalid("'target' needs 'testId' or both 'x' and 'y'");
        }
        r.point = std::make_pair(*x, *y);
    }

    const json& value = member_or_null(p, "value");
    if (value.is_string()) {
        r.value = value.get<std::string>();
    } else if (value.is_number()) {
        r.value = value.dump();
    } else if (!value.is_null()) {
        invalid("'value' must be a string");
    }
    return r;
}

ListNetworkRequests ListNetworkRequests::parse(const json& p) {
    ListNetworkRequests r;
    const json& scope = filter_scope(p);
    r.filter.url = optional_string(scope, "url");
    r.filter.method = optional_string(scope, "method");
    r.filter.limit = optional_limit(p, "limit", r.filter.limit);
    return r;
}

MockNetworkRequest MockNetworkRequest::parse(const json& p) {
    MockNetworkRequest r;
    r.url_pattern = required_string(p, "urlPattern");

    const json* response = &member_or_null(p, "mockResponse");
    if (response->is_null()) {
        response = &member_or_null(p, "response");
    }
    if (!response->is_null() && !response->is_object()) {
        invalid("'mockResponse' must be an object");
    }

    if (auto status = optional_number(*response, "statusCode")) {
        r.status = static_cast<int>(*status);
    }
    if (r.status < 100 || r.status > 599) {
        invalid("'statusCode' must be between 100 and 599");
    }
    r.body = member_or_null(*response, "body");

    const json& headers = member_or_null(*response, "headers");
    if (headers.is_object()) {
        for (const auto& [name, value] : headers.items()) {
            r.headers[name] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    } else if (!headers.is_null()) {
        invalid("'headers' must be an object");
    }

    auto delay = optional_number(*response, "delay");
    if (!delay) {
        delay = optional_number(p, "delay");
    }
    if (delay) {
        if (*delay < 0) {
            invalid("'delay' must not be negative");
        }
        r.delay_ms = static_cast<uint32_t>(*delay);
    }
    return r;
}

ClearNetworkMocks ClearNetworkMocks::parse(const json& p) {
    ClearNetworkMocks r;
    r.mock_id = optional_string(p, "mockId");
    return r;
}

ReplayNetworkRequest ReplayNetworkRequest::parse(const json& p) {
    ReplayNetworkRequest r;
    r.request_id = required_string(p, "requestId");
    r.modifications = optional_object(p, "modifications");
    return r;
}

GetLogs GetLogs::parse(const json& p) {
    GetLogs r;
    r.query.level = optional_level(p, "level");
    r.query.min_level = optional_level(p, "minLevel");
    r.query.contains = optional_string(p, "filter");
    r.query.limit = optional_limit(p, "limit", r.query.limit);
    return r;
}

GetRecentErrors GetRecentErrors::parse(const json& p) {
    GetRecentErrors r;
    r.limit = optional_limit(p, "limit", r.limit);
    return r;
}

GetTraces GetTraces::parse(const json& p) {
    GetTraces r;
    const json& scope = filter_scope(p);
    r.filter.name = optional_string(scope, "name");
    r.filter.file = optional_string(scope, "file");
    if (auto d = optional_number(scope, "minDuration")) {
        r.filter.min_duration_ms = static_cast<int64_t>(*d);
    }
    if (auto s = optional_number(scope, "since")) {
        r.filter.since_ms = static_cast<int64_t>(*s);
    }
    r.filter.in_progress = optional_bool(scope, "inProgress").value_or(false);
    r.filter.limit = optional_limit(scope, "limit", r.filter.limit);
    if (&scope != &p) {
        r.filter.limit = optional_limit(p, "limit", r.filter.limit);
    }
    return r;
}

} // namespace devbridge::params
