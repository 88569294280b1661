// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "http_transport.h"

#include "hv/requests.h"
#include "spdlog/spdlog.h"

#include <memory>

namespace devbridge {

OutboundResponse LibhvHttpTransport::perform(const OutboundRequest& request) {
    OutboundResponse result;

    auto req = std::make_shared<::HttpRequest>();
    req->method = http_method_enum(request.method.c_str());
    req->url = request.url;
    // libhv timeouts are whole seconds
    req->timeout = static_cast<int>((request.timeout_ms + 999) / 1000);
    for (const auto& [name, value] : request.headers) {
        req->headers[name] = value;
    }
    if (!request.body.empty()) {
        req->body = request.body;
    }

    auto resp = requests::request(req);
    if (!resp) {
        spdlog::debug("[HTTP Transport] {} {} failed (no response)", request.method, request.url);
        result.error = "HTTP request failed - no response";
        return result;
    }

    result.status = static_cast<int>(resp->status_code);
    result.body = resp->body;
    for (const auto& [name, value] : resp->headers) {
        result.headers[name] = value;
    }
    return result;
}

} // namespace devbridge
