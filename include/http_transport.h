// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace devbridge {

using HeaderMap = std::map<std::string, std::string>;

/**
 * @brief Outbound HTTP call issued by host code
 */
struct OutboundRequest {
    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    std::string body;
    uint32_t timeout_ms = 30000;
};

/**
 * @brief Result of an outbound HTTP call
 *
 * status 0 means the transport failed and `error` says why.
 */
struct OutboundResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
    std::string error;

    [[nodiscard]] bool transport_ok() const {
        return status > 0 && error.empty();
    }
};

/**
 * @brief Abstract outbound HTTP call path
 *
 * Host code routes its HTTP traffic through a transport so the bridge can
 * record and mock it. perform() is synchronous and may be called from any
 * thread.
 */
class HttpTransport {
  public:
    virtual ~HttpTransport() = default;

    /// Never throws for network failures; those come back with status 0
    virtual OutboundResponse perform(const OutboundRequest& request) = 0;
};

/**
 * @brief HttpTransport backed by libhv's synchronous requests API
 */
class LibhvHttpTransport : public HttpTransport {
  public:
    OutboundResponse perform(const OutboundRequest& request) override;
};

} // namespace devbridge
