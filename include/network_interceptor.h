// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "http_transport.h"
#include "json_utils.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace devbridge {

/**
 * @brief Substitute response for outbound calls whose URL matches a pattern
 */
struct NetworkMock {
    std::string id;
    std::string url_pattern; ///< Source text of the regex
    std::regex regex;
    int status = 200;
    json body;
    HeaderMap headers;
    uint32_t delay_ms = 0;
};

/**
 * @brief One captured outbound call
 */
struct NetworkRecord {
    std::string id;
    std::string url;
    std::string method;
    HeaderMap request_headers;
    std::string request_body;
    int64_t timestamp_ms = 0;
    std::optional<int> status; ///< Unset while in flight; 0 on transport failure
    std::optional<int64_t> duration_ms;
    std::string response_body;
    std::string error;
    std::string mock_id; ///< Set when a mock answered

    [[nodiscard]] json to_json() const;
};

/**
 * @brief Filter for list_requests()
 */
struct NetworkRequestFilter {
    std::optional<std::string> url;    ///< Substring of the URL
    std::optional<std::string> method; ///< Case-insensitive
    size_t limit = 50;
};

/**
 * @brief Recording, mocking wrapper around another HttpTransport
 *
 * Every call is recorded before dispatch. Mocks are checked in registration
 * order and the first whose pattern matches answers the call (after its
 * delay) without touching the wrapped transport. Otherwise the wrapped
 * transport runs and the record is completed with its outcome.
 *
 * Records are kept most-recent-first in a bounded ring.
 *
 * Thread-safe. Replays run on background threads that are joined (with a
 * timeout) on destruction. Destruction also cuts short any mock delay in
 * progress; such calls complete with status 0.
 */
class InterceptingTransport : public HttpTransport {
  public:
    static constexpr size_t DEFAULT_CAPACITY = 200;

    explicit InterceptingTransport(std::shared_ptr<HttpTransport> inner,
                                   size_t capacity = DEFAULT_CAPACITY);
    ~InterceptingTransport() override;

    InterceptingTransport(const InterceptingTransport&) = delete;
    InterceptingTransport& operator=(const InterceptingTransport&) = delete;

    OutboundResponse perform(const OutboundRequest& request) override;

    /**
     * @brief Add a mock
     *
     * @throws CommandError INVALID_PARAMS if @p url_pattern is not a valid regex
     * @return Generated mock id (mock_<epoch ms>_<random>)
     */
    std::string add_mock(const std::string& url_pattern, int status, json body,
                         HeaderMap headers = {}, uint32_t delay_ms = 0);

    bool remove_mock(const std::string& mock_id);

    /// @return Number of mocks removed
    size_t clear_mocks();

    [[nodiscard]] size_t mock_count() const;
    [[nodiscard]] size_t record_count() const;

    /// Matching records, most recent first
    [[nodiscard]] json list_requests(const NetworkRequestFilter& filter) const;

    [[nodiscard]] std::optional<NetworkRecord> find_record(const std::string& request_id) const;

    /**
     * @brief Re-issue a captured request on a background thread
     *
     * The replay goes through perform(), so it is recorded and mocks apply.
     * @p modifications may override "headers" (object) and "body" (any).
     * @p on_complete receives {success, requestId, replayId, status, body}
     * or {success:false, error, requestId}.
     *
     * @return false if the request id is unknown (on_complete not called)
     */
    bool replay(const std::string& request_id, const json& modifications,
                std::function<void(json)> on_complete);

  private:
    struct State;

    bool launch_worker(std::function<void()> func);

    /// Shared with replay workers so a worker outliving the transport stays valid
    std::shared_ptr<State> state_;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace devbridge
