// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "bridge_events.h"
#include "bridge_protocol.h"
#include "device_registry.h"
#include "timer_service.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace devbridge {

/**
 * @brief A request awaiting its response
 */
struct PendingRequest {
    RequestId id = INVALID_REQUEST_ID;
    std::string device_id;
    std::string method;
    std::function<void(json)> success_callback;
    std::function<void(const BridgeError&)> error_callback;
    TimerHandle timer = INVALID_TIMER;
    std::chrono::steady_clock::time_point timestamp;
    uint32_t timeout_ms = 0;
};

/**
 * @brief Outcome of a blocking command
 */
struct CommandResult {
    json result;
    BridgeError error;

    [[nodiscard]] bool ok() const {
        return !error.has_error();
    }
};

/**
 * @brief Routes commands to devices and correlates their responses
 *
 * Every request is settled exactly once: by its response, its timer, the
 * loss of its device, or a failed send. The entry is removed under the lock
 * before its callback runs (outside the lock), so a late response for a
 * settled id finds nothing and is discarded.
 */
class CommandRouter {
  public:
    static constexpr uint32_t DEFAULT_TIMEOUT_MS = 10000;

    using SuccessCallback = std::function<void(json)>;
    using ErrorCallback = std::function<void(const BridgeError&)>;
    using DeviceEventHandler = std::function<void(const std::string& device_id, const EventFrame&)>;

    CommandRouter(DeviceRegistry& devices, TimerService& timers);
    ~CommandRouter();

    // Non-copyable (has mutex)
    CommandRouter(const CommandRouter&) = delete;
    CommandRouter& operator=(const CommandRouter&) = delete;

    /**
     * @brief Send a command to a device
     *
     * @param device_id Target device; empty selects the primary device
     * @param timeout_ms Timeout override (0 = use default)
     * @return Request ID, or INVALID_REQUEST_ID if it failed immediately
     *         (@p on_error has then already been called)
     */
    RequestId send_command(const std::string& device_id, const std::string& method,
                           const json& params, SuccessCallback on_success, ErrorCallback on_error,
                           uint32_t timeout_ms = 0);

    /// send_command() with the outcome delivered through a future
    std::future<CommandResult> send_command_sync(const std::string& device_id,
                                                 const std::string& method, const json& params,
                                                 uint32_t timeout_ms = 0);

    /**
     * @brief Settle the pending request matching @p response
     *
     * @return false if no request with that id is pending (late or unknown)
     */
    bool route_response(const std::string& device_id, const ResponseFrame& response);

    /// Deliver a device-pushed event to the on_event() handler
    void route_event(const std::string& device_id, const EventFrame& event);

    /// Reject every request addressed to @p device_id with CONNECTION_LOST
    size_t reject_device(const std::string& device_id);

    /// Reject everything still pending (shutdown)
    void cancel_all();

    void on_event(DeviceEventHandler handler);
    void register_event_handler(BridgeEventCallback cb);

    [[nodiscard]] size_t pending_count() const;

    void set_default_timeout(uint32_t timeout_ms) {
        default_timeout_ms_ = timeout_ms;
    }

    [[nodiscard]] uint32_t get_default_timeout() const {
        return default_timeout_ms_;
    }

  private:
    void on_timeout(RequestId id);
    void fail(const PendingRequest& request, const BridgeError& error);
    void emit_event(BridgeEventType type, const std::string& message, const std::string& device_id,
                    bool is_error);

    DeviceRegistry& devices_;
    TimerService& timers_;

    mutable std::mutex requests_mutex_;
    std::map<RequestId, PendingRequest> pending_requests_;
    std::atomic_uint64_t request_id_{0};
    std::atomic<uint32_t> default_timeout_ms_{DEFAULT_TIMEOUT_MS};

    std::mutex handlers_mutex_;
    DeviceEventHandler device_event_handler_;
    BridgeEventCallback event_handler_;
};

} // namespace devbridge
