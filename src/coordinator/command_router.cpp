// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_router.h"

#include "error_reporting.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace devbridge {

CommandRouter::CommandRouter(DeviceRegistry& devices, TimerService& timers)
    : devices_(devices), timers_(timers) {}

CommandRouter::~CommandRouter() {
    cancel_all();
}

RequestId CommandRouter::send_command(const std::string& device_id, const std::string& method,
                                      const json& params, SuccessCallback on_success,
                                      ErrorCallback on_error, uint32_t timeout_ms) {
    PendingRequest request;
    request.method = method;
    request.success_callback = std::move(on_success);
    request.error_callback = std::move(on_error);

    // Resolve the target before allocating anything; no device means nothing is sent
    std::string target = device_id;
    if (target.empty()) {
        target = devices_.primary_device().value_or("");
    }
    std::shared_ptr<DeviceLink> link = target.empty() ? nullptr : devices_.link_for(target);
    if (!link) {
        spdlog::warn("[Command Router] {} not sent: {}", method,
                     target.empty() ? "no device connected" : "unknown device " + target);
        fail(request, BridgeError::no_device(method, device_id));
        return INVALID_REQUEST_ID;
    }

    // Increment FIRST so IDs start at 1 and never equal INVALID_REQUEST_ID
    RequestId id = request_id_.fetch_add(1) + 1;
    request.id = id;
    request.device_id = target;
    request.timestamp = std::chrono::steady_clock::now();
    request.timeout_ms = (timeout_ms > 0) ? timeout_ms : default_timeout_ms_.load();

    // Register before sending so a fast response always finds its entry
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        pending_requests_.emplace(id, request);
        spdlog::trace("[Command Router] Registered request {} ({}) for {}, total pending: {}", id,
                      method, target, pending_requests_.size());
    }

    TimerHandle timer = timers_.schedule(request.timeout_ms, [this, id]() { on_timeout(id); });
    bool still_pending = false;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(id);
        if (it != pending_requests_.end()) {
            it->second.timer = timer;
            still_pending = true;
        }
    }
    if (!still_pending) {
        // Settled while the timer was being armed
        timers_.cancel(timer);
        return id;
    }

    RequestFrame frame;
    frame.id = id;
    frame.method = method;
    frame.params = params.is_null() ? json::object() : params;

    spdlog::trace("[Command Router] send to {}: {}", target, method);
    if (!link->send(protocol::encode(frame))) {
        PendingRequest failed;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            auto it = pending_requests_.find(id);
            if (it != pending_requests_.end()) {
                failed = std::move(it->second);
                pending_requests_.erase(it);
                found = true;
            }
        }
        if (found) {
            timers_.cancel(failed.timer);
            spdlog::error("[Command Router] Failed to send request {} ({}) to {}, removed from "
                          "pending",
                          id, method, target);
            fail(failed, BridgeError::send_failed(method));
        }
        return INVALID_REQUEST_ID;
    }

    return id;
}

std::future<CommandResult> CommandRouter::send_command_sync(const std::string& device_id,
                                                            const std::string& method,
                                                            const json& params,
                                                            uint32_t timeout_ms) {
    auto promise = std::make_shared<std::promise<CommandResult>>();
    std::future<CommandResult> future = promise->get_future();

    send_command(
        device_id, method, params,
        [promise](json result) {
            CommandResult r;
            r.result = std::move(result);
            promise->set_value(std::move(r));
        },
        [promise](const BridgeError& error) {
            CommandResult r;
            r.error = error;
            promise->set_value(std::move(r));
        },
        timeout_ms);
    return future;
}

bool CommandRouter::route_response(const std::string& device_id, const ResponseFrame& response) {
    // Copy callbacks out before invoking to avoid deadlock
    PendingRequest request;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(response.id);
        if (it != pending_requests_.end() && it->second.device_id == device_id) {
            request = std::move(it->second);
            pending_requests_.erase(it);
            found = true;
        }
    } // Lock released here

    if (!found) {
        spdlog::debug("[Command Router] Discarding response {} from {} (late or unknown)",
                      response.id, device_id);
        emit_event(BridgeEventType::LATE_RESPONSE,
                   fmt::format("Response {} arrived after its request was settled", response.id),
                   device_id, false);
        return false;
    }

    timers_.cancel(request.timer);

    if (response.is_error()) {
        BridgeError error = response.error;
        error.method = request.method;
        spdlog::debug("[Command Router] Request {} ({}) failed: {}", request.id, request.method,
                      error.message);
        fail(request, error);
        return true;
    }

    if (request.success_callback) {
        try {
            request.success_callback(response.result);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Command Router] Success callback for '{}' threw exception: {}",
                               request.method, e.what());
        }
    }
    return true;
}

void CommandRouter::route_event(const std::string& device_id, const EventFrame& event) {
    DeviceEventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = device_event_handler_;
    }

    emit_event(BridgeEventType::DEVICE_EVENT, "Device event: " + event.event, device_id, false);

    if (handler) {
        try {
            handler(device_id, event);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Command Router] Device event handler threw exception: {}",
                               e.what());
        }
    }
}

void CommandRouter::on_timeout(RequestId id) {
    PendingRequest request;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(id);
        if (it == pending_requests_.end()) {
            return; // Settled while the timer was firing
        }
        request = std::move(it->second);
        pending_requests_.erase(it);
    }

    spdlog::warn("[Command Router] Request {} ({}) to {} timed out after {}ms", id, request.method,
                 request.device_id, request.timeout_ms);
    emit_event(BridgeEventType::REQUEST_TIMEOUT,
               fmt::format("Command '{}' timed out after {}ms", request.method, request.timeout_ms),
               request.device_id, false);
    fail(request, BridgeError::timeout(request.method, request.timeout_ms));
}

size_t CommandRouter::reject_device(const std::string& device_id) {
    // Two-phase pattern: collect under lock, invoke outside lock
    std::vector<PendingRequest> lost;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        for (auto it = pending_requests_.begin(); it != pending_requests_.end();) {
            if (it->second.device_id == device_id) {
                lost.push_back(std::move(it->second));
                it = pending_requests_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!lost.empty()) {
        spdlog::debug("[Command Router] Rejecting {} pending requests for lost device {}",
                      lost.size(), device_id);
    }
    for (auto& request : lost) {
        timers_.cancel(request.timer);
        fail(request, BridgeError::connection_lost(request.method));
    }
    return lost.size();
}

void CommandRouter::cancel_all() {
    std::map<RequestId, PendingRequest> all;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        all.swap(pending_requests_);
    }
    for (auto& [id, request] : all) {
        timers_.cancel(request.timer);
        fail(request, BridgeError::connection_lost(request.method));
    }
}

void CommandRouter::on_event(DeviceEventHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    device_event_handler_ = std::move(handler);
}

void CommandRouter::register_event_handler(BridgeEventCallback cb) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    event_handler_ = std::move(cb);
}

size_t CommandRouter::pending_count() const {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

void CommandRouter::fail(const PendingRequest& request, const BridgeError& error) {
    if (!request.error_callback) {
        return;
    }
    try {
        request.error_callback(error);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Command Router] Error callback for {} threw exception: {}",
                           request.method, e.what());
    }
}

void CommandRouter::emit_event(BridgeEventType type, const std::string& message,
                               const std::string& device_id, bool is_error) {
    BridgeEventCallback handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = event_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(BridgeEvent{type, message, device_id, is_error});
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Command Router] Event handler threw exception: {}", e.what());
    }
}

} // namespace devbridge
