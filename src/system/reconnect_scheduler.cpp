// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reconnect_scheduler.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace devbridge {

ReconnectScheduler::ReconnectScheduler(TimerService& timers, std::function<void()> attempt,
                                       uint32_t delay_ms)
    : timers_(timers), attempt_(std::move(attempt)), delay_ms_(delay_ms) {}

ReconnectScheduler::~ReconnectScheduler() {
    disable();
}

bool ReconnectScheduler::schedule() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_ || pending_ != INVALID_TIMER) {
        return false;
    }

    attempts_++;
    uint32_t delay = delay_ms_.load();
    spdlog::info("[Reconnect] Retry {} in {}ms", attempts_, delay);

    // A timer that lost a race with cancel() carries a stale generation
    uint64_t generation = ++generation_;
    pending_ = timers_.schedule(delay, [this, generation]() { on_timer(generation); });
    return true;
}

void ReconnectScheduler::on_timer(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || pending_ == INVALID_TIMER) {
            return;
        }
        pending_ = INVALID_TIMER;
        if (!enabled_) {
            return;
        }
    }
    invoke_attempt();
}

void ReconnectScheduler::retry_now() {
    TimerHandle to_cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_cancel = pending_;
        pending_ = INVALID_TIMER;
        generation_++;
        enabled_ = true;
    }
    if (to_cancel != INVALID_TIMER) {
        timers_.cancel(to_cancel);
    }
    spdlog::info("[Reconnect] Manual reconnect requested");
    invoke_attempt();
}

void ReconnectScheduler::on_connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempts_ > 0) {
        spdlog::debug("[Reconnect] Connected after {} retries", attempts_);
    }
    attempts_ = 0;
}

void ReconnectScheduler::enable() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = true;
}

void ReconnectScheduler::disable() {
    TimerHandle to_cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = false;
        to_cancel = pending_;
        pending_ = INVALID_TIMER;
        generation_++;
    }
    if (to_cancel != INVALID_TIMER) {
        timers_.cancel(to_cancel);
    }
}

uint32_t ReconnectScheduler::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

bool ReconnectScheduler::is_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ != INVALID_TIMER;
}

bool ReconnectScheduler::is_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void ReconnectScheduler::invoke_attempt() {
    try {
        attempt_();
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Reconnect] Reconnect attempt threw exception: {}", e.what());
    }
}

} // namespace devbridge
