// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "timer_service.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace devbridge {

EventLoopTimerService::EventLoopTimerService(hv::EventLoopPtr loop)
    : loop_(std::move(loop)), state_(std::make_shared<State>()) {}

EventLoopTimerService::~EventLoopTimerService() {
    std::map<TimerHandle, hv::TimerID> pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        pending.swap(state_->pending);
    }
    for (const auto& [handle, timer_id] : pending) {
        loop_->killTimer(timer_id);
    }
}

TimerHandle EventLoopTimerService::schedule(uint32_t delay_ms, std::function<void()> fn) {
    TimerHandle handle;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        handle = ++state_->next_handle;
        state_->pending[handle] = INVALID_TIMER_ID;
    }

    std::weak_ptr<State> weak_state = state_;
    hv::TimerID timer_id = loop_->setTimeout(
        static_cast<int>(delay_ms), [weak_state, handle, fn = std::move(fn)](hv::TimerID) {
            auto state = weak_state.lock();
            if (!state) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->pending.erase(handle) == 0) {
                    return; // Cancelled
                }
            }
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[Timer Service] Timer callback threw exception: {}", e.what());
            }
        });

    // The timer may already have fired on the loop thread; only record the
    // libhv id while the handle is still pending
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->pending.find(handle);
    if (it != state_->pending.end()) {
        it->second = timer_id;
    }
    return handle;
}

bool EventLoopTimerService::cancel(TimerHandle handle) {
    hv::TimerID timer_id;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->pending.find(handle);
        if (it == state_->pending.end()) {
            return false;
        }
        timer_id = it->second;
        state_->pending.erase(it);
    }
    if (timer_id != INVALID_TIMER_ID) {
        loop_->killTimer(timer_id);
    }
    return true;
}

} // namespace devbridge
