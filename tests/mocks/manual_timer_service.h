// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "timer_service.h"

#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace devbridge {

/**
 * @brief TimerService driven by hand from the test thread
 *
 * advance() fires every timer whose deadline has passed, in deadline order.
 * Callbacks may schedule or cancel other timers.
 */
class ManualTimerService : public TimerService {
  public:
    TimerHandle schedule(uint32_t delay_ms, std::function<void()> fn) override {
        TimerHandle handle = ++next_handle_;
        timers_[handle] = Timer{now_ms_ + delay_ms, std::move(fn)};
        ++scheduled_count_;
        return handle;
    }

    bool cancel(TimerHandle handle) override {
        return timers_.erase(handle) > 0;
    }

    void advance(uint64_t ms) {
        uint64_t target = now_ms_ + ms;
        while (true) {
            auto due = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline <= target &&
                    (due == timers_.end() || it->second.deadline < due->second.deadline)) {
                    due = it;
                }
            }
            if (due == timers_.end()) {
                break;
            }
            now_ms_ = due->second.deadline;
            auto fn = std::move(due->second.fn);
            timers_.erase(due);
            fn();
        }
        now_ms_ = target;
    }

    [[nodiscard]] size_t pending() const {
        return timers_.size();
    }

    [[nodiscard]] size_t scheduled_count() const {
        return scheduled_count_;
    }

    [[nodiscard]] uint64_t now() const {
        return now_ms_;
    }

  private:
    struct Timer {
        uint64_t deadline;
        std::function<void()> fn;
    };

    std::map<TimerHandle, Timer> timers_;
    TimerHandle next_handle_ = 0;
    uint64_t now_ms_ = 0;
    size_t scheduled_count_ = 0;
};

} // namespace devbridge
