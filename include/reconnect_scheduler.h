// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "timer_service.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace devbridge {

/**
 * @brief Fixed-delay reconnect loop
 *
 * After a failure, schedule() arms a single timer that calls the attempt
 * function after the configured delay. While a timer is pending further
 * schedule() calls are no-ops. The attempt counter counts scheduled retries
 * and resets on a successful connect.
 *
 * Thread-safe.
 */
class ReconnectScheduler {
  public:
    static constexpr uint32_t DEFAULT_DELAY_MS = 3000;

    ReconnectScheduler(TimerService& timers, std::function<void()> attempt,
                       uint32_t delay_ms = DEFAULT_DELAY_MS);
    ~ReconnectScheduler();

    ReconnectScheduler(const ReconnectScheduler&) = delete;
    ReconnectScheduler& operator=(const ReconnectScheduler&) = delete;

    /**
     * @brief Arm a retry after the delay
     *
     * @return true if a timer was armed; false if one was already pending or
     *         retries are disabled
     */
    bool schedule();

    /// Cancel any pending timer and attempt right away (re-enables retries)
    void retry_now();

    /// Successful connect: reset the attempt counter
    void on_connected();

    /// Allow schedule() to arm timers (the initial state)
    void enable();

    /// Cancel any pending timer and refuse to schedule until enable()
    void disable();

    void set_delay(uint32_t delay_ms) {
        delay_ms_ = delay_ms;
    }

    [[nodiscard]] uint32_t delay_ms() const {
        return delay_ms_;
    }

    [[nodiscard]] uint32_t attempts() const;
    [[nodiscard]] bool is_pending() const;
    [[nodiscard]] bool is_enabled() const;

  private:
    void on_timer(uint64_t generation);
    void invoke_attempt();

    TimerService& timers_;
    std::function<void()> attempt_;
    std::atomic<uint32_t> delay_ms_;

    mutable std::mutex mutex_;
    TimerHandle pending_ = INVALID_TIMER;
    uint64_t generation_ = 0;
    uint32_t attempts_ = 0;
    bool enabled_ = true;
};

} // namespace devbridge
