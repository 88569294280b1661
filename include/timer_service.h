// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "hv/EventLoop.h"

namespace devbridge {

/// @brief Handle for a scheduled callback (valid IDs > 0)
using TimerHandle = uint64_t;

constexpr TimerHandle INVALID_TIMER = 0;

/**
 * @brief One-shot timer abstraction
 *
 * Request timeouts and reconnect delays are scheduled through this interface
 * so tests can drive time by hand.
 */
class TimerService {
  public:
    virtual ~TimerService() = default;

    /// Run @p fn once after @p delay_ms
    virtual TimerHandle schedule(uint32_t delay_ms, std::function<void()> fn) = 0;

    /// @return true if the timer was pending and will not fire
    virtual bool cancel(TimerHandle handle) = 0;
};

/**
 * @brief TimerService backed by a libhv event loop
 *
 * Callbacks run on the loop thread. schedule() and cancel() may be called
 * from any thread.
 */
class EventLoopTimerService : public TimerService {
  public:
    explicit EventLoopTimerService(hv::EventLoopPtr loop);
    ~EventLoopTimerService() override;

    EventLoopTimerService(const EventLoopTimerService&) = delete;
    EventLoopTimerService& operator=(const EventLoopTimerService&) = delete;

    TimerHandle schedule(uint32_t delay_ms, std::function<void()> fn) override;
    bool cancel(TimerHandle handle) override;

  private:
    // Shared with in-flight loop callbacks so they outlive this object safely
    struct State {
        std::mutex mutex;
        std::map<TimerHandle, hv::TimerID> pending;
        TimerHandle next_handle = 0;
    };

    hv::EventLoopPtr loop_;
    std::shared_ptr<State> state_;
};

} // namespace devbridge
