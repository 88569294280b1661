// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace devbridge {

/**
 * @brief Current route, its params and a bounded history of prior routes
 *
 * Thread-safe.
 */
class NavigationTracker {
  public:
    static constexpr size_t DEFAULT_HISTORY_CAP = 20;

    explicit NavigationTracker(std::string initial_route = "home",
                               size_t history_cap = DEFAULT_HISTORY_CAP);

    /**
     * @brief Record a navigation
     *
     * Pushes the previous route onto the history (dropping the oldest entries
     * beyond the cap), then replaces the current route and params.
     */
    void set_navigation_state(const std::string& route, const json& params = json::object());

    [[nodiscard]] std::string current_route() const;
    [[nodiscard]] size_t history_size() const;

    /// {currentRoute, params, history:[{route, timestamp}], historyLength}
    [[nodiscard]] json to_json() const;

  private:
    struct HistoryEntry {
        std::string route;
        int64_t timestamp_ms;
    };

    mutable std::mutex mutex_;
    std::string current_route_;
    json params_ = json::object();
    std::deque<HistoryEntry> history_;
    size_t history_cap_;
};

} // namespace devbridge
