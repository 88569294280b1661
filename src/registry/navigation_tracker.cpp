// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_tracker.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace devbridge {

NavigationTracker::NavigationTracker(std::string initial_route, size_t history_cap)
    : current_route_(std::move(initial_route)), history_cap_(history_cap) {}

void NavigationTracker::set_navigation_state(const std::string& route, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(HistoryEntry{current_route_, json_util::now_epoch_ms()});
    while (history_.size() > history_cap_) {
        history_.pop_front();
    }
    spdlog::debug("[Navigation] {} -> {}", current_route_, route);
    current_route_ = route;
    params_ = params.is_null() ? json::object() : params;
}

std::string NavigationTracker::current_route() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_route_;
}

size_t NavigationTracker::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

json NavigationTracker::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json history = json::array();
    for (const auto& entry : history_) {
        history.push_back({{"route", entry.route}, {"timestamp", entry.timestamp_ms}});
    }
    return {{"currentRoute", current_route_},
            {"params", params_},
            {"history", history},
            {"historyLength", history_.size()}};
}

} // namespace devbridge
