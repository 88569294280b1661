// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_registry.h"

#include "bridge_error.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

namespace devbridge {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

bool is_index(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

/// Walk @p segments (starting at @p first) into @p value; false if any step is missing
bool walk(const json& value, const std::vector<std::string>& segments, size_t first, json& out) {
    const json* node = &value;
    for (size_t i = first; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (node->is_object()) {
            auto it = node->find(seg);
            if (it == node->end()) {
                return false;
            }
            node = &(*it);
        } else if (node->is_array() && is_index(seg)) {
            size_t idx = std::stoul(seg);
            if (idx >= node->size()) {
                return false;
            }
            node = &(*node)[idx];
        } else {
            return false;
        }
    }
    out = *node;
    return true;
}

} // namespace

void StateRegistry::register_state(const std::string& key, Getter getter) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool replaced = getters_.count(key) > 0;
    getters_[key] = std::move(getter);
    spdlog::debug("[State Registry] {} state '{}'", replaced ? "Replaced" : "Registered", key);
}

bool StateRegistry::unregister_state(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return getters_.erase(key) > 0;
}

std::vector<std::string> StateRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(getters_.size());
    for (const auto& [key, getter] : getters_) {
        result.push_back(key);
    }
    return result;
}

size_t StateRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getters_.size();
}

json StateRegistry::snapshot() const {
    // Copy getters under lock, invoke outside lock
    std::vector<std::pair<std::string, Getter>> getters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        getters.assign(getters_.begin(), getters_.end());
    }

    json result = json::object();
    for (const auto& [key, getter] : getters) {
        try {
            result[key] = getter();
        } catch (const std::exception& e) {
            spdlog::warn("[State Registry] Getter for '{}' threw: {}", key, e.what());
            result[key] = error_marker(e.what());
        }
    }
    return result;
}

StateRegistry::Getter StateRegistry::find_getter(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = getters_.find(key);
    if (it != getters_.end()) {
        return it->second;
    }
    return nullptr;
}

json StateRegistry::get(const std::string& key) const {
    std::vector<std::string> segments;
    Getter getter = find_getter(key);
    if (getter) {
        segments.push_back(key);
    } else {
        segments = split_path(key);
        getter = find_getter(segments.front());
    }

    if (!getter) {
        throw CommandError(BridgeErrorType::INVALID_PARAMS, "State key not registered: " + key);
    }

    json value;
    try {
        value = getter();
    } catch (const std::exception& e) {
        throw CommandError(BridgeErrorType::HANDLER_ERROR,
                           "State getter '" + segments.front() + "' failed: " + e.what());
    }

    json out;
    if (!walk(value, segments, 1, out)) {
        throw CommandError(BridgeErrorType::INVALID_PARAMS, "State path not found: " + key);
    }
    return out;
}

} // namespace devbridge
