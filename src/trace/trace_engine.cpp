// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trace_engine.h"

#include "bridge_error.h"

#include <spdlog/spdlog.h>

#include <regex>

namespace devbridge {

namespace {

std::optional<std::regex> compile_filter(const std::optional<std::string>& pattern,
                                         const char* what) {
    if (!pattern || pattern->empty()) {
        return std::nullopt;
    }
    try {
        return std::regex(*pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw CommandError(BridgeErrorType::INVALID_PARAMS,
                           std::string("Invalid ") + what + " pattern '" + *pattern + "': " +
                               e.what());
    }
}

} // namespace

json TraceEntry::to_json() const {
    json j = {{"id", id},
              {"name", name},
              {"args", args},
              {"timestamp", timestamp_ms},
              {"completed", completed}};
    if (!file.empty()) {
        j["file"] = file;
    }
    if (duration_ms) {
        j["duration"] = *duration_ms;
    }
    if (completed) {
        j["returnValue"] = return_value;
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

TraceId TraceEngine::trace(const std::string& name, json args, const std::string& file) {
    TraceEntry entry;
    entry.name = name;
    entry.args = std::move(args);
    entry.file = file;
    entry.timestamp_ms = json_util::now_epoch_ms();
    entry.start = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    entry.id = ++next_id_;
    TraceId id = entry.id;
    active_.emplace(id, std::move(entry));
    spdlog::trace("[Trace Engine] Enter {} (id {})", name, id);
    return id;
}

bool TraceEngine::trace_return(TraceId id, json value, const std::string& error) {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        spdlog::debug("[Trace Engine] trace_return for unknown id {}", id);
        return false;
    }

    TraceEntry entry = std::move(it->second);
    active_.erase(it);

    entry.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.start).count();
    entry.return_value = std::move(value);
    entry.error = error;
    entry.completed = true;
    spdlog::trace("[Trace Engine] Return {} (id {}) after {}ms", entry.name, id,
                  *entry.duration_ms);

    history_.push_front(std::move(entry));
    while (history_.size() > history_cap_) {
        history_.pop_back();
    }
    return true;
}

json TraceEngine::get_traces(const TraceFilter& filter) const {
    auto name_re = compile_filter(filter.name, "name");
    auto file_re = compile_filter(filter.file, "file");
    int64_t cutoff = filter.since_ms ? json_util::now_epoch_ms() - *filter.since_ms : 0;

    auto matches = [&](const TraceEntry& e) {
        if (name_re && !std::regex_search(e.name, *name_re)) {
            return false;
        }
        if (file_re && !std::regex_search(e.file, *file_re)) {
            return false;
        }
        if (filter.min_duration_ms && (!e.duration_ms || *e.duration_ms < *filter.min_duration_ms)) {
            return false;
        }
        if (filter.since_ms && e.timestamp_ms < cutoff) {
            return false;
        }
        return true;
    };

    json result = json::array();
    std::lock_guard<std::mutex> lock(mutex_);
    if (filter.in_progress) {
        // Ids are monotonic, so reverse map order is most recent first
        for (auto it = active_.rbegin(); it != active_.rend() && result.size() < filter.limit;
             ++it) {
            if (matches(it->second)) {
                result.push_back(it->second.to_json());
            }
        }
        return result;
    }

    for (const auto& e : history_) {
        if (result.size() >= filter.limit) {
            break;
        }
        if (matches(e)) {
            result.push_back(e.to_json());
        }
    }
    return result;
}

json TraceEngine::get_active() const {
    TraceFilter filter;
    filter.in_progress = true;
    filter.limit = SIZE_MAX;
    return get_traces(filter);
}

size_t TraceEngine::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = history_.size() + active_.size();
    history_.clear();
    active_.clear();
    spdlog::debug("[Trace Engine] Cleared {} traces", count);
    return count;
}

size_t TraceEngine::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

size_t TraceEngine::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace devbridge
