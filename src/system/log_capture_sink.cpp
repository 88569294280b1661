// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "log_capture_sink.h"

#include <chrono>
#include <utility>

namespace devbridge {

LogCaptureSink::LogCaptureSink(size_t capacity, std::string ignore_prefix)
    : capacity_(capacity), ignore_prefix_(std::move(ignore_prefix)) {}

void LogCaptureSink::sink_it_(const spdlog::details::log_msg& msg) {
    std::string text(msg.payload.data(), msg.payload.size());
    if (!ignore_prefix_.empty() && text.compare(0, ignore_prefix_.size(), ignore_prefix_) == 0) {
        return;
    }

    Record rec;
    rec.level = msg.level;
    rec.logger = std::string(msg.logger_name.data(), msg.logger_name.size());
    rec.message = std::move(text);
    rec.timestamp_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(msg.time.time_since_epoch()).count();

    records_.push_back(std::move(rec));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

json LogCaptureSink::query(const LogQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    json result = json::array();
    for (auto it = records_.rbegin(); it != records_.rend() && result.size() < query.limit; ++it) {
        if (query.level && it->level != *query.level) {
            continue;
        }
        if (query.min_level && it->level < *query.min_level) {
            continue;
        }
        if (query.contains && it->message.find(*query.contains) == std::string::npos) {
            continue;
        }
        auto level_name = spdlog::level::to_string_view(it->level);
        result.push_back({{"level", std::string(level_name.data(), level_name.size())},
                          {"message", it->message},
                          {"logger", it->logger},
                          {"timestamp", it->timestamp_ms}});
    }
    return result;
}

size_t LogCaptureSink::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void LogCaptureSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

} // namespace devbridge
