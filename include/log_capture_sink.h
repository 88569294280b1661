// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <spdlog/sinks/base_sink.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace devbridge {

/**
 * @brief Query over captured log records
 */
struct LogQuery {
    std::optional<spdlog::level::level_enum> level; ///< Exact level match
    std::optional<spdlog::level::level_enum> min_level;
    std::optional<std::string> contains; ///< Substring of the message
    size_t limit = 100;
};

/**
 * @brief spdlog sink keeping the most recent records for remote inspection
 *
 * Attach it to the default logger (logging::init does this when given the
 * sink). Records whose message starts with the ignore prefix are not kept,
 * so the bridge's own chatter does not crowd out the application's logs.
 */
class LogCaptureSink : public spdlog::sinks::base_sink<std::mutex> {
  public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit LogCaptureSink(size_t capacity = DEFAULT_CAPACITY, std::string ignore_prefix = "");

    /// Matching records, most recent first, as [{level, message, logger, timestamp}]
    [[nodiscard]] json query(const LogQuery& query);

    [[nodiscard]] size_t size();
    void clear();

  protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

  private:
    struct Record {
        spdlog::level::level_enum level;
        std::string logger;
        std::string message;
        int64_t timestamp_ms;
    };

    // Guarded by base_sink::mutex_
    std::deque<Record> records_;
    size_t capacity_;
    std::string ignore_prefix_;
};

} // namespace devbridge
