// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace devbridge {

/// @brief Handle returned by TraceEngine::trace() (valid IDs > 0)
using TraceId = uint64_t;

constexpr TraceId INVALID_TRACE_ID = 0;

/**
 * @brief One function invocation, active or finished
 */
struct TraceEntry {
    TraceId id = INVALID_TRACE_ID;
    std::string name;
    json args;
    std::string file;
    int64_t timestamp_ms = 0; ///< Wall clock at entry
    std::chrono::steady_clock::time_point start;
    std::optional<int64_t> duration_ms; ///< Set once returned
    json return_value;
    std::string error;
    bool completed = false;

    [[nodiscard]] json to_json() const;
};

/**
 * @brief Filter for TraceEngine::get_traces()
 */
struct TraceFilter {
    std::optional<std::string> name; ///< Case-insensitive regex over the name
    std::optional<std::string> file; ///< Case-insensitive regex over the file
    std::optional<int64_t> min_duration_ms;
    std::optional<int64_t> since_ms; ///< Only entries started within this many ms
    bool in_progress = false;        ///< Search active entries instead of history
    size_t limit = 100;
};

/**
 * @brief Function-level trace recorder
 *
 * Instrumented code calls trace() on entry and trace_return() with the
 * returned id on exit. Finished entries move to a bounded history.
 *
 * Thread-safe.
 */
class TraceEngine {
  public:
    static constexpr size_t DEFAULT_HISTORY_CAP = 1000;

    explicit TraceEngine(size_t history_cap = DEFAULT_HISTORY_CAP) : history_cap_(history_cap) {}

    // Non-copyable (has mutex)
    TraceEngine(const TraceEngine&) = delete;
    TraceEngine& operator=(const TraceEngine&) = delete;

    /// Open an active entry
    TraceId trace(const std::string& name, json args = json::array(), const std::string& file = "");

    /**
     * @brief Finish an active entry
     *
     * @param error Non-empty when the call failed
     * @return false if @p id is not active (unknown or already returned)
     */
    bool trace_return(TraceId id, json value = nullptr, const std::string& error = "");

    /**
     * @brief Query traces, most recent first
     *
     * @throws CommandError INVALID_PARAMS for an invalid name/file pattern
     */
    [[nodiscard]] json get_traces(const TraceFilter& filter) const;

    /// Active entries, most recent first
    [[nodiscard]] json get_active() const;

    /// Drop history and active entries; @return number of entries dropped
    size_t clear();

    [[nodiscard]] size_t history_size() const;
    [[nodiscard]] size_t active_count() const;

    /**
     * @brief Run @p fn between trace() and trace_return()
     *
     * The return value is recorded when it converts to JSON. Exceptions are
     * recorded as the entry's error and rethrown.
     */
    template <typename F>
    auto trace_sync(const std::string& name, F&& fn, json args = json::array())
        -> decltype(fn()) {
        TraceId id = trace(name, std::move(args));
        return run_traced(id, std::forward<F>(fn));
    }

    /// trace_sync() on a separate thread
    template <typename F>
    auto trace_async(const std::string& name, F fn, json args = json::array())
        -> std::future<decltype(fn())> {
        TraceId id = trace(name, std::move(args));
        return std::async(std::launch::async,
                          [this, id, fn = std::move(fn)]() mutable { return run_traced(id, fn); });
    }

  private:
    template <typename F> auto run_traced(TraceId id, F&& fn) -> decltype(fn()) {
        using R = decltype(fn());
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                trace_return(id);
            } else {
                R result = fn();
                if constexpr (std::is_constructible_v<json, const R&>) {
                    trace_return(id, json(result));
                } else {
                    trace_return(id);
                }
                return result;
            }
        } catch (const std::exception& e) {
            trace_return(id, nullptr, e.what());
            throw;
        }
    }

    mutable std::mutex mutex_;
    std::map<TraceId, TraceEntry> active_;
    std::deque<TraceEntry> history_; ///< Front is most recent
    size_t history_cap_;
    TraceId next_id_ = 0;
};

/**
 * @brief RAII trace: trace() on construction, trace_return() on destruction
 *
 * Use set_return()/set_error() before the scope ends to record an outcome.
 */
class TraceScope {
  public:
    TraceScope(TraceEngine& engine, const std::string& name, json args = json::array(),
               const std::string& file = "")
        : engine_(engine), id_(engine.trace(name, std::move(args), file)) {}

    ~TraceScope() {
        engine_.trace_return(id_, std::move(value_), error_);
    }

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

    void set_return(json value) {
        value_ = std::move(value);
    }

    void set_error(const std::string& error) {
        error_ = error;
    }

    [[nodiscard]] TraceId id() const {
        return id_;
    }

  private:
    TraceEngine& engine_;
    TraceId id_;
    json value_;
    std::string error_;
};

} // namespace devbridge
