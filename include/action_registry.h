// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "json_utils.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace devbridge {

/**
 * @brief Completion handle passed to asynchronous actions
 *
 * Call exactly one of resolve() or reject(), from any thread.
 */
struct ActionReply {
    std::function<void(json)> resolve;
    std::function<void(const std::string&)> reject;
};

/**
 * @brief Named, remotely invokable operations
 *
 * Handlers take a single parameter object. Synchronous handlers return their
 * result; asynchronous ones complete through an ActionReply. Handlers are
 * copied out under the lock and invoked outside it.
 *
 * Thread-safe.
 */
class ActionRegistry {
  public:
    using SyncHandler = std::function<json(const json& params)>;
    using AsyncHandler = std::function<void(const json& params, ActionReply reply)>;
    using SuccessCallback = std::function<void(json)>;
    using ErrorCallback = std::function<void(const BridgeError&)>;

    ActionRegistry() = default;

    // Non-copyable (has mutex)
    ActionRegistry(const ActionRegistry&) = delete;
    ActionRegistry& operator=(const ActionRegistry&) = delete;

    /// Register or replace a synchronous action
    void register_action(const std::string& name, SyncHandler handler);

    /// Register or replace an asynchronous action
    void register_async_action(const std::string& name, AsyncHandler handler);

    bool unregister_action(const std::string& name);

    [[nodiscard]] bool has_action(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    /**
     * @brief Invoke an action
     *
     * Exactly one of @p on_success / @p on_error is called for a found action,
     * possibly later and on another thread for async handlers. A handler that
     * throws (synchronously) reports HANDLER_ERROR.
     *
     * @return false if no action is registered under @p name (no callback runs)
     */
    bool invoke(const std::string& name, const json& params, SuccessCallback on_success,
                ErrorCallback on_error) const;

  private:
    struct Entry {
        SyncHandler sync;
        AsyncHandler async;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> actions_;
};

} // namespace devbridge
