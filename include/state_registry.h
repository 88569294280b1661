// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace devbridge {

/**
 * @brief Named read accessors for live application data
 *
 * Host code registers a zero-argument getter per key. Getters are copied
 * out under the lock and invoked outside it, so a slow or re-entrant getter
 * never blocks registration or other lookups.
 *
 * Thread-safe.
 */
class StateRegistry {
  public:
    using Getter = std::function<json()>;

    StateRegistry() = default;

    // Non-copyable (has mutex)
    StateRegistry(const StateRegistry&) = delete;
    StateRegistry& operator=(const StateRegistry&) = delete;

    /// Register or replace the getter for @p key
    void register_state(const std::string& key, Getter getter);

    /// @return true if a getter was removed
    bool unregister_state(const std::string& key);

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Evaluate every getter
     *
     * A getter that throws contributes error_marker() for its key instead of
     * a value; the other keys are unaffected.
     *
     * @return Object with one member per registered key
     */
    [[nodiscard]] json snapshot() const;

    /**
     * @brief Evaluate a single key
     *
     * @p key may be dotted ("user.profile.name"); the first segment names the
     * registered getter and the rest walk into its value. Numeric segments
     * index arrays. A key that is registered verbatim (dots included) wins
     * over the dotted interpretation.
     *
     * @throws CommandError INVALID_PARAMS if the key or path does not exist,
     *         HANDLER_ERROR if the getter throws
     */
    [[nodiscard]] json get(const std::string& key) const;

    /// Value substituted for a getter that threw
    static std::string error_marker(const std::string& what) {
        return "<error: " + what + ">";
    }

  private:
    Getter find_getter(const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, Getter> getters_;
};

} // namespace devbridge
