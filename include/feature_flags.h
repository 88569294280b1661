// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace devbridge {

/**
 * @brief Boolean feature flags the agent can read and flip
 *
 * Thread-safe.
 */
class FeatureFlags {
  public:
    /// Register (or overwrite) several flags at once
    void register_flags(const std::map<std::string, bool>& flags);

    /// Unknown flags read as false
    [[nodiscard]] bool is_enabled(const std::string& name) const;

    /**
     * @brief Set a flag, or flip it when @p enabled is not given
     *
     * Unknown flags are created (starting from false).
     *
     * @return The new value
     */
    bool toggle(const std::string& name, std::optional<bool> enabled = std::nullopt);

    /// {name: bool, ...}
    [[nodiscard]] json to_json() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> flags_;
};

} // namespace devbridge
