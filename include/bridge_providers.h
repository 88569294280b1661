// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <optional>
#include <string>
#include <vector>

namespace devbridge {

/**
 * @brief Host hook for the native view hierarchy and screenshots
 *
 * Installed with BridgeClient::set_ui_provider(). Both calls may throw;
 * failures are reported to the agent as handler errors.
 */
class UiProvider {
  public:
    virtual ~UiProvider() = default;

    /// Toolkit-specific hierarchy, merged into get_component_tree results
    virtual json view_hierarchy() = 0;

    /// Screenshot as a base64-encoded PNG
    virtual std::string capture_screenshot() = 0;
};

/**
 * @brief Host hook for persistent key-value storage
 */
class StorageProvider {
  public:
    virtual ~StorageProvider() = default;

    virtual std::vector<std::string> keys() = 0;

    /// nullopt when @p key is absent
    virtual std::optional<std::string> get(const std::string& key) = 0;
};

} // namespace devbridge
