// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <string>

namespace devbridge {

/// Platform name advertised in handshakes ("linux", "macos", "android", ...)
std::string detect_platform();

/// Hostname, or "unknown" if it cannot be read
std::string host_name();

/**
 * @brief Describe the machine and process for get_device_info
 *
 * @return {deviceId, platform, os:{name, release, version, machine}, hostname, pid}
 */
json collect_device_info(const std::string& device_id);

} // namespace devbridge
