// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_protocol.h"
#include "device_link.h"
#include "json_utils.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace devbridge {

/**
 * @brief A connected, handshaken application instance
 */
struct DeviceInfo {
    std::string id;
    std::string platform;
    std::string app_name;
    std::string app_version;
    std::vector<std::string> capabilities;
    int64_t connected_at_ms = 0;
    int64_t last_seen_ms = 0;

    [[nodiscard]] json to_json() const;
};

/**
 * @brief Connected devices keyed by device id
 *
 * A device id denotes at most one live link: registering an id that is
 * already present supersedes the older link, which is closed. A link owns at
 * most one registration: handshaking again under a new id drops the link's
 * previous id. Removal is by link, so the superseded link's eventual close
 * does not remove the newer registration.
 *
 * Thread-safe.
 */
class DeviceRegistry {
  public:
    DeviceRegistry() = default;

    // Non-copyable (has mutex)
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Register a device from its handshake
     *
     * @param previous_id Output (optional): id @p link was registered under
     *        before, when it differs from the handshake's id
     * @return true if an older link for the same id was superseded (and closed)
     */
    bool register_device(const HandshakeFrame& handshake, std::shared_ptr<DeviceLink> link,
                         std::string* previous_id = nullptr);

    /**
     * @brief Remove the registration owned by @p link
     *
     * @return The removed device id, or nullopt if @p link owns no registration
     */
    std::optional<std::string> remove_link(const DeviceLink* link);

    /// Refresh last-seen for the device owning @p link
    void touch(const DeviceLink* link);

    [[nodiscard]] std::shared_ptr<DeviceLink> link_for(const std::string& device_id) const;

    /// Device id registered through @p link, if any
    [[nodiscard]] std::optional<std::string> device_for(const DeviceLink* link) const;

    /// Most recently active device
    [[nodiscard]] std::optional<std::string> primary_device() const;

    [[nodiscard]] std::optional<DeviceInfo> get(const std::string& device_id) const;
    [[nodiscard]] std::vector<DeviceInfo> list() const;
    [[nodiscard]] size_t size() const;

  private:
    struct Entry {
        DeviceInfo info;
        std::shared_ptr<DeviceLink> link;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> devices_;
};

} // namespace devbridge
