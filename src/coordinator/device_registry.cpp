// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_registry.h"

#include <spdlog/spdlog.h>

namespace devbridge {

json DeviceInfo::to_json() const {
    return {{"deviceId", id},
            {"platform", platform},
            {"appName", app_name},
            {"appVersion", app_version},
            {"capabilities", capabilities},
            {"connectedAt", connected_at_ms},
            {"lastSeen", last_seen_ms}};
}

bool DeviceRegistry::register_device(const HandshakeFrame& handshake,
                                     std::shared_ptr<DeviceLink> link, std::string* previous_id) {
    Entry entry;
    entry.info.id = handshake.device_id;
    entry.info.platform = handshake.platform;
    entry.info.app_name = handshake.app_name;
    entry.info.app_version = handshake.app_version;
    entry.info.capabilities = handshake.capabilities;
    entry.info.connected_at_ms = json_util::now_epoch_ms();
    entry.info.last_seen_ms = entry.info.connected_at_ms;
    entry.link = std::move(link);

    std::shared_ptr<DeviceLink> superseded;
    std::string renamed_from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto old = devices_.begin(); old != devices_.end(); ++old) {
            if (old->second.link == entry.link && old->first != handshake.device_id) {
                renamed_from = old->first;
                devices_.erase(old);
                break;
            }
        }

        auto it = devices_.find(handshake.device_id);
        if (it != devices_.end()) {
            if (it->second.link != entry.link) {
                superseded = it->second.link;
            }
            it->second = std::move(entry);
        } else {
            devices_.emplace(handshake.device_id, std::move(entry));
        }
    }

    if (!renamed_from.empty()) {
        spdlog::info("[Device Registry] Device {} re-registered as {}", renamed_from,
                     handshake.device_id);
    }
    if (previous_id) {
        *previous_id = renamed_from;
    }

    // Close outside the lock; the close callback re-enters remove_link()
    if (superseded) {
        spdlog::info("[Device Registry] Device {} reconnected - closing previous link {}",
                     handshake.device_id, superseded->peer());
        superseded->close();
        return true;
    }

    spdlog::info("[Device Registry] Device {} registered ({} {} on {})", handshake.device_id,
                 handshake.app_name, handshake.app_version, handshake.platform);
    return false;
}

std::optional<std::string> DeviceRegistry::remove_link(const DeviceLink* link) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = devices_.begin(); it != devices_.end(); ++it) {
        if (it->second.link.get() == link) {
            std::string id = it->first;
            devices_.erase(it);
            spdlog::info("[Device Registry] Device {} removed", id);
            return id;
        }
    }
    return std::nullopt;
}

void DeviceRegistry::touch(const DeviceLink* link) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entry] : devices_) {
        if (entry.link.get() == link) {
            entry.info.last_seen_ms = json_util::now_epoch_ms();
            return;
        }
    }
}

std::shared_ptr<DeviceLink> DeviceRegistry::link_for(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    return it == devices_.end() ? nullptr : it->second.link;
}

std::optional<std::string> DeviceRegistry::device_for(const DeviceLink* link) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : devices_) {
        if (entry.link.get() == link) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DeviceRegistry::primary_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* best = nullptr;
    for (const auto& [id, entry] : devices_) {
        if (!best || entry.info.last_seen_ms > best->info.last_seen_ms ||
            (entry.info.last_seen_ms == best->info.last_seen_ms &&
             entry.info.connected_at_ms > best->info.connected_at_ms)) {
            best = &entry;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return best->info.id;
}

std::optional<DeviceInfo> DeviceRegistry::get(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<DeviceInfo> DeviceRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceInfo> result;
    result.reserve(devices_.size());
    for (const auto& [id, entry] : devices_) {
        result.push_back(entry.info);
    }
    return result;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

} // namespace devbridge
