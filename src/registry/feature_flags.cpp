// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "feature_flags.h"

#include <spdlog/spdlog.h>

namespace devbridge {

void FeatureFlags::register_flags(const std::map<std::string, bool>& flags) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, value] : flags) {
        flags_[name] = value;
    }
}

bool FeatureFlags::is_enabled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = flags_.find(name);
    return it != flags_.end() && it->second;
}

bool FeatureFlags::toggle(const std::string& name, std::optional<bool> enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool& value = flags_[name];
    value = enabled ? *enabled : !value;
    spdlog::info("[Feature Flags] {} = {}", name, value);
    return value;
}

json FeatureFlags::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json result = json::object();
    for (const auto& [name, value] : flags_) {
        result[name] = value;
    }
    return result;
}

} // namespace devbridge
