// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "action_registry.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <utility>

namespace devbridge {

void ActionRegistry::register_action(const std::string& name, SyncHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    actions_[name] = Entry{std::move(handler), nullptr};
    spdlog::debug("[Action Registry] Registered action '{}'", name);
}

void ActionRegistry::register_async_action(const std::string& name, AsyncHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    actions_[name] = Entry{nullptr, std::move(handler)};
    spdlog::debug("[Action Registry] Registered async action '{}'", name);
}

bool ActionRegistry::unregister_action(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.erase(name) > 0;
}

bool ActionRegistry::has_action(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.count(name) > 0;
}

std::vector<std::string> ActionRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(actions_.size());
    for (const auto& [name, entry] : actions_) {
        result.push_back(name);
    }
    return result;
}

bool ActionRegistry::invoke(const std::string& name, const json& params,
                            SuccessCallback on_success, ErrorCallback on_error) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = actions_.find(name);
        if (it == actions_.end()) {
            return false;
        }
        entry = it->second;
    }

    spdlog::debug("[Action Registry] Executing action '{}'", name);

    if (entry.sync) {
        json result;
        try {
            result = entry.sync(params);
        } catch (const std::exception& e) {
            spdlog::warn("[Action Registry] Action '{}' threw: {}", name, e.what());
            on_error(BridgeError::handler_error(std::string("Action failed: ") + e.what(), name));
            return true;
        }
        on_success(std::move(result));
        return true;
    }

    // Shared flag so a throwing handler that already replied is not reported twice
    auto settled = std::make_shared<std::atomic<bool>>(false);
    ActionReply reply;
    reply.resolve = [on_success, settled](json result) {
        if (!settled->exchange(true)) {
            on_success(std::move(result));
        }
    };
    reply.reject = [on_error, settled, name](const std::string& message) {
        if (!settled->exchange(true)) {
            on_error(BridgeError::handler_error("Action failed: " + message, name));
        }
    };

    try {
        entry.async(params, reply);
    } catch (const std::exception& e) {
        spdlog::warn("[Action Registry] Async action '{}' threw: {}", name, e.what());
        reply.reject(e.what());
    }
    return true;
}

} // namespace devbridge
