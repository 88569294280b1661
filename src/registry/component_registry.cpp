// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "component_registry.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devbridge {

namespace {

/// Invoke the text accessor; failures read as no text
std::optional<std::string> read_text(const ComponentSpec& comp) {
    if (!comp.get_text) {
        return std::nullopt;
    }
    try {
        return comp.get_text();
    } catch (const std::exception& e) {
        LOG_WARN_INTERNAL("[Component Registry] Text accessor for '{}' threw: {}", comp.test_id,
                          e.what());
        return std::nullopt;
    }
}

json text_or_null(const ComponentSpec& comp) {
    auto text = read_text(comp);
    return text ? json(*text) : json(nullptr);
}

json bounds_or_null(const ComponentSpec& comp) {
    return comp.bounds ? comp.bounds->to_json() : json(nullptr);
}

} // namespace

void ComponentRegistry::register_component(ComponentSpec spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(components_.begin(), components_.end(),
                           [&](const ComponentSpec& c) { return c.test_id == spec.test_id; });
    if (it != components_.end()) {
        *it = std::move(spec);
        return;
    }
    spdlog::trace("[Component Registry] Registered '{}' ({})", spec.test_id, spec.type);
    components_.push_back(std::move(spec));
}

bool ComponentRegistry::unregister_component(const std::string& test_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(components_.begin(), components_.end(),
                           [&](const ComponentSpec& c) { return c.test_id == test_id; });
    if (it == components_.end()) {
        return false;
    }
    components_.erase(it);
    return true;
}

bool ComponentRegistry::update_bounds(const std::string& test_id, const Bounds& bounds) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& c : components_) {
        if (c.test_id == test_id) {
            c.bounds = bounds;
            return true;
        }
    }
    return false;
}

size_t ComponentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_.size();
}

std::optional<ComponentSpec> ComponentRegistry::get(const std::string& test_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : components_) {
        if (c.test_id == test_id) {
            return c;
        }
    }
    return std::nullopt;
}

std::vector<ComponentSpec> ComponentRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_;
}

json ComponentRegistry::find(const ComponentQuery& query) const {
    json elements = json::array();
    for (const auto& comp : snapshot()) {
        if (query.test_id && comp.test_id != *query.test_id) {
            continue;
        }
        if (query.type && comp.type != *query.type) {
            continue;
        }
        auto text = read_text(comp);
        if (query.text && (!text || *text != *query.text)) {
            continue;
        }
        elements.push_back({{"testId", comp.test_id},
                            {"type", comp.type},
                            {"bounds", bounds_or_null(comp)},
                            {"text", text ? json(*text) : json(nullptr)}});
    }
    return {{"found", !elements.empty()}, {"count", elements.size()}, {"elements", elements}};
}

std::optional<ComponentSpec> ComponentRegistry::hit_test(double x, double y) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : components_) {
        if (c.bounds && c.bounds->contains(x, y)) {
            return c;
        }
    }
    return std::nullopt;
}

json ComponentRegistry::inspect(double x, double y) const {
    auto comp = hit_test(x, y);
    if (!comp) {
        return {{"found", false}, {"x", x}, {"y", y}};
    }
    return {{"found", true},
            {"testId", comp->test_id},
            {"type", comp->type},
            {"bounds", bounds_or_null(*comp)},
            {"props", comp->props},
            {"text", text_or_null(*comp)},
            {"interactive", static_cast<bool>(comp->on_tap || comp->on_text_input)}};
}

json ComponentRegistry::element_text(const std::string& test_id) const {
    auto comp = get(test_id);
    if (!comp) {
        return {{"found", false}, {"testId", test_id}};
    }
    return {{"found", true}, {"testId", test_id}, {"text", text_or_null(*comp)}, {"type", comp->type}};
}

json ComponentRegistry::simulate(const std::string& verb, const std::optional<std::string>& test_id,
                                 const std::optional<std::pair<double, double>>& point,
                                 const std::optional<std::string>& value) const {
    std::optional<ComponentSpec> comp;
    json target = json::object();
    if (test_id) {
        comp = get(*test_id);
        target["testId"] = *test_id;
    } else if (point) {
        comp = hit_test(point->first, point->second);
        target["x"] = point->first;
        target["y"] = point->second;
    }

    if (!comp) {
        return {{"success", false}, {"error", "Element not found"}, {"target", target}};
    }

    try {
        if (verb == "tap" || verb == "press") {
            if (!comp->on_tap) {
                return {{"success", false},
                        {"error", "Element is not pressable"},
                        {"testId", comp->test_id}};
            }
            comp->on_tap();
            spdlog::debug("[Component Registry] Simulated tap on '{}'", comp->test_id);
            return {{"success", true}, {"action", "tap"}, {"testId", comp->test_id}};
        }

        if (verb == "input" || verb == "type") {
            if (!comp->on_text_input || !value || value->empty()) {
                return {{"success", false},
                        {"error", "Element does not accept text input"},
                        {"testId", comp->test_id}};
            }
            comp->on_text_input(*value);
            spdlog::debug("[Component Registry] Simulated input on '{}'", comp->test_id);
            return {{"success", true},
                    {"action", "input"},
                    {"testId", comp->test_id},
                    {"value", *value}};
        }
    } catch (const std::exception& e) {
        spdlog::warn("[Component Registry] Interaction '{}' on '{}' threw: {}", verb,
                     comp->test_id, e.what());
        return {{"success", false}, {"error", e.what()}, {"testId", comp->test_id}};
    }

    return {{"success", false}, {"error", "Unknown interaction type: " + verb}};
}

json ComponentRegistry::component_tree(bool include_props) const {
    json components = json::array();
    json test_ids = json::array();
    for (const auto& comp : snapshot()) {
        json node = {{"testId", comp.test_id},
                     {"type", comp.type},
                     {"bounds", bounds_or_null(comp)},
                     {"hasOnPress", static_cast<bool>(comp.on_tap)},
                     {"hasOnChangeText", static_cast<bool>(comp.on_text_input)},
                     {"children", comp.children}};
        if (include_props && !comp.props.empty()) {
            node["props"] = comp.props;
        }
        components.push_back(std::move(node));
        test_ids.push_back(comp.test_id);
    }
    return {{"componentCount", components.size()},
            {"components", components},
            {"registeredTestIds", test_ids}};
}

json ComponentRegistry::layout_tree(bool include_hidden) const {
    json elements = json::array();
    for (const auto& comp : snapshot()) {
        if (!comp.bounds && !include_hidden) {
            continue;
        }
        elements.push_back({{"testId", comp.test_id},
                            {"type", comp.type},
                            {"bounds", comp.bounds ? comp.bounds->to_json() : Bounds{}.to_json()},
                            {"visible", comp.bounds.has_value()}});
    }
    return {{"elementCount", elements.size()}, {"elements", elements}};
}

} // namespace devbridge
