// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace devbridge {

/**
 * @brief Screen-space rectangle of a component
 */
struct Bounds {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    /// Inclusive on all edges
    [[nodiscard]] bool contains(double px, double py) const {
        return px >= x && px <= x + width && py >= y && py <= y + height;
    }

    [[nodiscard]] json to_json() const {
        return {{"x", x}, {"y", y}, {"width", width}, {"height", height}};
    }
};

/**
 * @brief A UI element registered for inspection and interaction
 */
struct ComponentSpec {
    std::string test_id;
    std::string type;
    std::optional<Bounds> bounds;
    std::function<void()> on_tap;                          ///< Present if pressable
    std::function<void(const std::string&)> on_text_input; ///< Present if editable
    std::function<std::string()> get_text;                 ///< Present if it shows text
    json props = json::object();                           ///< Static properties
    std::vector<std::string> children;                     ///< Child testIds
};

/**
 * @brief Filter for find(); unset members match anything
 */
struct ComponentQuery {
    std::optional<std::string> test_id;
    std::optional<std::string> type;
    std::optional<std::string> text; ///< Exact match against the text accessor
};

/**
 * @brief Registry of UI components keyed by testId
 *
 * Registration order is preserved and decides which component wins a hit test
 * when bounds overlap. Callbacks are copied out under the lock before they run.
 *
 * Thread-safe.
 */
class ComponentRegistry {
  public:
    ComponentRegistry() = default;

    // Non-copyable (has mutex)
    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    /// Register or replace; a replaced component keeps its original position
    void register_component(ComponentSpec spec);
    bool unregister_component(const std::string& test_id);

    /// Update bounds after a layout pass; false if the testId is unknown
    bool update_bounds(const std::string& test_id, const Bounds& bounds);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::optional<ComponentSpec> get(const std::string& test_id) const;

    /// AND over the set filters; each match is {testId, type, bounds?, text?}
    [[nodiscard]] json find(const ComponentQuery& query) const;

    /// First component (registration order) whose bounds contain the point
    [[nodiscard]] std::optional<ComponentSpec> hit_test(double x, double y) const;

    /// {found, testId, type, bounds, props, text, interactive} or {found:false, x, y}
    [[nodiscard]] json inspect(double x, double y) const;

    /// {found, testId, text, type} or {found:false, testId}
    [[nodiscard]] json element_text(const std::string& test_id) const;

    /**
     * @brief Perform a tap or text input on a component
     *
     * Never throws for a missing element or capability; those are reported
     * as {success:false, error}.
     *
     * @param verb "tap"/"press" or "input"/"type"
     * @param test_id Target by testId (takes precedence over coordinates)
     * @param point Target by coordinates when no testId is given
     * @param value Text for input verbs
     */
    [[nodiscard]] json simulate(const std::string& verb, const std::optional<std::string>& test_id,
                                const std::optional<std::pair<double, double>>& point,
                                const std::optional<std::string>& value) const;

    /// {componentCount, components, registeredTestIds}
    [[nodiscard]] json component_tree(bool include_props) const;

    /// {elementCount, elements}; without @p include_hidden only components with bounds
    [[nodiscard]] json layout_tree(bool include_hidden) const;

  private:
    std::vector<ComponentSpec> snapshot() const;

    mutable std::mutex mutex_;
    std::vector<ComponentSpec> components_;
};

} // namespace devbridge
