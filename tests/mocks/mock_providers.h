// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_providers.h"

#include <map>
#include <stdexcept>

namespace devbridge {

class MockStorageProvider : public StorageProvider {
  public:
    std::map<std::string, std::string> values;

    std::vector<std::string> keys() override {
        std::vector<std::string> result;
        for (const auto& [key, value] : values) {
            result.push_back(key);
        }
        return result;
    }

    std::optional<std::string> get(const std::string& key) override {
        auto it = values.find(key);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

class MockUiProvider : public UiProvider {
  public:
    json hierarchy = {{"type", "Window"}, {"children", json::array()}};
    std::string screenshot = "iVBORw0KGgo=";
    bool fail_screenshot = false;

    json view_hierarchy() override {
        return hierarchy;
    }

    std::string capture_screenshot() override {
        if (fail_screenshot) {
            throw std::runtime_error("Display not available");
        }
        return screenshot;
    }
};

} // namespace devbridge
