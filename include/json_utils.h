// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace devbridge {
using json = nlohmann::json;
} // namespace devbridge

namespace devbridge::json_util {

/// Safely extract a string from a JSON field that may be missing, null or of another type.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Safely extract an int from a JSON field that may be number, string, or null.
inline int safe_int(const nlohmann::json& j, const char* key, int def = 0) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<int>();
    }
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// Safely extract a double from a JSON field that may be number, string, or null.
inline double safe_double(const nlohmann::json& j, const char* key, double def = 0.0) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// Safely extract a bool. Accepts JSON booleans only.
inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_boolean()) {
        return def;
    }
    return j[key].get<bool>();
}

/// Optional string: nullopt when the field is absent or null.
inline std::optional<std::string> opt_string(const nlohmann::json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

/// Optional number: nullopt when the field is absent or not numeric.
inline std::optional<double> opt_double(const nlohmann::json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

/// Milliseconds since the Unix epoch, the timestamp unit used on the wire.
inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace devbridge::json_util
