// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <spdlog/spdlog.h>

#include <string>

namespace devbridge {

/**
 * @brief Coordinator and demo-client configuration
 *
 * Loads and manages configuration from a JSON file. Uses JSON pointer syntax
 * (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialize once at startup and read from
 * the main thread.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("/path/to/devbridge.json");
 *
 * int port = cfg.get<int>("/server/port", 8765);
 * cfg.set<int>("/server/port", 9000);
 * cfg.save();
 * ```
 */
class Config {
  public:
    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to
     * parse is moved aside to `<path>.corrupt` and replaced with defaults.
     * Missing sections are filled in and written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Apply DEVBRIDGE_PORT and DEVBRIDGE_LOG_LEVEL (in memory only)
     *
     * @return Number of overrides applied
     */
    int apply_env_overrides();

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns @p default_value if the path is missing or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::type_error&) {
                spdlog::warn("[Config] {} has the wrong type, using default", json_ptr);
            }
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. Changes are in-memory until save().
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Write the configuration to disk with pretty formatting
     *
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path() const {
        return path;
    }

    /// Full default configuration
    static json defaults();

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  private:
    std::string path;
};

} // namespace devbridge
