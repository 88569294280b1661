// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace devbridge {

namespace {

json get_default_server_config() {
    return {{"host", "127.0.0.1"},
            {"port", 8765},
            {"request_timeout_ms", 10000},
            {"handshake_timeout_ms", 5000}};
}

json get_default_client_config() {
    return {{"url", "ws://localhost:8765"},
            {"reconnect_delay_ms", 3000},
            {"connect_timeout_ms", 5000},
            {"app_name", "devbridge-demo"},
            {"app_version", "1.0.0"},
            {"device_id", ""}};
}

json get_default_logging_config() {
    // level intentionally empty - verbosity flags decide when unset
    return {{"level", ""}, {"target", "console"}, {"file", ""}};
}

/// Fill @p section in @p data from @p defaults, key by key
/// @return true if anything was added
bool ensure_section(json& data, const char* section, const json& defaults) {
    bool modified = false;
    if (!data.contains(section) || !data[section].is_object()) {
        data[section] = defaults;
        return true;
    }
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data[section].contains(it.key())) {
            data[section][it.key()] = it.value();
            spdlog::debug("[Config] Added missing /{}/{}", section, it.key());
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() : data(json::object()) {}

json Config::defaults() {
    return {{"server", get_default_server_config()},
            {"client", get_default_client_config()},
            {"logging", get_default_logging_config()}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                parse_error = "config root must be an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt - resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                LOG_WARN_INTERNAL("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = defaults();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = defaults();
        config_modified = true;

        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                LOG_WARN_INTERNAL("[Config] Could not create {}: {}", config_dir.string(),
                                  ec.message());
            }
        }
    }

    if (ensure_section(data, "server", get_default_server_config())) {
        config_modified = true;
    }
    if (ensure_section(data, "client", get_default_client_config())) {
        config_modified = true;
    }
    if (ensure_section(data, "logging", get_default_logging_config())) {
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Continuing with in-memory config");
    }
}

int Config::apply_env_overrides() {
    int applied = 0;

    if (const char* port = std::getenv("DEVBRIDGE_PORT")) {
        try {
            int value = std::stoi(port);
            if (value > 0 && value <= 65535) {
                data["/server/port"_json_pointer] = value;
                spdlog::debug("[Config] DEVBRIDGE_PORT override: {}", value);
                ++applied;
            } else {
                spdlog::warn("[Config] Ignoring DEVBRIDGE_PORT={} (out of range)", port);
            }
        } catch (const std::exception&) {
            spdlog::warn("[Config] Ignoring DEVBRIDGE_PORT={} (not a number)", port);
        }
    }

    if (const char* level = std::getenv("DEVBRIDGE_LOG_LEVEL")) {
        if (*level != '\0') {
            data["/logging/level"_json_pointer] = std::string(level);
            spdlog::debug("[Config] DEVBRIDGE_LOG_LEVEL override: {}", level);
            ++applied;
        }
    }

    return applied;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            LOG_ERROR_INTERNAL("Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace devbridge
