// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_setup.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace devbridge;

TEST_CASE("init_config loads the named file and applies env overrides", "[config][setup]") {
    fs::path dir = fs::temp_directory_path() /
                   ("devbridge_setup_test_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

    CliArgs args;
    args.config_path = (dir / "devbridge.json").string();

    setenv("DEVBRIDGE_PORT", "9444", 1);
    Config config;
    init_config(args, config);
    unsetenv("DEVBRIDGE_PORT");

    REQUIRE(config.get_path() == args.config_path);
    REQUIRE(fs::exists(args.config_path));
    REQUIRE(config.get<int>("/server/port") == 9444);
    REQUIRE(config.get<std::string>("/server/host") == "127.0.0.1");

    std::error_code ec;
    fs::remove_all(dir, ec);
}
