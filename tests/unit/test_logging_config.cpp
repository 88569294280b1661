// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "log_capture_sink.h"
#include "logging_init.h"

#include "hv/hlog.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace devbridge;
using namespace devbridge::logging;

namespace {

/// Restores the process-wide default logger after a test replaces it
class DefaultLoggerGuard {
  public:
    DefaultLoggerGuard() : saved_(spdlog::default_logger()) {}
    ~DefaultLoggerGuard() {
        spdlog::set_default_logger(saved_);
    }

  private:
    std::shared_ptr<spdlog::logger> saved_;
};

fs::path make_temp_dir() {
    fs::path dir = fs::temp_directory_path() /
                   ("devbridge_logging_test_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

// ============================================================================
// Level resolution
// ============================================================================

TEST_CASE("Level names accepted in /logging/level", "[logging][config]") {
    const std::vector<std::pair<const char*, spdlog::level::level_enum>> names = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},   {"off", spdlog::level::off},
    };
    for (const auto& [name, level] : names) {
        INFO(name);
        REQUIRE(parse_level(name, spdlog::level::critical) == level);
    }

    // Unknown, empty and upper-case names keep the caller's fallback
    for (const char* name : {"", "verbose", "DEBUG"}) {
        INFO(name);
        REQUIRE(parse_level(name, spdlog::level::info) == spdlog::level::info);
    }
}

TEST_CASE("-v flags outrank /logging/level", "[logging][config]") {
    struct Case {
        int verbosity;
        const char* config_level;
        spdlog::level::level_enum expected;
    };
    const Case cases[] = {
        {0, "", spdlog::level::warn},          {0, "error", spdlog::level::err},
        {0, "chatty", spdlog::level::warn},    {1, "error", spdlog::level::info},
        {2, "", spdlog::level::debug},         {3, "off", spdlog::level::trace},
        {7, "info", spdlog::level::trace},     {-1, "debug", spdlog::level::debug},
    };
    for (const auto& c : cases) {
        INFO("verbosity=" << c.verbosity << " config=" << c.config_level);
        REQUIRE(resolve_log_level(c.verbosity, c.config_level) == c.expected);
    }
}

TEST_CASE("libhv logger level follows the spdlog level", "[logging][config]") {
    REQUIRE(to_hv_level(spdlog::level::trace) == LOG_LEVEL_DEBUG);
    REQUIRE(to_hv_level(spdlog::level::info) == LOG_LEVEL_INFO);
    REQUIRE(to_hv_level(spdlog::level::warn) == LOG_LEVEL_WARN);
    REQUIRE(to_hv_level(spdlog::level::critical) == LOG_LEVEL_FATAL);
    REQUIRE(to_hv_level(spdlog::level::off) == LOG_LEVEL_SILENT);
}

// ============================================================================
// Targets
// ============================================================================

TEST_CASE("Log target names", "[logging][config]") {
    REQUIRE(log_target_names() == "console, journal, syslog, file");

    for (auto target : {LogTarget::Console, LogTarget::Journal, LogTarget::Syslog,
                        LogTarget::File}) {
        auto parsed = parse_log_target(log_target_name(target));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == target);
    }

    REQUIRE_FALSE(parse_log_target("auto").has_value());
    REQUIRE_FALSE(parse_log_target("Console").has_value());
    REQUIRE_FALSE(parse_log_target("").has_value());
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("init: file target writes to the configured path", "[logging][init]") {
    DefaultLoggerGuard guard;
    fs::path dir = make_temp_dir();

    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.enable_console = false;
    config.file_path = (dir / "coordinator.log").string();
    init(config);

    spdlog::info("[Bridge Server] Listening on 127.0.0.1:8765");
    spdlog::debug("[Bridge Server] below the configured level");
    spdlog::default_logger()->flush();

    std::string contents = read_file(config.file_path);
    REQUIRE(contents.find("Listening on 127.0.0.1:8765") != std::string::npos);
    REQUIRE(contents.find("below the configured level") == std::string::npos);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("init: unusable log file keeps the other sinks", "[logging][init]") {
    DefaultLoggerGuard guard;
    fs::path dir = make_temp_dir();
    fs::path blocker = dir / "not_a_dir";
    std::ofstream(blocker) << "x";

    auto capture = std::make_shared<LogCaptureSink>(16);
    LogConfig config;
    config.level = spdlog::level::warn;
    config.target = LogTarget::File;
    config.enable_console = false;
    config.file_path = (blocker / "devbridge.log").string();
    config.extra_sinks.push_back(capture);
    config.extra_sinks.push_back(nullptr);
    REQUIRE_NOTHROW(init(config));

    spdlog::warn("[Device Registry] still captured");
    REQUIRE(capture->size() == 1);
    REQUIRE(capture->query(LogQuery{})[0]["message"] == "[Device Registry] still captured");
    REQUIRE_FALSE(fs::exists(config.file_path));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("init: console target names the logger and applies the level", "[logging][init]") {
    DefaultLoggerGuard guard;
    auto capture = std::make_shared<LogCaptureSink>(16);

    LogConfig config;
    config.level = spdlog::level::err;
    config.logger_name = "devbridge-coordinator";
    config.extra_sinks.push_back(capture);
    init(config);

    REQUIRE(spdlog::default_logger()->name() == "devbridge-coordinator");
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::err);

    spdlog::warn("dropped");
    spdlog::error("kept");
    REQUIRE(capture->size() == 1);
}
