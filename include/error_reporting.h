// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

/**
 * @file error_reporting.h
 * @brief Logging macros for internal failures
 *
 * Internal errors are never surfaced to the remote agent directly; they are
 * logged with an [INTERNAL] prefix so they stand out in captured logs.
 */

/**
 * @brief Log internal error
 *
 * Use for callback exceptions, malformed frames and other failures that the
 * bridge recovers from on its own.
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)
