// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace devbridge {

/**
 * @brief Text result of one tool invocation
 */
struct McpToolResult {
    std::string text;
    bool is_error = false;
};

/**
 * @brief A tool exposed to the MCP client
 */
struct McpTool {
    std::string name;
    std::string description;
    json input_schema = json::object();
    std::function<McpToolResult(const json& arguments)> handler;
};

/**
 * @brief Line-delimited JSON-RPC 2.0 server speaking the MCP tool subset
 *
 * Handles `initialize`, `notifications/initialized`, `tools/list` and
 * `tools/call`. Every response is written as one compact JSON line and
 * flushed; nothing else may write to the output stream.
 */
class McpStdioServer {
  public:
    static constexpr const char* JSONRPC_VERSION = "2.0";
    static constexpr const char* MCP_VERSION = "2024-11-05";

    McpStdioServer(std::istream& in, std::ostream& out, std::string name, std::string version);

    McpStdioServer(const McpStdioServer&) = delete;
    McpStdioServer& operator=(const McpStdioServer&) = delete;

    void register_tool(McpTool tool);

    [[nodiscard]] size_t tool_count() const;

    /**
     * @brief Process one raw input line
     *
     * @return Serialized response, or nullopt for notifications and blank lines
     */
    std::optional<std::string> handle_line(const std::string& line);

    /**
     * @brief Process one parsed JSON-RPC message
     *
     * @return Response object, or null when no response is due
     */
    json handle_message(const json& request);

    /// Read lines until EOF or stop(); returns the number of messages handled
    size_t run();

    void stop() {
        running_ = false;
    }

    [[nodiscard]] bool is_initialized() const {
        return initialized_;
    }

  private:
    json handle_initialize(const json& params);
    json handle_list_tools() const;
    json handle_call_tool(const json& params);

    static json make_response(const json& id, json result);
    static json make_error(const json& id, int code, const std::string& message);
    void write_message(const std::string& text);

    std::istream& in_;
    std::ostream& out_;
    std::string name_;
    std::string version_;

    mutable std::mutex tools_mutex_;
    std::map<std::string, McpTool> tools_;

    std::mutex out_mutex_;
    std::atomic_bool running_{false};
    std::atomic_bool initialized_{false};
};

} // namespace devbridge
