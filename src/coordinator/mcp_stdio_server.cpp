// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mcp_stdio_server.h"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <stdexcept>

namespace devbridge {

namespace {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INTERNAL_ERROR = -32603;
} // namespace

McpStdioServer::McpStdioServer(std::istream& in, std::ostream& out, std::string name,
                               std::string version)
    : in_(in), out_(out), name_(std::move(name)), version_(std::move(version)) {}

void McpStdioServer::register_tool(McpTool tool) {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    std::string name = tool.name;
    tools_[name] = std::move(tool);
}

size_t McpStdioServer::tool_count() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return tools_.size();
}

std::optional<std::string> McpStdioServer::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::debug("[MCP] Parse error: {}", e.what());
        return make_error(nullptr, PARSE_ERROR, "Parse error").dump();
    }

    json response = handle_message(request);
    if (response.is_null()) {
        return std::nullopt;
    }
    return response.dump();
}

json McpStdioServer::handle_message(const json& request) {
    if (!request.is_object()) {
        return make_error(nullptr, INVALID_REQUEST, "Invalid Request");
    }

    json id = request.contains("id") ? request["id"] : json(nullptr);

    if (json_util::safe_string(request, "jsonrpc") != JSONRPC_VERSION ||
        !request.contains("method") || !request["method"].is_string()) {
        return make_error(id, INVALID_REQUEST, "Invalid Request");
    }

    std::string method = request["method"].get<std::string>();
    json params = (request.contains("params") && request["params"].is_object())
                      ? request["params"]
                      : json::object();

    spdlog::debug("[MCP] << {}", method);

    try {
        json result;
        if (method == "initialize") {
            result = handle_initialize(params);
            initialized_ = true;
        } else if (method == "tools/list") {
            result = handle_list_tools();
        } else if (method == "tools/call") {
            result = handle_call_tool(params);
        } else if (method == "notifications/initialized") {
            return nullptr;
        } else {
            return make_error(id, METHOD_NOT_FOUND, "Method not found");
        }

        if (id.is_null()) {
            return nullptr;
        }
        return make_response(id, std::move(result));
    } catch (const std::exception& e) {
        return make_error(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

size_t McpStdioServer::run() {
    running_ = true;
    size_t handled = 0;
    std::string line;

    spdlog::info("[MCP] stdio server started ({} tools)", tool_count());
    while (running_ && std::getline(in_, line)) {
        auto response = handle_line(line);
        ++handled;
        if (response) {
            write_message(*response);
        }
    }
    running_ = false;
    spdlog::info("[MCP] stdio server stopped after {} messages", handled);
    return handled;
}

json McpStdioServer::handle_initialize(const json& params) {
    if (params.contains("clientInfo")) {
        spdlog::info("[MCP] Client: {} {}", json_util::safe_string(params["clientInfo"], "name"),
                     json_util::safe_string(params["clientInfo"], "version"));
    }
    return {{"protocolVersion", MCP_VERSION},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", name_}, {"version", version_}}}};
}

json McpStdioServer::handle_list_tools() const {
    json tools = json::array();
    std::lock_guard<std::mutex> lock(tools_mutex_);
    for (const auto& [name, tool] : tools_) {
        tools.push_back(
            {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
    }
    return {{"tools", tools}};
}

json McpStdioServer::handle_call_tool(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::runtime_error("Missing tool name");
    }
    std::string tool_name = params["name"].get<std::string>();

    std::function<McpToolResult(const json&)> handler;
    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        auto it = tools_.find(tool_name);
        if (it == tools_.end()) {
            throw std::runtime_error("Unknown tool: " + tool_name);
        }
        handler = it->second.handler;
    }

    json arguments = (params.contains("arguments") && params["arguments"].is_object())
                         ? params["arguments"]
                         : json::object();

    McpToolResult result;
    try {
        result = handler(arguments);
    } catch (const std::exception& e) {
        result.text = std::string("Error executing tool: ") + e.what();
        result.is_error = true;
    }

    return {{"content", json::array({{{"type", "text"}, {"text", result.text}}})},
            {"isError", result.is_error}};
}

json McpStdioServer::make_response(const json& id, json result) {
    return {{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

json McpStdioServer::make_error(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", JSONRPC_VERSION},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

void McpStdioServer::write_message(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << "\n";
    out_.flush();
    spdlog::trace("[MCP] >> {}", text);
}

} // namespace devbridge
