// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mcp_stdio_server.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace devbridge;

/**
 * @brief Server over in-memory streams with an echo tool and a failing tool
 */
class McpServerFixture {
  public:
    McpServerFixture() : server(in, out, "devbridge-test", "0.1.0") {
        McpTool echo;
        echo.name = "echo";
        echo.description = "Echo the text argument";
        echo.input_schema = {{"type", "object"}};
        echo.handler = [](const json& args) {
            return McpToolResult{json_util::safe_string(args, "text"), false};
        };
        server.register_tool(echo);

        McpTool broken;
        broken.name = "broken";
        broken.description = "Always throws";
        broken.handler = [](const json&) -> McpToolResult { throw std::runtime_error("kaput"); };
        server.register_tool(broken);
    }

    json call(const json& request) {
        auto line = server.handle_line(request.dump());
        REQUIRE(line.has_value());
        return json::parse(*line);
    }

    static json rpc(int id, const std::string& method, json params = json::object()) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    std::istringstream in;
    std::ostringstream out;
    McpStdioServer server;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE_METHOD(McpServerFixture, "MCP: initialize reports server info", "[mcp]") {
    REQUIRE_FALSE(server.is_initialized());

    json response = call(rpc(1, "initialize", {{"clientInfo", {{"name", "cli"}, {"version", "9"}}}}));

    REQUIRE(response["jsonrpc"] == "2.0");
    REQUIRE(response["id"] == 1);
    REQUIRE(response["result"]["protocolVersion"] == McpStdioServer::MCP_VERSION);
    REQUIRE(response["result"]["serverInfo"]["name"] == "devbridge-test");
    REQUIRE(response["result"]["capabilities"].contains("tools"));
    REQUIRE(server.is_initialized());
}

TEST_CASE_METHOD(McpServerFixture, "MCP: notifications get no response", "[mcp]") {
    json note = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    REQUIRE_FALSE(server.handle_line(note.dump()).has_value());

    // A request without an id is a notification too
    json list = {{"jsonrpc", "2.0"}, {"method", "tools/list"}};
    REQUIRE(server.handle_message(list).is_null());
}

TEST_CASE_METHOD(McpServerFixture, "MCP: blank lines are skipped", "[mcp]") {
    REQUIRE_FALSE(server.handle_line("").has_value());
    REQUIRE_FALSE(server.handle_line("   \r").has_value());
}

// ============================================================================
// Tools
// ============================================================================

TEST_CASE_METHOD(McpServerFixture, "MCP: tools/list returns every tool", "[mcp][tools]") {
    json response = call(rpc(2, "tools/list"));
    const json& tools = response["result"]["tools"];

    REQUIRE(tools.size() == 2);
    REQUIRE(server.tool_count() == 2);
    // Sorted by name
    REQUIRE(tools[0]["name"] == "broken");
    REQUIRE(tools[1]["name"] == "echo");
    REQUIRE(tools[1]["inputSchema"]["type"] == "object");
    REQUIRE(tools[1]["description"] == "Echo the text argument");
}

TEST_CASE_METHOD(McpServerFixture, "MCP: tools/call success", "[mcp][tools]") {
    json response =
        call(rpc(3, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hello"}}}}));

    const json& result = response["result"];
    REQUIRE(result["isError"] == false);
    REQUIRE(result["content"].size() == 1);
    REQUIRE(result["content"][0]["type"] == "text");
    REQUIRE(result["content"][0]["text"] == "hello");
}

TEST_CASE_METHOD(McpServerFixture, "MCP: tools/call with a throwing handler", "[mcp][tools]") {
    json response = call(rpc(4, "tools/call", {{"name", "broken"}}));

    REQUIRE_FALSE(response.contains("error"));
    REQUIRE(response["result"]["isError"] == true);
    REQUIRE(response["result"]["content"][0]["text"] == "Error executing tool: kaput");
}

TEST_CASE_METHOD(McpServerFixture, "MCP: tools/call errors", "[mcp][tools]") {
    SECTION("unknown tool") {
        json response = call(rpc(5, "tools/call", {{"name", "nope"}}));
        REQUIRE(response["error"]["code"] == -32603);
        REQUIRE(response["error"]["message"].get<std::string>().find("nope") != std::string::npos);
    }

    SECTION("missing name") {
        json response = call(rpc(6, "tools/call"));
        REQUIRE(response["error"]["code"] == -32603);
    }
}

TEST_CASE_METHOD(McpServerFixture, "MCP: register_tool replaces by name", "[mcp][tools]") {
    McpTool echo;
    echo.name = "echo";
    echo.handler = [](const json&) { return McpToolResult{"replaced", false}; };
    server.register_tool(echo);

    REQUIRE(server.tool_count() == 2);
    json response = call(rpc(7, "tools/call", {{"name", "echo"}}));
    REQUIRE(response["result"]["content"][0]["text"] == "replaced");
}

// ============================================================================
// Protocol errors
// ============================================================================

TEST_CASE_METHOD(McpServerFixture, "MCP: JSON-RPC error codes", "[mcp][errors]") {
    SECTION("parse error has a null id") {
        auto line = server.handle_line("{not json");
        REQUIRE(line.has_value());
        json response = json::parse(*line);
        REQUIRE(response["error"]["code"] == -32700);
        REQUIRE(response["id"].is_null());
    }

    SECTION("non-object request") {
        json response = call(json::array({1, 2}));
        REQUIRE(response["error"]["code"] == -32600);
    }

    SECTION("wrong jsonrpc version keeps the id") {
        json response = call({{"jsonrpc", "1.0"}, {"id", 8}, {"method", "tools/list"}});
        REQUIRE(response["error"]["code"] == -32600);
        REQUIRE(response["id"] == 8);
    }

    SECTION("unknown method") {
        json response = call(rpc(9, "resources/list"));
        REQUIRE(response["error"]["code"] == -32601);
    }
}

// ============================================================================
// run()
// ============================================================================

TEST_CASE("MCP: run() answers each line until EOF", "[mcp][run]") {
    std::istringstream in(
        json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}).dump() + "\n" +
        json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n" +
        "\n" +
        json({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}).dump() + "\n");
    std::ostringstream out;
    McpStdioServer server(in, out, "devbridge-test", "0.1.0");

    REQUIRE(server.run() == 4);

    std::vector<json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }

    REQUIRE(responses.size() == 2);
    REQUIRE(responses[0]["id"] == 1);
    REQUIRE(responses[1]["id"] == 2);
    REQUIRE(responses[1]["result"]["tools"].empty());
}
