#include <future>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "server/mcp_stdio_server.hpp"
#include "server/tool_server.hpp"

namespace {

using hostlink::core::config::BridgeConfig;
using hostlink::core::errors::get_error;
using hostlink::core::errors::get_value;
using hostlink::core::errors::is_error;
using hostlink::protocol::LogRecord;
using hostlink::protocol::MessageKind;
using hostlink::server::McpStdioServer;
using hostlink::server::ToolServer;
using hostlink::testing::FakeTransport;
using hostlink::testing::wait_until;
using nlohmann::json;

class McpStdioServerTest : public ::testing::Test {
protected:
    McpStdioServerTest() : server_(BridgeConfig{}), mcp_(server_.tools(), "9.9.9") {}

    json request(const std::string& method, json params = json::object(), json id = 1) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    json respond(const json& message) {
        bool should_respond = false;
        auto response = mcp_.handle_request(message, should_respond);
        EXPECT_TRUE(should_respond) << message.dump();
        return response;
    }

    json call(const std::string& name, const json& arguments) {
        return respond(request("tools/call", json{{"name", name}, {"arguments", arguments}}));
    }

    // The JSON document inside the first text block of a tool result.
    static json text_body(const json& response) {
        return json::parse(response["result"]["content"][0]["text"].get<std::string>());
    }

    ToolServer server_;
    McpStdioServer mcp_;
};

TEST_F(McpStdioServerTest, InitializeAdvertisesTools) {
    const auto response = respond(request("initialize", json{{"clientInfo", {{"name", "t"}}}}));

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    const auto& result = response["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(result["capabilities"]["tools"].is_object());
    EXPECT_EQ(result["serverInfo"]["name"], "hostlink");
    EXPECT_EQ(result["serverInfo"]["version"], "9.9.9");
}

TEST_F(McpStdioServerTest, NotificationsGetNoResponse) {
    bool should_respond = true;
    mcp_.handle_request(json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
                        should_respond);
    EXPECT_FALSE(should_respond);

    should_respond = true;
    mcp_.handle_request(json{{"jsonrpc", "2.0"}, {"method", "ping"}}, should_respond);
    EXPECT_FALSE(should_respond);
}

TEST_F(McpStdioServerTest, PingAnswersEmptyResult) {
    const auto response = respond(request("ping", json::object(), "abc"));
    EXPECT_EQ(response["id"], "abc");
    EXPECT_EQ(response["result"], json::object());
}

TEST_F(McpStdioServerTest, ToolsListMatchesToolNames) {
    const auto response = respond(request("tools/list"));

    const auto& tools = response["result"]["tools"];
    ASSERT_EQ(tools.size(), hostlink::server::tool_names().size());
    for (std::size_t i = 0; i < tools.size(); ++i) {
        EXPECT_EQ(tools[i]["name"], hostlink::server::tool_names()[i]);
        EXPECT_FALSE(tools[i]["description"].get<std::string>().empty());
        EXPECT_EQ(tools[i]["inputSchema"]["type"], "object");
    }

    const auto& assets = tools[6]["inputSchema"];
    EXPECT_EQ(assets["properties"]["action"]["enum"], json::array({"search", "refresh"}));
    EXPECT_EQ(assets["required"], json::array({"action"}));
    EXPECT_EQ(tools[2]["inputSchema"]["properties"]["count"]["maximum"], 1000);
}

TEST_F(McpStdioServerTest, ProtocolErrors) {
    bool should_respond = false;
    const auto parse_error = mcp_.handle_line("{oops", should_respond);
    EXPECT_TRUE(should_respond);
    EXPECT_EQ(parse_error["error"]["code"], -32700);
    EXPECT_TRUE(parse_error["id"].is_null());

    EXPECT_EQ(respond(json{{"jsonrpc", "2.0"}, {"id", 2}})["error"]["code"], -32600);
    EXPECT_EQ(respond(json::array())["error"]["code"], -32600);
    EXPECT_EQ(respond(request("resources/list"))["error"]["code"], -32601);
}

TEST_F(McpStdioServerTest, MalformedToolCallsAreInvalidParams) {
    EXPECT_EQ(respond(request("tools/call", json{{"arguments", json::object()}}))["error"]["code"],
              -32602);

    const auto unknown = call("format_disk", json::object());
    EXPECT_EQ(unknown["error"]["code"], -32602);
    EXPECT_EQ(unknown["error"]["message"], "Unknown tool: format_disk");

    EXPECT_EQ(call("get_object_details", json{{"objectName", 42}})["error"]["code"], -32602);
    EXPECT_EQ(call("get_logs", json::array())["error"]["code"], -32602);

    const auto direct = mcp_.call_tool("format_disk", json::object());
    ASSERT_TRUE(is_error(direct));
    EXPECT_EQ(get_error(direct).code, "unknown_tool");
}

TEST_F(McpStdioServerTest, ToolFailuresAreReportedInBand) {
    const auto response = call("get_editor_state", json::object());

    ASSERT_TRUE(response.contains("result")) << response.dump();
    EXPECT_EQ(response["result"]["isError"], true);
    const auto body = text_body(response);
    EXPECT_EQ(body["code"], "peer_not_connected");
    EXPECT_EQ(body["status"], "error");
    EXPECT_FALSE(body["error"].get<std::string>().empty());

    const auto missing = call("execute_editor_command", json::object());
    EXPECT_EQ(missing["result"]["isError"], true);
    EXPECT_EQ(text_body(missing)["code"], "missing_argument");
}

TEST_F(McpStdioServerTest, GetLogsReturnsRecordsAsText) {
    LogRecord record;
    record.message = "compiled";
    server_.logs().append(record);

    const auto response = call("get_logs", json{{"count", 5}});

    EXPECT_EQ(response["result"]["isError"], false);
    const auto body = text_body(response);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["message"], "compiled");
}

TEST_F(McpStdioServerTest, ScreenshotBecomesImageContent) {
    auto transport = std::make_shared<FakeTransport>();
    server_.adopt(transport);

    auto pending = std::async(std::launch::async,
                              [this] { return mcp_.call_tool("take_screenshot", json::object()); });
    ASSERT_TRUE(wait_until([&] { return transport->count_sent(MessageKind::TakeScreenshot) == 1; }));
    transport->push_message(MessageKind::Screenshot, json{{"base64", "UDYK"}, {"format", "ppm"}});

    const auto result = pending.get();
    ASSERT_FALSE(is_error(result));
    const auto& content = get_value(result)["content"][0];
    EXPECT_EQ(content["type"], "image");
    EXPECT_EQ(content["data"], "UDYK");
    EXPECT_EQ(content["mimeType"], "image/x-portable-pixmap");
    EXPECT_EQ(get_value(result)["isError"], false);
}

TEST_F(McpStdioServerTest, JpegIsTheDefaultImageType) {
    auto transport = std::make_shared<FakeTransport>();
    server_.adopt(transport);

    auto pending = std::async(std::launch::async,
                              [this] { return mcp_.call_tool("take_screenshot", json::object()); });
    ASSERT_TRUE(wait_until([&] { return transport->count_sent(MessageKind::TakeScreenshot) == 1; }));
    transport->push_message(MessageKind::Screenshot, json{{"base64", "/9j/"}});

    const auto result = pending.get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"][0]["mimeType"], "image/jpeg");
}

TEST_F(McpStdioServerTest, RunServesLinesUntilEndOfInput) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
        "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
        "\n"
        "   \n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"get_logs","arguments":{}}})"
        "\r\n"
        "not json\n");
    std::ostringstream out;

    EXPECT_EQ(mcp_.run(in, out), 0);

    std::vector<json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    ASSERT_EQ(responses.size(), 3u);

    bool saw_initialize = false;
    bool saw_call = false;
    bool saw_parse_error = false;
    for (const auto& response : responses) {
        if (response["id"] == 1) {
            saw_initialize = response["result"].contains("serverInfo");
        } else if (response["id"] == 2) {
            saw_call = response["result"]["isError"] == false;
        } else if (response["id"].is_null()) {
            saw_parse_error = response["error"]["code"] == -32700;
        }
    }
    EXPECT_TRUE(saw_initialize);
    EXPECT_TRUE(saw_call);
    EXPECT_TRUE(saw_parse_error);
}

TEST_F(McpStdioServerTest, NonStringMethodIsInvalidRequest) {
    EXPECT_EQ(respond(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", 5}})["error"]["code"],
              -32600);

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":5})"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":["tools/call"]})"
        "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"ping"})"
        "\n");
    std::ostringstream out;

    EXPECT_EQ(mcp_.run(in, out), 0);

    std::vector<json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["error"]["code"], -32600);
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["error"]["code"], -32600);
    EXPECT_EQ(responses[2]["id"], 3);
    EXPECT_EQ(responses[2]["result"], json::object());
}

}  // namespace
