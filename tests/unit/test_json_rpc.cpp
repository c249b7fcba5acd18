#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/json_rpc.hpp"

namespace {

using nlohmann::json;
using sqlbridge::protocol::Notification;
using sqlbridge::protocol::parse_message;
using sqlbridge::protocol::Request;
using sqlbridge::protocol::Response;

TEST(JsonRpcTest, ParsesSuccessResponse) {
    const auto message = parse_message(R"({"jsonrpc":"2.0","id":3,"result":{"ok":true}})");
    ASSERT_TRUE(message.has_value());
    const auto* response = std::get_if<Response>(&*message);
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->id, 3);
    EXPECT_FALSE(response->error.has_value());
    EXPECT_TRUE(response->result.at("ok").get<bool>());
}

TEST(JsonRpcTest, ParsesErrorResponse) {
    const auto message =
        parse_message(R"({"jsonrpc":"2.0","id":7,"error":{"code":-32000,"message":"db offline"}})");
    ASSERT_TRUE(message.has_value());
    const auto* response = std::get_if<Response>(&*message);
    ASSERT_NE(response, nullptr);
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, -32000);
    EXPECT_EQ(response->error->message, "db offline");
}

TEST(JsonRpcTest, ParsesNotificationWithoutParams) {
    const auto message = parse_message(R"({"jsonrpc":"2.0","method":"notifications/progress"})");
    ASSERT_TRUE(message.has_value());
    const auto* notification = std::get_if<Notification>(&*message);
    ASSERT_NE(notification, nullptr);
    EXPECT_EQ(notification->method, "notifications/progress");
    EXPECT_TRUE(notification->params.is_object());
}

TEST(JsonRpcTest, ParsesInboundRequest) {
    const auto message = parse_message(R"({"jsonrpc":"2.0","id":9001,"method":"ping"})");
    ASSERT_TRUE(message.has_value());
    const auto* request = std::get_if<Request>(&*message);
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->id, 9001);
    EXPECT_EQ(request->method, "ping");
}

TEST(JsonRpcTest, TreatsNonProtocolLinesAsOpaque) {
    EXPECT_FALSE(parse_message("Server listening on stdio").has_value());
    EXPECT_FALSE(parse_message(R"({"jsonrpc":"2.0","id":1,"res)").has_value());
    EXPECT_FALSE(parse_message("[1,2,3]").has_value());
    EXPECT_FALSE(parse_message(R"({"jsonrpc":"2.0","id":"abc","result":{}})").has_value());
    EXPECT_FALSE(parse_message(R"({"hello":"world"})").has_value());
}

TEST(JsonRpcTest, RequestEnvelopeHasAllFields) {
    const json encoded = sqlbridge::protocol::to_json(Request{5, "tools/list", json::object()});
    EXPECT_EQ(encoded.at("jsonrpc"), "2.0");
    EXPECT_EQ(encoded.at("id"), 5);
    EXPECT_EQ(encoded.at("method"), "tools/list");
    EXPECT_TRUE(encoded.at("params").is_object());
}

TEST(JsonRpcTest, NotificationEnvelopeHasNoId) {
    const json encoded =
        sqlbridge::protocol::to_json(Notification{"notifications/initialized", json::object()});
    EXPECT_FALSE(encoded.contains("id"));
    EXPECT_EQ(encoded.at("method"), "notifications/initialized");
}

TEST(JsonRpcTest, SerializedMessagesAreSingleLine) {
    Request request{1, "tools/call", json{{"name", "read_data"},
                                          {"arguments", {{"query", "SELECT 1\nFROM t"}}}}};
    const std::string line = sqlbridge::protocol::serialize(request);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    const auto reparsed = parse_message(line);
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_TRUE(std::holds_alternative<Request>(*reparsed));
}

}  // namespace
