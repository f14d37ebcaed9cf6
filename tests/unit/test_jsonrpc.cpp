#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "mcp/jsonrpc.hpp"

namespace {

using nlohmann::json;
using transpiler::core::errors::get_error;
using transpiler::core::errors::get_value;
using transpiler::core::errors::is_error;
using transpiler::mcp::JsonRpcError;
using transpiler::mcp::kMethodNotFound;
using transpiler::mcp::make_error_response;
using transpiler::mcp::make_result_response;
using transpiler::mcp::parse_request;

TEST(JsonRpcTest, ParsesRequestWithIdAndParams) {
    auto parsed = parse_request(json{{"jsonrpc", "2.0"},
                                     {"id", 3},
                                     {"method", "tools/call"},
                                     {"params", {{"name", "transpile_python"}}}});
    ASSERT_FALSE(is_error(parsed));
    const auto& request = get_value(parsed);

    EXPECT_EQ(request.method, "tools/call");
    ASSERT_TRUE(request.id.has_value());
    EXPECT_EQ(*request.id, 3);
    EXPECT_EQ(request.params.at("name"), "transpile_python");
}

TEST(JsonRpcTest, NotificationHasNoIdAndEmptyParams) {
    auto parsed = parse_request(json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    ASSERT_FALSE(is_error(parsed));
    EXPECT_FALSE(get_value(parsed).id.has_value());
    EXPECT_TRUE(get_value(parsed).params.is_object());
    EXPECT_TRUE(get_value(parsed).params.empty());
}

TEST(JsonRpcTest, NullIdIsStillARequest) {
    auto parsed = parse_request(json{{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "ping"}});
    ASSERT_FALSE(is_error(parsed));
    ASSERT_TRUE(get_value(parsed).id.has_value());
    EXPECT_TRUE(get_value(parsed).id->is_null());
}

TEST(JsonRpcTest, RejectsMalformedEnvelopes) {
    EXPECT_TRUE(is_error(parse_request(json::array())));
    EXPECT_TRUE(is_error(parse_request(json{{"method", "ping"}})));
    EXPECT_TRUE(is_error(parse_request(json{{"jsonrpc", "1.0"}, {"method", "ping"}})));
    EXPECT_TRUE(is_error(parse_request(json{{"jsonrpc", "2.0"}, {"method", 5}})));
    EXPECT_TRUE(is_error(
        parse_request(json{{"jsonrpc", "2.0"}, {"method", "ping"}, {"params", "x"}})));

    auto bad_id = parse_request(json{{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1.5}});
    ASSERT_TRUE(is_error(bad_id));
    EXPECT_EQ(get_error(bad_id).code, "invalid_request");
}

TEST(JsonRpcTest, BuildsResponses) {
    const auto result = make_result_response("abc", json{{"ok", true}});
    EXPECT_EQ(result.at("jsonrpc"), "2.0");
    EXPECT_EQ(result.at("id"), "abc");
    EXPECT_EQ(result.at("result").at("ok"), true);
    EXPECT_FALSE(result.contains("error"));

    const auto error = make_error_response(9, JsonRpcError{kMethodNotFound, "method not found"});
    EXPECT_EQ(error.at("id"), 9);
    EXPECT_EQ(error.at("error").at("code"), -32601);
    EXPECT_EQ(error.at("error").at("message"), "method not found");
    EXPECT_FALSE(error.contains("result"));
}

}  // namespace
