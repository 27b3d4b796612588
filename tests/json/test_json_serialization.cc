#include <gtest/gtest.h>

#include "toolwire/json/json_serialization.h"

using namespace toolwire;
using namespace toolwire::json;

class JsonSerializationTest : public ::testing::Test {};

TEST_F(JsonSerializationTest, RequestOmitsAbsentId) {
  auto notification = jsonrpc::make_request(nullopt, "initialized");
  auto json = to_json(notification);

  EXPECT_FALSE(json.contains("id"));
  EXPECT_FALSE(json.contains("params"));
  EXPECT_EQ(json["jsonrpc"].getString(), "2.0");
  EXPECT_EQ(json["method"].getString(), "initialized");
}

TEST_F(JsonSerializationTest, RequestKeepsIdType) {
  auto numeric = to_json(jsonrpc::make_request(RequestId(int64_t(7)), "ping"));
  EXPECT_TRUE(numeric["id"].isInteger());
  EXPECT_EQ(numeric["id"].getInt64(), 7);

  auto text = to_json(jsonrpc::make_request(RequestId("abc"), "ping"));
  EXPECT_EQ(text["id"].getString(), "abc");

  auto back = from_json<jsonrpc::Request>(numeric);
  ASSERT_TRUE(back.id.has_value());
  EXPECT_EQ(get<int64_t>(*back.id), 7);
}

TEST_F(JsonSerializationTest, ResponseAlwaysCarriesId) {
  auto error = jsonrpc::make_error_response(nullopt, jsonrpc::PARSE_ERROR,
                                            "Parse error");
  auto json = to_json(error);

  ASSERT_TRUE(json.contains("id"));
  EXPECT_TRUE(json["id"].isNull());
  EXPECT_FALSE(json.contains("result"));
  EXPECT_EQ(json["error"]["code"].getInt(), -32700);
  EXPECT_EQ(json["error"]["message"].getString(), "Parse error");
}

TEST_F(JsonSerializationTest, SuccessResponseHasNoError) {
  auto json = to_json(jsonrpc::Response::success(
      RequestId("1"), JsonObjectBuilder().add("pong", true).build()));

  EXPECT_FALSE(json.contains("error"));
  EXPECT_TRUE(json["result"]["pong"].getBool());
}

TEST_F(JsonSerializationTest, ErrorDataIsOptional) {
  Error plain(jsonrpc::INVALID_PARAMS, "bad");
  EXPECT_FALSE(to_json(plain).contains("data"));

  Error detailed(jsonrpc::INVALID_PARAMS, "bad", JsonValue("field x"));
  auto back = from_json<Error>(to_json(detailed));
  ASSERT_TRUE(back.data.has_value());
  EXPECT_EQ(back.data->getString(), "field x");
}

TEST_F(JsonSerializationTest, ToolDefinitionInputSchema) {
  ToolDefinition def("search", "Find text",
                     {ToolParameter("pattern", "string", "Regex", true),
                      ToolParameter("limit", "integer", "Max hits")});
  auto json = to_json(def);

  EXPECT_EQ(json["name"].getString(), "search");
  const auto& schema = json["inputSchema"];
  EXPECT_EQ(schema["type"].getString(), "object");
  EXPECT_EQ(schema["properties"]["limit"]["type"].getString(), "integer");
  EXPECT_EQ(schema["properties"]["pattern"]["description"].getString(),
            "Regex");
  ASSERT_EQ(schema["required"].size(), 1u);
  EXPECT_EQ(schema["required"][0].getString(), "pattern");

  auto back = from_json<ToolDefinition>(json);
  ASSERT_EQ(back.parameters.size(), 2u);
  for (const auto& param : back.parameters) {
    EXPECT_EQ(param.required, param.name == "pattern");
  }
}

TEST_F(JsonSerializationTest, ToolParameterWireForm) {
  ToolParameter param("mode", "string", "Mode", false);
  param.default_value = JsonValue("fast");
  param.enum_values = std::vector<JsonValue>{JsonValue("fast"),
                                             JsonValue("slow")};

  auto json = to_json(param);
  EXPECT_FALSE(json["required"].getBool());
  EXPECT_EQ(json["default"].getString(), "fast");
  EXPECT_EQ(json["enum"].size(), 2u);
}

TEST_F(JsonSerializationTest, ToolResultWireForm) {
  auto ok = to_json(ToolResult::structured(JsonValue(3)));
  EXPECT_TRUE(ok["success"].getBool());
  EXPECT_EQ(ok["content_type"].getString(), "json");
  EXPECT_FALSE(ok.contains("error"));
  EXPECT_FALSE(ok.contains("metadata"));

  auto failed = to_json(ToolResult::failure("boom"));
  EXPECT_FALSE(failed["success"].getBool());
  EXPECT_EQ(failed["error"].getString(), "boom");
  EXPECT_EQ(failed["content_type"].getString(), "text");
}

TEST_F(JsonSerializationTest, BadIdTypeIsRejected) {
  EXPECT_THROW(from_json<RequestId>(JsonValue(1.5)), JsonException);
  EXPECT_THROW(from_json<RequestId>(JsonValue(true)), JsonException);
}
