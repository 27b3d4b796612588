#include "toolwire/json/json_serialization.h"

namespace toolwire {
namespace json {

namespace {

void setId(JsonValue& json, const optional<RequestId>& id) {
  if (id) {
    json.set("id", to_json(*id));
  }
}

optional<RequestId> readId(const JsonValue& json) {
  if (!json.contains("id") || json["id"].isNull()) {
    return nullopt;
  }
  return from_json<RequestId>(json["id"]);
}

}  // namespace

JsonValue JsonSerializeTraits<RequestId>::serialize(const RequestId& id) {
  if (auto str = get_if<std::string>(&id)) {
    return JsonValue(*str);
  }
  return JsonValue(get<int64_t>(id));
}

RequestId JsonDeserializeTraits<RequestId>::deserialize(const JsonValue& json) {
  if (json.isString()) {
    return RequestId(json.getString());
  }
  if (json.isInteger()) {
    return RequestId(json.getInt64());
  }
  throw JsonException("Request id must be a string or an integer");
}

JsonValue JsonSerializeTraits<Error>::serialize(const Error& error) {
  JsonObjectBuilder builder;
  builder.add("code", error.code).add("message", error.message);
  if (error.data) {
    builder.add("data", *error.data);
  }
  return builder.build();
}

Error JsonDeserializeTraits<Error>::deserialize(const JsonValue& json) {
  Error error;
  error.code = json.at("code").getInt();
  error.message = json["message"].getString("");
  if (json.contains("data") && !json["data"].isNull()) {
    error.data = json["data"];
  }
  return error;
}

JsonValue JsonSerializeTraits<ToolParameter>::serialize(
    const ToolParameter& param) {
  JsonObjectBuilder builder;
  builder.add("name", param.name)
      .add("type", param.type)
      .add("description", param.description)
      .add("required", param.required);
  if (param.default_value) {
    builder.add("default", *param.default_value);
  }
  if (param.enum_values) {
    builder.add("enum", to_json(*param.enum_values));
  }
  return builder.build();
}

ToolParameter JsonDeserializeTraits<ToolParameter>::deserialize(
    const JsonValue& json) {
  ToolParameter param;
  param.name = json.at("name").getString();
  param.type = json["type"].getString("string");
  param.description = json["description"].getString("");
  param.required = json["required"].getBool(false);
  if (json.contains("default") && !json["default"].isNull()) {
    param.default_value = json["default"];
  }
  if (json.contains("enum") && json["enum"].isArray()) {
    param.enum_values = from_json<std::vector<JsonValue>>(json["enum"]);
  }
  return param;
}

JsonValue parameterSchema(const ToolParameter& param) {
  JsonObjectBuilder builder;
  builder.add("type", param.type).add("description", param.description);
  if (param.enum_values) {
    builder.add("enum", to_json(*param.enum_values));
  }
  if (param.default_value) {
    builder.add("default", *param.default_value);
  }
  return builder.build();
}

JsonValue inputSchema(const std::vector<ToolParameter>& parameters) {
  JsonValue properties = JsonValue::object();
  JsonValue required = JsonValue::array();
  for (const auto& param : parameters) {
    properties.set(param.name, parameterSchema(param));
    if (param.required) {
      required.push_back(JsonValue(param.name));
    }
  }
  return JsonObjectBuilder()
      .add("type", "object")
      .add("properties", properties)
      .add("required", required)
      .build();
}

JsonValue JsonSerializeTraits<ToolDefinition>::serialize(
    const ToolDefinition& tool) {
  return JsonObjectBuilder()
      .add("name", tool.name)
      .add("description", tool.description)
      .add("inputSchema", inputSchema(tool.parameters))
      .build();
}

ToolDefinition JsonDeserializeTraits<ToolDefinition>::deserialize(
    const JsonValue& json) {
  ToolDefinition tool;
  tool.name = json.at("name").getString();
  tool.description = json["description"].getString("");

  const JsonValue& schema = json["inputSchema"];
  if (!schema.isObject() || !schema["properties"].isObject()) {
    return tool;
  }

  std::vector<std::string> required;
  if (schema["required"].isArray()) {
    required = from_json<std::vector<std::string>>(schema["required"]);
  }

  const JsonValue& properties = schema["properties"];
  for (const auto& name : properties.keys()) {
    const JsonValue& prop = properties[name];
    ToolParameter param(name, prop["type"].getString("string"),
                        prop["description"].getString(""));
    for (const auto& r : required) {
      if (r == name) {
        param.required = true;
      }
    }
    if (prop.contains("default") && !prop["default"].isNull()) {
      param.default_value = prop["default"];
    }
    if (prop["enum"].isArray()) {
      param.enum_values = from_json<std::vector<JsonValue>>(prop["enum"]);
    }
    tool.parameters.push_back(std::move(param));
  }
  return tool;
}

JsonValue JsonSerializeTraits<ToolResult>::serialize(const ToolResult& result) {
  JsonObjectBuilder builder;
  builder.add("success", result.success)
      .add("content", result.content)
      .add("content_type", contentTypeToString(result.content_type));
  if (result.error && !result.error->empty()) {
    builder.add("error", *result.error);
  }
  if (result.metadata.isObject() && !result.metadata.empty()) {
    builder.add("metadata", result.metadata);
  }
  return builder.build();
}

ToolResult JsonDeserializeTraits<ToolResult>::deserialize(
    const JsonValue& json) {
  ToolResult result;
  result.success = json.at("success").getBool();
  result.content = json["content"];
  result.content_type = json["content_type"].getString("text") == "json"
                            ? ContentType::Json
                            : ContentType::Text;
  if (json["error"].isString()) {
    result.error = json["error"].getString();
  }
  if (json["metadata"].isObject()) {
    result.metadata = json["metadata"];
  }
  return result;
}

JsonValue JsonSerializeTraits<jsonrpc::Message>::serialize(
    const jsonrpc::Message& message) {
  JsonValue json = JsonObjectBuilder().add("jsonrpc", message.jsonrpc).build();
  setId(json, message.id);
  return json;
}

jsonrpc::Message JsonDeserializeTraits<jsonrpc::Message>::deserialize(
    const JsonValue& json) {
  jsonrpc::Message message;
  message.jsonrpc = json["jsonrpc"].getString(jsonrpc::kVersion);
  message.id = readId(json);
  return message;
}

JsonValue JsonSerializeTraits<jsonrpc::Request>::serialize(
    const jsonrpc::Request& request) {
  JsonValue json = JsonObjectBuilder().add("jsonrpc", request.jsonrpc).build();
  setId(json, request.id);
  json.set("method", JsonValue(request.method));
  if (request.params) {
    json.set("params", *request.params);
  }
  return json;
}

jsonrpc::Request JsonDeserializeTraits<jsonrpc::Request>::deserialize(
    const JsonValue& json) {
  jsonrpc::Request request;
  request.jsonrpc = json["jsonrpc"].getString(jsonrpc::kVersion);
  request.id = readId(json);
  request.method = json.at("method").getString();
  if (json.contains("params") && !json["params"].isNull()) {
    request.params = json["params"];
  }
  return request;
}

JsonValue JsonSerializeTraits<jsonrpc::Response>::serialize(
    const jsonrpc::Response& response) {
  JsonValue json =
      JsonObjectBuilder().add("jsonrpc", response.jsonrpc).build();
  // Responses always carry an id, null when the request's id was unknown
  json.set("id", response.id ? to_json(*response.id) : JsonValue::null());
  if (response.error) {
    json.set("error", to_json(*response.error));
  } else {
    json.set("result", response.result ? *response.result : JsonValue::null());
  }
  return json;
}

jsonrpc::Response JsonDeserializeTraits<jsonrpc::Response>::deserialize(
    const JsonValue& json) {
  jsonrpc::Response response;
  response.jsonrpc = json["jsonrpc"].getString(jsonrpc::kVersion);
  response.id = readId(json);
  if (json.contains("error") && !json["error"].isNull()) {
    response.error = from_json<Error>(json["error"]);
  } else {
    response.result = json["result"];
  }
  return response;
}

}  // namespace json
}  // namespace toolwire
