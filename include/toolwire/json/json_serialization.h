#pragma once

#include <map>
#include <string>
#include <vector>

#include "toolwire/json/json_bridge.h"
#include "toolwire/types.h"

namespace toolwire {
namespace json {

// Forward declarations
template <typename T>
struct JsonSerializeTraits;
template <typename T>
struct JsonDeserializeTraits;

class JsonSerializer {
 public:
  template <typename T>
  static JsonValue serialize(const T& value) {
    return JsonSerializeTraits<T>::serialize(value);
  }
};

class JsonDeserializer {
 public:
  template <typename T>
  static T deserialize(const JsonValue& json) {
    return JsonDeserializeTraits<T>::deserialize(json);
  }
};

// Short aliases: to_json(value) and from_json<T>(json)
template <typename T>
inline JsonValue to_json(const T& value) {
  return JsonSerializer::serialize<T>(value);
}

template <typename T>
inline T from_json(const JsonValue& json) {
  return JsonDeserializer::deserialize<T>(json);
}

// ============ BASIC TYPE TRAITS ============

template <>
struct JsonSerializeTraits<JsonValue> {
  static JsonValue serialize(const JsonValue& value) { return value; }
};
template <>
struct JsonSerializeTraits<std::string> {
  static JsonValue serialize(const std::string& value) {
    return JsonValue(value);
  }
};
template <>
struct JsonSerializeTraits<int> {
  static JsonValue serialize(int value) { return JsonValue(value); }
};
template <>
struct JsonSerializeTraits<int64_t> {
  static JsonValue serialize(int64_t value) { return JsonValue(value); }
};
template <>
struct JsonSerializeTraits<double> {
  static JsonValue serialize(double value) { return JsonValue(value); }
};
template <>
struct JsonSerializeTraits<bool> {
  static JsonValue serialize(bool value) { return JsonValue(value); }
};

template <>
struct JsonDeserializeTraits<JsonValue> {
  static JsonValue deserialize(const JsonValue& json) { return json; }
};
template <>
struct JsonDeserializeTraits<std::string> {
  static std::string deserialize(const JsonValue& json) {
    return json.getString();
  }
};
template <>
struct JsonDeserializeTraits<int> {
  static int deserialize(const JsonValue& json) { return json.getInt(); }
};
template <>
struct JsonDeserializeTraits<int64_t> {
  static int64_t deserialize(const JsonValue& json) { return json.getInt64(); }
};
template <>
struct JsonDeserializeTraits<double> {
  static double deserialize(const JsonValue& json) { return json.getFloat(); }
};
template <>
struct JsonDeserializeTraits<bool> {
  static bool deserialize(const JsonValue& json) { return json.getBool(); }
};

// ============ CONTAINER TRAITS ============

template <typename T>
struct JsonSerializeTraits<std::vector<T>> {
  static JsonValue serialize(const std::vector<T>& vec) {
    JsonArrayBuilder builder;
    for (const auto& item : vec) {
      builder.add(JsonSerializer::serialize<T>(item));
    }
    return builder.build();
  }
};

template <typename T>
struct JsonDeserializeTraits<std::vector<T>> {
  static std::vector<T> deserialize(const JsonValue& json) {
    std::vector<T> result;
    if (!json.isArray())
      return result;
    result.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
      result.push_back(JsonDeserializer::deserialize<T>(json[i]));
    }
    return result;
  }
};

template <typename V>
struct JsonSerializeTraits<std::map<std::string, V>> {
  static JsonValue serialize(const std::map<std::string, V>& map) {
    JsonObjectBuilder builder;
    for (const auto& kv : map) {
      builder.add(kv.first, JsonSerializer::serialize<V>(kv.second));
    }
    return builder.build();
  }
};

template <typename V>
struct JsonDeserializeTraits<std::map<std::string, V>> {
  static std::map<std::string, V> deserialize(const JsonValue& json) {
    std::map<std::string, V> result;
    if (!json.isObject())
      return result;
    for (const auto& key : json.keys()) {
      result[key] = JsonDeserializer::deserialize<V>(json[key]);
    }
    return result;
  }
};

// ============ PROTOCOL TYPE TRAITS ============
// Defined in json_serialization.cc

template <>
struct JsonSerializeTraits<RequestId> {
  static JsonValue serialize(const RequestId& id);
};
template <>
struct JsonDeserializeTraits<RequestId> {
  static RequestId deserialize(const JsonValue& json);
};

template <>
struct JsonSerializeTraits<Error> {
  static JsonValue serialize(const Error& error);
};
template <>
struct JsonDeserializeTraits<Error> {
  static Error deserialize(const JsonValue& json);
};

template <>
struct JsonSerializeTraits<ToolParameter> {
  static JsonValue serialize(const ToolParameter& param);
};
template <>
struct JsonDeserializeTraits<ToolParameter> {
  static ToolParameter deserialize(const JsonValue& json);
};

// ToolDefinition serializes to the catalog form with an inputSchema
template <>
struct JsonSerializeTraits<ToolDefinition> {
  static JsonValue serialize(const ToolDefinition& tool);
};
template <>
struct JsonDeserializeTraits<ToolDefinition> {
  static ToolDefinition deserialize(const JsonValue& json);
};

template <>
struct JsonSerializeTraits<ToolResult> {
  static JsonValue serialize(const ToolResult& result);
};
template <>
struct JsonDeserializeTraits<ToolResult> {
  static ToolResult deserialize(const JsonValue& json);
};

template <>
struct JsonSerializeTraits<jsonrpc::Message> {
  static JsonValue serialize(const jsonrpc::Message& message);
};
template <>
struct JsonDeserializeTraits<jsonrpc::Message> {
  static jsonrpc::Message deserialize(const JsonValue& json);
};

template <>
struct JsonSerializeTraits<jsonrpc::Request> {
  static JsonValue serialize(const jsonrpc::Request& request);
};
template <>
struct JsonDeserializeTraits<jsonrpc::Request> {
  static jsonrpc::Request deserialize(const JsonValue& json);
};

template <>
struct JsonSerializeTraits<jsonrpc::Response> {
  static JsonValue serialize(const jsonrpc::Response& response);
};
template <>
struct JsonDeserializeTraits<jsonrpc::Response> {
  static jsonrpc::Response deserialize(const JsonValue& json);
};

// JSON-Schema property object for a single parameter
JsonValue parameterSchema(const ToolParameter& param);

// {"type":"object","properties":{...},"required":[...]}
JsonValue inputSchema(const std::vector<ToolParameter>& parameters);

}  // namespace json
}  // namespace toolwire
