#ifndef TOOLWIRE_TYPES_H
#define TOOLWIRE_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

#include "toolwire/core/compat.h"
#include "toolwire/json/json_bridge.h"

namespace toolwire {

// Request correlation id; absent for notifications
using RequestId = variant<std::string, int64_t>;

// Error type
struct Error {
  int code = 0;
  std::string message;
  optional<json::JsonValue> data;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
  Error(int c, const std::string& m, const json::JsonValue& d)
      : code(c), message(m), data(d) {}
};

template <typename T>
using Result = variant<T, Error>;

template <typename T>
bool is_success(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
bool is_error(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

inline Error make_error(int code, const std::string& message) {
  return Error(code, message);
}

// Tool parameter declaration. type is one of string, number, integer,
// boolean.
struct ToolParameter {
  std::string name;
  std::string type = "string";
  std::string description;
  bool required = false;
  optional<json::JsonValue> default_value;
  optional<std::vector<json::JsonValue>> enum_values;

  ToolParameter() = default;
  ToolParameter(const std::string& n,
                const std::string& t,
                const std::string& d,
                bool r = false)
      : name(n), type(t), description(d), required(r) {}
};

// Catalog entry for a registered tool
struct ToolDefinition {
  std::string name;
  std::string description;
  std::vector<ToolParameter> parameters;

  ToolDefinition() = default;
  ToolDefinition(const std::string& n,
                 const std::string& d,
                 std::vector<ToolParameter> p = {})
      : name(n), description(d), parameters(std::move(p)) {}
};

enum class ContentType { Text, Json };

inline const char* contentTypeToString(ContentType type) {
  return type == ContentType::Json ? "json" : "text";
}

// Uniform outcome of a tool execution. success == false comes with error.
struct ToolResult {
  bool success = false;
  json::JsonValue content;
  ContentType content_type = ContentType::Text;
  optional<std::string> error;
  json::JsonValue metadata = json::JsonValue::object();

  static ToolResult text(const std::string& text) {
    ToolResult result;
    result.success = true;
    result.content = json::JsonValue(text);
    return result;
  }

  static ToolResult structured(const json::JsonValue& value) {
    ToolResult result;
    result.success = true;
    result.content = value;
    result.content_type = ContentType::Json;
    return result;
  }

  static ToolResult failure(const std::string& error) {
    ToolResult result;
    result.success = false;
    result.content = json::JsonValue("");
    result.error = error;
    return result;
  }
};

// JSON-RPC message types
namespace jsonrpc {

constexpr const char* kVersion = "2.0";

// Error codes as constants
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int TOOL_NOT_FOUND = -32000;
constexpr int TOOL_EXECUTION_ERROR = -32001;
constexpr int PERMISSION_DENIED = -32002;
constexpr int TIMEOUT = -32003;

// A message that is neither a request nor a response
struct Message {
  std::string jsonrpc = kVersion;
  optional<RequestId> id;
};

struct Request {
  std::string jsonrpc = kVersion;
  optional<RequestId> id;
  std::string method;
  optional<json::JsonValue> params;

  Request() = default;
  Request(const optional<RequestId>& i, const std::string& m)
      : id(i), method(m) {}
  Request(const optional<RequestId>& i,
          const std::string& m,
          const json::JsonValue& p)
      : id(i), method(m), params(p) {}

  bool isNotification() const { return !id.has_value(); }
};

struct Response {
  std::string jsonrpc = kVersion;
  optional<RequestId> id;
  optional<json::JsonValue> result;
  optional<Error> error;

  Response() = default;
  explicit Response(const optional<RequestId>& i) : id(i) {}

  static Response success(const optional<RequestId>& id,
                          const json::JsonValue& result) {
    Response r(id);
    r.result = result;
    return r;
  }

  static Response make_error(const optional<RequestId>& id, const Error& err) {
    Response r(id);
    r.error = err;
    return r;
  }

  bool isError() const { return error.has_value(); }
};

inline Request make_request(const optional<RequestId>& id,
                            const std::string& method) {
  return Request(id, method);
}

inline Request make_request(const optional<RequestId>& id,
                            const std::string& method,
                            const json::JsonValue& params) {
  return Request(id, method, params);
}

inline Response make_error_response(const optional<RequestId>& id,
                                    int code,
                                    const std::string& message) {
  return Response::make_error(id, Error(code, message));
}

}  // namespace jsonrpc

}  // namespace toolwire

#endif  // TOOLWIRE_TYPES_H
