#define TOOLWIRE_LOG_COMPONENT "protocol"

#include "toolwire/protocol/message.h"

#include <random>

#include <fmt/format.h>

#include "toolwire/json/json_serialization.h"
#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace protocol {

namespace {

bool isValidId(const json::JsonValue& id) {
  return id.isNull() || id.isString() || id.isInteger();
}

void checkId(const json::JsonValue& value) {
  if (value.contains("id") && !isValidId(value["id"])) {
    throw InvalidMessage("Invalid id: must be a string, integer or null");
  }
}

}  // namespace

ParsedMessage parseMessage(const json::JsonValue& value) {
  if (!value.isObject()) {
    throw InvalidMessage("Message must be a JSON object",
                         jsonrpc::PARSE_ERROR);
  }
  checkId(value);

  try {
    if (value.contains("method")) {
      const json::JsonValue& method = value["method"];
      if (!method.isString() || method.getString().empty()) {
        throw InvalidMessage("Invalid method: must be a non-empty string");
      }
      return json::from_json<jsonrpc::Request>(value);
    }

    if (value.contains("result") || value.contains("error")) {
      try {
        return json::from_json<jsonrpc::Response>(value);
      } catch (const json::JsonException& e) {
        // Responses are never answered; a malformed one is only noted
        TOOLWIRE_LOG(Debug, "Malformed response kept as bare message: {}",
                     e.what());
        return json::from_json<jsonrpc::Message>(value);
      }
    }

    TOOLWIRE_LOG(Debug, "Message carries no method, result or error");
    return json::from_json<jsonrpc::Message>(value);
  } catch (const json::JsonException& e) {
    throw InvalidMessage(e.what());
  }
}

ParsedMessage parseMessage(const std::string& raw) {
  json::JsonValue value;
  try {
    value = json::JsonValue::parse(raw);
  } catch (const json::JsonException& e) {
    throw ParseError(fmt::format("Invalid JSON: {}", e.what()));
  }
  return parseMessage(value);
}

json::JsonValue serializeMessage(const ParsedMessage& message) {
  return visit(
      [](const auto& typed) -> json::JsonValue {
        return json::to_json(typed);
      },
      message);
}

optional<RequestId> recoverId(const json::JsonValue& raw) {
  if (!raw.isObject() || !raw.contains("id")) {
    return nullopt;
  }
  const json::JsonValue& id = raw["id"];
  if (id.isString()) {
    return RequestId(id.getString());
  }
  if (id.isInteger()) {
    return RequestId(id.getInt64());
  }
  return nullopt;
}

optional<RequestId> recoverId(const std::string& raw) {
  try {
    return recoverId(json::JsonValue::parse(raw));
  } catch (const json::JsonException&) {
    return nullopt;
  }
}

std::string generateId() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  uint64_t hi = engine();
  uint64_t lo = engine();

  // Version 4, RFC 4122 variant
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<uint32_t>(hi >> 32),
                     static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                     static_cast<uint32_t>(hi & 0xFFFF),
                     static_cast<uint32_t>(lo >> 48),
                     lo & 0xFFFFFFFFFFFFULL);
}

}  // namespace protocol
}  // namespace toolwire
