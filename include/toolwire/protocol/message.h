/**
 * @file message.h
 * @brief Classification and wire (de)serialization of JSON-RPC messages
 */

#ifndef TOOLWIRE_PROTOCOL_MESSAGE_H
#define TOOLWIRE_PROTOCOL_MESSAGE_H

#include <stdexcept>
#include <string>

#include "toolwire/json/json_bridge.h"
#include "toolwire/types.h"

namespace toolwire {
namespace protocol {

/**
 * Base for failures detected while turning raw input into a message.
 * code() is the JSON-RPC error code reported back to the peer.
 */
class ProtocolException : public std::runtime_error {
 public:
  ProtocolException(int code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int code() const { return code_; }

 private:
  int code_;
};

// Input text is not well-formed JSON
class ParseError : public ProtocolException {
 public:
  explicit ParseError(const std::string& message)
      : ProtocolException(jsonrpc::PARSE_ERROR, message) {}
};

// Well-formed JSON that is not a valid message. A non-object payload is
// reported as a parse error, a malformed request as an invalid request.
class InvalidMessage : public ProtocolException {
 public:
  explicit InvalidMessage(const std::string& message,
                          int code = jsonrpc::INVALID_REQUEST)
      : ProtocolException(code, message) {}
};

using ParsedMessage =
    variant<jsonrpc::Request, jsonrpc::Response, jsonrpc::Message>;

/**
 * Classify a decoded value: an object with "method" is a Request, one
 * with "result" or "error" a Response, anything else a bare Message. A
 * response whose error member does not decode is returned as a bare Message.
 *
 * @throws InvalidMessage if the value is not an object, the method is not a
 *         non-empty string, or the id is not a string, integer or null
 */
ParsedMessage parseMessage(const json::JsonValue& value);

/**
 * Decode text and classify it.
 *
 * @throws ParseError if the text is not valid JSON
 * @throws InvalidMessage as for the structured overload
 */
ParsedMessage parseMessage(const std::string& raw);

json::JsonValue serializeMessage(const ParsedMessage& message);

/**
 * Best-effort id extraction from input that failed to parse as a message.
 * Returns nullopt when no usable id is present.
 */
optional<RequestId> recoverId(const json::JsonValue& raw);
optional<RequestId> recoverId(const std::string& raw);

/**
 * Fresh id for messages this process originates: 128 random bits in the
 * canonical 8-4-4-4-12 hex layout.
 */
std::string generateId();

inline bool isRequest(const ParsedMessage& message) {
  return holds_alternative<jsonrpc::Request>(message);
}

inline bool isResponse(const ParsedMessage& message) {
  return holds_alternative<jsonrpc::Response>(message);
}

}  // namespace protocol
}  // namespace toolwire

#endif  // TOOLWIRE_PROTOCOL_MESSAGE_H
