#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "toolwire/json/json_bridge.h"

namespace toolwire {
namespace config {

// Duration parsing and validation
// Supports formats: 10ms, 5s, 2m, 1h
class Duration {
 public:
  // Parse from string (e.g., "10ms", "5s", "2m", "1h")
  static std::pair<bool, std::chrono::milliseconds> parse(
      const std::string& str);

  // Strings as above; a bare number is taken as milliseconds
  static std::pair<bool, std::chrono::milliseconds> parse(
      const json::JsonValue& value);

  // Largest whole unit that represents the value exactly
  static std::string toString(std::chrono::milliseconds duration);

  static bool isValid(const std::string& str);

  static std::pair<bool, std::chrono::milliseconds> parseWithError(
      const std::string& str, std::string& error_message);
};

class UnitParseError : public std::runtime_error {
 public:
  explicit UnitParseError(const std::string& message)
      : std::runtime_error(message) {}
};

// Throws UnitParseError naming field_name
inline std::chrono::milliseconds parseJsonDuration(
    const json::JsonValue& value, const std::string& field_name) {
  auto result = Duration::parse(value);
  if (!result.first) {
    throw UnitParseError("Invalid duration format for field '" + field_name +
                         "'");
  }
  return result.second;
}

}  // namespace config
}  // namespace toolwire
