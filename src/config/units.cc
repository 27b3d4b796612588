#define TOOLWIRE_LOG_COMPONENT "config"

#include "toolwire/config/units.h"

#include <limits>
#include <regex>

#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace config {

std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const std::string& str) {
  std::string error;
  return parseWithError(str, error);
}

std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const json::JsonValue& value) {
  if (value.isString()) {
    return parse(value.getString());
  }

  if (value.isInteger() || value.isFloat()) {
    int64_t ms = value.isInteger() ? value.getInt64()
                                   : static_cast<int64_t>(value.getFloat());
    if (ms < 0) {
      TOOLWIRE_LOG(Error, "Duration values must be non-negative: {}", ms);
      return {false, std::chrono::milliseconds(0)};
    }
    return {true, std::chrono::milliseconds(ms)};
  }

  TOOLWIRE_LOG(Error, "Invalid duration value type: expected string or number");
  return {false, std::chrono::milliseconds(0)};
}

std::string Duration::toString(std::chrono::milliseconds duration) {
  auto ms = duration.count();

  if (ms == 0)
    return "0ms";
  if (ms % (60 * 60 * 1000) == 0)
    return std::to_string(ms / (60 * 60 * 1000)) + "h";
  if (ms % (60 * 1000) == 0)
    return std::to_string(ms / (60 * 1000)) + "m";
  if (ms % 1000 == 0)
    return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

bool Duration::isValid(const std::string& str) {
  static const std::regex pattern("^[0-9]+(ms|s|m|h)$");
  return std::regex_match(str, pattern);
}

std::pair<bool, std::chrono::milliseconds> Duration::parseWithError(
    const std::string& str, std::string& error_message) {
  static const std::regex pattern("^([0-9]+)(ms|s|m|h)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    error_message = "Invalid duration format '" + str +
                    "'. Expected <number><unit> with unit ms, s, m or h";
    TOOLWIRE_LOG(Debug, "{}", error_message);
    return {false, std::chrono::milliseconds(0)};
  }

  int64_t value;
  try {
    value = std::stoll(match[1].str());
  } catch (const std::out_of_range&) {
    error_message = "Duration value too large: " + str;
    return {false, std::chrono::milliseconds(0)};
  }

  const std::string unit = match[2].str();
  int64_t multiplier = 1;
  if (unit == "s") {
    multiplier = 1000;
  } else if (unit == "m") {
    multiplier = 60 * 1000;
  } else if (unit == "h") {
    multiplier = 60 * 60 * 1000;
  }

  if (value > std::numeric_limits<int64_t>::max() / multiplier) {
    error_message = "Duration value too large (overflow): " + str;
    return {false, std::chrono::milliseconds(0)};
  }

  return {true, std::chrono::milliseconds(value * multiplier)};
}

}  // namespace config
}  // namespace toolwire
