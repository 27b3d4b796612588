#ifndef TOOLWIRE_CONFIG_SERVER_CONFIG_H
#define TOOLWIRE_CONFIG_SERVER_CONFIG_H

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolwire/core/compat.h"
#include "toolwire/json/json_bridge.h"

namespace toolwire {
namespace config {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error(message) {}
};

struct ServerConfig {
  std::string name = "mcp-tool-server";
  std::string version = "0.1.0";
  optional<std::vector<std::string>> allowed_paths;
  bool enable_file_tools = true;
  bool enable_shell_tools = true;
  bool enable_search_tools = true;
  int max_concurrent_requests = 10;
  // Seconds
  double request_timeout = 60.0;
  std::string log_level = "info";
  // "text" or "json"
  std::string log_format = "text";
  // Rotating log file instead of stderr
  optional<std::string> log_file;
  size_t log_max_file_size = 10 * 1024 * 1024;
  size_t log_max_files = 5;

  // Identity and feature flags, as reported to clients
  json::JsonValue toJson() const;

  /**
   * Build from an object. Missing fields keep their defaults; unknown
   * fields are ignored. request_timeout is a number of seconds or a
   * duration string such as "30s".
   *
   * @throws ConfigError on a wrong field type or a failed validate()
   */
  static ServerConfig fromJson(const json::JsonValue& json);

  // Throws ConfigError
  void validate() const;

  std::chrono::milliseconds requestTimeout() const;
};

// Longest accepted request_timeout, in seconds (30 days)
constexpr double kMaxRequestTimeout = 30.0 * 24 * 60 * 60;

/**
 * Point the global logger registry at the sink, format and level the
 * configuration names.
 *
 * @throws ConfigError if log_file cannot be opened
 */
void configureLogging(const ServerConfig& config);

}  // namespace config
}  // namespace toolwire

#endif  // TOOLWIRE_CONFIG_SERVER_CONFIG_H
