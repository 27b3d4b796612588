#define TOOLWIRE_LOG_COMPONENT "config"

#include "toolwire/config/server_config.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "toolwire/config/units.h"
#include "toolwire/logging/log_macros.h"
#include "toolwire/logging/log_sink.h"

namespace toolwire {
namespace config {

namespace {

const char* const kKnownFields[] = {
    "name",
    "version",
    "allowed_paths",
    "enable_file_tools",
    "enable_shell_tools",
    "enable_search_tools",
    "max_concurrent_requests",
    "request_timeout",
    "log_level",
    "log_format",
    "log_file",
    "log_max_file_size",
    "log_max_files",
};

const char* const kLogLevels[] = {"debug",    "info",  "notice",
                                  "warning",  "error", "critical",
                                  "alert",    "emergency", "off"};

bool isKnownField(const std::string& key) {
  for (const char* field : kKnownFields) {
    if (key == field) {
      return true;
    }
  }
  return false;
}

std::string readString(const json::JsonValue& json, const char* field) {
  if (!json[field].isString()) {
    throw ConfigError(fmt::format("Field '{}' must be a string", field));
  }
  return json[field].getString();
}

bool readBool(const json::JsonValue& json, const char* field) {
  if (!json[field].isBoolean()) {
    throw ConfigError(fmt::format("Field '{}' must be a boolean", field));
  }
  return json[field].getBool();
}

size_t readSize(const json::JsonValue& json, const char* field) {
  if (!json[field].isInteger() || json[field].getInt64() < 0) {
    throw ConfigError(
        fmt::format("Field '{}' must be a non-negative integer", field));
  }
  return static_cast<size_t>(json[field].getInt64());
}

double readTimeoutSeconds(const json::JsonValue& value) {
  if (value.isNumber()) {
    return value.isInteger() ? static_cast<double>(value.getInt64())
                             : value.getFloat();
  }
  if (value.isString()) {
    try {
      auto ms = parseJsonDuration(value, "request_timeout");
      return static_cast<double>(ms.count()) / 1000.0;
    } catch (const UnitParseError& e) {
      throw ConfigError(e.what());
    }
  }
  throw ConfigError(
      "Field 'request_timeout' must be a number of seconds or a duration");
}

}  // namespace

json::JsonValue ServerConfig::toJson() const {
  return json::JsonObjectBuilder()
      .add("name", name)
      .add("version", version)
      .add("enable_file_tools", enable_file_tools)
      .add("enable_shell_tools", enable_shell_tools)
      .add("enable_search_tools", enable_search_tools)
      .build();
}

ServerConfig ServerConfig::fromJson(const json::JsonValue& json) {
  if (!json.isObject()) {
    throw ConfigError("Configuration must be an object");
  }

  ServerConfig config;
  for (const auto& key : json.keys()) {
    if (!isKnownField(key)) {
      TOOLWIRE_LOG(Warning, "Ignoring unknown configuration field '{}'", key);
    }
  }

  if (json.contains("name")) {
    config.name = readString(json, "name");
  }
  if (json.contains("version")) {
    config.version = readString(json, "version");
  }
  if (json.contains("allowed_paths") && !json["allowed_paths"].isNull()) {
    const auto& paths = json["allowed_paths"];
    if (!paths.isArray()) {
      throw ConfigError("Field 'allowed_paths' must be a list of strings");
    }
    std::vector<std::string> allowed;
    for (size_t i = 0; i < paths.size(); ++i) {
      if (!paths[i].isString()) {
        throw ConfigError("Field 'allowed_paths' must be a list of strings");
      }
      allowed.push_back(paths[i].getString());
    }
    config.allowed_paths = std::move(allowed);
  }
  if (json.contains("enable_file_tools")) {
    config.enable_file_tools = readBool(json, "enable_file_tools");
  }
  if (json.contains("enable_shell_tools")) {
    config.enable_shell_tools = readBool(json, "enable_shell_tools");
  }
  if (json.contains("enable_search_tools")) {
    config.enable_search_tools = readBool(json, "enable_search_tools");
  }
  if (json.contains("max_concurrent_requests")) {
    if (!json["max_concurrent_requests"].isInteger()) {
      throw ConfigError("Field 'max_concurrent_requests' must be an integer");
    }
    config.max_concurrent_requests = json["max_concurrent_requests"].getInt();
  }
  if (json.contains("request_timeout")) {
    config.request_timeout = readTimeoutSeconds(json["request_timeout"]);
  }
  if (json.contains("log_level")) {
    config.log_level = readString(json, "log_level");
  }
  if (json.contains("log_format")) {
    config.log_format = readString(json, "log_format");
  }
  if (json.contains("log_file") && !json["log_file"].isNull()) {
    config.log_file = readString(json, "log_file");
  }
  if (json.contains("log_max_file_size")) {
    config.log_max_file_size = readSize(json, "log_max_file_size");
  }
  if (json.contains("log_max_files")) {
    config.log_max_files = readSize(json, "log_max_files");
  }

  config.validate();
  return config;
}

void ServerConfig::validate() const {
  if (name.empty()) {
    throw ConfigError("Server name must not be empty");
  }
  if (max_concurrent_requests < 1) {
    throw ConfigError(fmt::format(
        "max_concurrent_requests must be at least 1, got {}",
        max_concurrent_requests));
  }
  if (!(request_timeout > 0.0) || !std::isfinite(request_timeout)) {
    throw ConfigError(fmt::format(
        "request_timeout must be a positive number of seconds, got {}",
        request_timeout));
  }
  if (request_timeout > kMaxRequestTimeout) {
    throw ConfigError(fmt::format(
        "request_timeout must not exceed {} seconds, got {}",
        kMaxRequestTimeout, request_timeout));
  }
  bool known_level = false;
  for (const char* level : kLogLevels) {
    if (log_level == level) {
      known_level = true;
    }
  }
  if (!known_level) {
    throw ConfigError(fmt::format("Unknown log_level '{}'", log_level));
  }
  if (log_format != "text" && log_format != "json") {
    throw ConfigError(fmt::format(
        "log_format must be 'text' or 'json', got '{}'", log_format));
  }
  if (log_file && log_file->empty()) {
    throw ConfigError("log_file must not be empty");
  }
}

std::chrono::milliseconds ServerConfig::requestTimeout() const {
  // Sub-millisecond timeouts still get one tick
  return std::chrono::milliseconds(
      std::max<int64_t>(1, std::llround(request_timeout * 1000.0)));
}

void configureLogging(const ServerConfig& config) {
  auto level = logging::stringToLogLevel(config.log_level);

  std::shared_ptr<logging::LogSink> sink;
  if (level == logging::LogLevel::Off) {
    sink = logging::SinkFactory::createNullSink();
  } else if (config.log_file) {
    auto file_sink = logging::SinkFactory::createFileSink(
        *config.log_file, config.log_max_file_size, config.log_max_files);
    if (!file_sink->isOpen()) {
      throw ConfigError(
          fmt::format("Cannot open log file '{}'", *config.log_file));
    }
    sink = std::move(file_sink);
  } else {
    sink = logging::SinkFactory::createStdioSink();
  }

  if (config.log_format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }

  auto& registry = logging::LoggerRegistry::instance();
  registry.setSink(sink);
  registry.setGlobalLevel(level);
}

}  // namespace config
}  // namespace toolwire
