#define TOOLWIRE_LOG_COMPONENT "config"

#include "toolwire/config/config_loader.h"

#include <sys/stat.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace config {

namespace {

bool exists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string extensionOf(const std::string& path) {
  size_t dot = path.find_last_of('.');
  return dot != std::string::npos ? path.substr(dot) : "";
}

json::JsonValue yamlToJsonValue(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return json::JsonValue::null();
    case YAML::NodeType::Scalar: {
      const std::string& text = node.Scalar();
      // Quoted scalars carry the non-specific "!" tag and stay strings
      if (node.Tag() == "!") {
        return json::JsonValue(text);
      }
      if (text == "true" || text == "false") {
        return json::JsonValue(text == "true");
      }
      int64_t integer;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return json::JsonValue(integer);
      }
      double number;
      if (text.find_first_of("0123456789") != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return json::JsonValue(number);
      }
      return json::JsonValue(text);
    }
    case YAML::NodeType::Sequence: {
      auto result = json::JsonValue::array();
      for (const auto& item : node) {
        result.push_back(yamlToJsonValue(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = json::JsonValue::object();
      for (const auto& pair : node) {
        result.set(pair.first.as<std::string>(), yamlToJsonValue(pair.second));
      }
      return result;
    }
    default:
      break;
  }

  return json::JsonValue::null();
}

}  // namespace

std::vector<std::string> ConfigLoader::defaultSearchPaths() {
  return {"./config/toolwire.yaml", "./config/toolwire.json",
          "./toolwire.yaml", "./toolwire.json"};
}

std::string ConfigLoader::findConfigFile() const {
  if (!options_.explicit_path.empty()) {
    // Missing explicit files are reported by loadFile()
    TOOLWIRE_LOG(Info, "Configuration source: --config={}",
                 options_.explicit_path);
    return options_.explicit_path;
  }

  const char* env_config = std::getenv("TOOLWIRE_CONFIG");
  if (env_config && *env_config) {
    if (exists(env_config)) {
      TOOLWIRE_LOG(Info, "Configuration source: TOOLWIRE_CONFIG={}",
                   env_config);
      return env_config;
    }
    TOOLWIRE_LOG(Warning, "TOOLWIRE_CONFIG points to missing file {}",
                 env_config);
  }

  for (const auto& path : defaultSearchPaths()) {
    if (exists(path)) {
      TOOLWIRE_LOG(Info, "Configuration source: {}", path);
      return path;
    }
  }
  return "";
}

ServerConfig ConfigLoader::load() const {
  std::string path = findConfigFile();
  if (path.empty()) {
    TOOLWIRE_LOG(Info, "No configuration file found, using defaults");
    return ServerConfig();
  }
  return loadFile(path);
}

ServerConfig ConfigLoader::loadFile(const std::string& path) const {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    throw ConfigError("Cannot stat config file: " + path);
  }
  if (static_cast<size_t>(st.st_size) > options_.max_file_size) {
    throw ConfigError(fmt::format("Config file too large: {} ({} bytes)",
                                  path, st.st_size));
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot open config file: " + path);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  if (options_.enable_environment_substitution) {
    content = substituteEnvironmentVariables(content);
  }

  json::JsonValue root = parseContent(content, path);
  if (root.isNull()) {
    // Empty file
    return ServerConfig();
  }

  TOOLWIRE_LOG(Debug, "Loaded configuration from {}", path);
  return ServerConfig::fromJson(root);
}

json::JsonValue ConfigLoader::parseContent(const std::string& content,
                                           const std::string& filepath) {
  if (extensionOf(filepath) == ".json") {
    try {
      return json::JsonValue::parse(content);
    } catch (const json::JsonException& e) {
      throw ConfigError(fmt::format("JSON parse error in {}: {}", filepath,
                                    e.what()));
    }
  }

  // YAML is a superset of JSON, so .yaml files holding JSON parse too
  try {
    return yamlToJsonValue(YAML::Load(content));
  } catch (const YAML::ParserException& e) {
    throw ConfigError(fmt::format("YAML parse error in {} at line {}, column {}",
                                  filepath, e.mark.line + 1,
                                  e.mark.column + 1));
  }
}

std::string ConfigLoader::substituteEnvironmentVariables(
    const std::string& content) {
  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  size_t vars_expanded = 0;
  auto search_start = content.cbegin();
  std::smatch match;

  while (std::regex_search(search_start, content.cend(), match, env_regex)) {
    result.append(search_start, match[0].first);

    std::string var_name = match[1].str();
    bool has_default = match[2].matched;
    const char* env_value = std::getenv(var_name.c_str());

    if (!env_value && !has_default) {
      throw ConfigError("Undefined environment variable: " + var_name);
    }
    result.append(env_value ? env_value : match[3].str());
    ++vars_expanded;

    search_start = match[0].second;
  }
  result.append(search_start, content.cend());

  if (vars_expanded > 0) {
    TOOLWIRE_LOG(Debug, "Expanded {} environment variables", vars_expanded);
  }
  return result;
}

}  // namespace config
}  // namespace toolwire
