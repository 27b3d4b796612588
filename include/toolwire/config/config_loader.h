#ifndef TOOLWIRE_CONFIG_CONFIG_LOADER_H
#define TOOLWIRE_CONFIG_CONFIG_LOADER_H

#include <string>
#include <vector>

#include "toolwire/config/server_config.h"
#include "toolwire/json/json_bridge.h"

namespace toolwire {
namespace config {

/**
 * Locates and reads a YAML or JSON configuration file.
 *
 * Search order:
 *   1. explicit path (--config)
 *   2. TOOLWIRE_CONFIG environment variable
 *   3. ./config/toolwire.yaml, ./config/toolwire.json, ./toolwire.yaml,
 *      ./toolwire.json
 *
 * ${VAR} and ${VAR:-default} references are expanded before parsing.
 */
class ConfigLoader {
 public:
  struct Options {
    std::string explicit_path;
    bool enable_environment_substitution = true;
    size_t max_file_size = 1024 * 1024;
  };

  ConfigLoader() = default;
  explicit ConfigLoader(const Options& options) : options_(options) {}

  // Defaults when no file is found. Throws ConfigError on a bad file.
  ServerConfig load() const;

  ServerConfig loadFile(const std::string& path) const;

  // Empty if nothing was found
  std::string findConfigFile() const;

  // Parse by extension: .json as JSON, anything else as YAML
  static json::JsonValue parseContent(const std::string& content,
                                      const std::string& filepath);

  // Throws ConfigError for an unset variable without a default
  static std::string substituteEnvironmentVariables(const std::string& content);

  static std::vector<std::string> defaultSearchPaths();

 private:
  Options options_;
};

}  // namespace config
}  // namespace toolwire

#endif  // TOOLWIRE_CONFIG_CONFIG_LOADER_H
