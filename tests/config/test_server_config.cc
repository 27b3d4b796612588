#include <stdlib.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "toolwire/config/config_loader.h"
#include "toolwire/config/server_config.h"
#include "toolwire/config/units.h"
#include "toolwire/logging/log_sink.h"
#include "toolwire/logging/logger_registry.h"

namespace toolwire {
namespace config {
namespace {

using namespace std::chrono_literals;

class ServerConfigTest : public ::testing::Test {};

TEST_F(ServerConfigTest, Defaults) {
  ServerConfig config;
  EXPECT_EQ(config.name, "mcp-tool-server");
  EXPECT_EQ(config.version, "0.1.0");
  EXPECT_FALSE(config.allowed_paths.has_value());
  EXPECT_TRUE(config.enable_file_tools);
  EXPECT_TRUE(config.enable_shell_tools);
  EXPECT_TRUE(config.enable_search_tools);
  EXPECT_EQ(config.max_concurrent_requests, 10);
  EXPECT_DOUBLE_EQ(config.request_timeout, 60.0);
  EXPECT_EQ(config.requestTimeout(), 60000ms);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ServerConfigTest, ToJsonCarriesIdentityAndFlags) {
  ServerConfig config;
  config.enable_shell_tools = false;
  auto json = config.toJson();

  EXPECT_EQ(json["name"].getString(), "mcp-tool-server");
  EXPECT_EQ(json["version"].getString(), "0.1.0");
  EXPECT_FALSE(json["enable_shell_tools"].getBool());
  EXPECT_TRUE(json["enable_file_tools"].getBool());
  EXPECT_FALSE(json.contains("max_concurrent_requests"));
}

TEST_F(ServerConfigTest, FromJsonOverridesFields) {
  auto config = ServerConfig::fromJson(json::JsonValue::parse(R"({
    "name": "files",
    "allowed_paths": ["/srv", "/tmp"],
    "max_concurrent_requests": 2,
    "request_timeout": 1.5,
    "log_level": "debug",
    "unknown_field": 1
  })"));

  EXPECT_EQ(config.name, "files");
  EXPECT_EQ(config.version, "0.1.0");
  ASSERT_TRUE(config.allowed_paths.has_value());
  EXPECT_EQ(config.allowed_paths->size(), 2u);
  EXPECT_EQ(config.max_concurrent_requests, 2);
  EXPECT_EQ(config.requestTimeout(), 1500ms);
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ServerConfigTest, FromJsonReadsLoggingFields) {
  auto config = ServerConfig::fromJson(json::JsonValue::parse(R"({
    "log_format": "json",
    "log_file": "/var/log/toolwire.log",
    "log_max_file_size": 4096,
    "log_max_files": 3
  })"));

  EXPECT_EQ(config.log_format, "json");
  ASSERT_TRUE(config.log_file.has_value());
  EXPECT_EQ(*config.log_file, "/var/log/toolwire.log");
  EXPECT_EQ(config.log_max_file_size, 4096u);
  EXPECT_EQ(config.log_max_files, 3u);

  ServerConfig defaults;
  EXPECT_EQ(defaults.log_format, "text");
  EXPECT_FALSE(defaults.log_file.has_value());
}

TEST_F(ServerConfigTest, TimeoutIsBoundedAbove) {
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"request_timeout":1e20})")),
               ConfigError);

  ServerConfig config;
  config.request_timeout = kMaxRequestTimeout;
  EXPECT_NO_THROW(config.validate());
  EXPECT_GT(config.requestTimeout().count(), 0);

  config.request_timeout = 0.0001;
  EXPECT_EQ(config.requestTimeout(), 1ms);
}

TEST_F(ServerConfigTest, TimeoutAcceptsDurationString) {
  auto config = ServerConfig::fromJson(
      json::JsonValue::parse(R"({"request_timeout":"250ms"})"));
  EXPECT_EQ(config.requestTimeout(), 250ms);
  EXPECT_DOUBLE_EQ(config.request_timeout, 0.25);

  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"request_timeout":"soon"})")),
               ConfigError);
}

TEST_F(ServerConfigTest, ValidationFailures) {
  EXPECT_THROW(ServerConfig::fromJson(json::JsonValue::parse(
                   R"({"max_concurrent_requests":0})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"request_timeout":0})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"request_timeout":-2.0})")),
               ConfigError);
  EXPECT_THROW(
      ServerConfig::fromJson(json::JsonValue::parse(R"({"name":5})")),
      ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"allowed_paths":"/srv"})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"log_level":"chatty"})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"log_format":"xml"})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"log_max_files":-1})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(
                   json::JsonValue::parse(R"({"log_file":""})")),
               ConfigError);
  EXPECT_THROW(ServerConfig::fromJson(json::JsonValue::parse("[]")),
               ConfigError);
}

/**
 * configureLogging replaces the registry's sink; the previous one is put
 * back afterwards.
 */
class ConfigureLoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& registry = logging::LoggerRegistry::instance();
    saved_sink_ = registry.getSink();
    saved_level_ = registry.getGlobalLevel();

    char tmpl[] = "/tmp/toolwire_logcfg_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    auto& registry = logging::LoggerRegistry::instance();
    registry.setSink(saved_sink_);
    registry.setGlobalLevel(saved_level_);
    std::remove((dir_ + "/server.log").c_str());
    rmdir(dir_.c_str());
  }

  std::shared_ptr<logging::LogSink> saved_sink_;
  logging::LogLevel saved_level_;
  std::string dir_;
};

TEST_F(ConfigureLoggingTest, JsonLinesToFile) {
  ServerConfig config;
  config.log_level = "debug";
  config.log_format = "json";
  config.log_file = dir_ + "/server.log";
  configureLogging(config);

  auto& registry = logging::LoggerRegistry::instance();
  EXPECT_EQ(registry.getSink()->type(), logging::SinkType::File);
  EXPECT_EQ(registry.getGlobalLevel(), logging::LogLevel::Debug);

  registry.getOrCreateLogger("config_test")->debug("written to {}", "file");
  registry.getSink()->flush();

  std::ifstream in(*config.log_file);
  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  auto record = json::JsonValue::parse(line);
  EXPECT_EQ(record["message"].getString(), "written to file");
  EXPECT_EQ(record["level"].getString(), "DEBUG");
}

TEST_F(ConfigureLoggingTest, OffUsesNullSink) {
  ServerConfig config;
  config.log_level = "off";
  configureLogging(config);

  auto& registry = logging::LoggerRegistry::instance();
  EXPECT_EQ(registry.getSink()->type(), logging::SinkType::Null);
  EXPECT_EQ(registry.getGlobalLevel(), logging::LogLevel::Off);
}

TEST_F(ConfigureLoggingTest, UnopenableFileIsConfigError) {
  ServerConfig config;
  config.log_file = dir_ + "/missing/server.log";
  EXPECT_THROW(configureLogging(config), ConfigError);
}

class DurationTest : public ::testing::Test {};

TEST_F(DurationTest, ParsesUnits) {
  EXPECT_EQ(Duration::parse(std::string("500ms")).second, 500ms);
  EXPECT_EQ(Duration::parse(std::string("30s")).second, 30000ms);
  EXPECT_EQ(Duration::parse(std::string("2m")).second, 120000ms);
  EXPECT_EQ(Duration::parse(std::string("1h")).second, 3600000ms);
  EXPECT_FALSE(Duration::parse(std::string("1.5s")).first);
  EXPECT_FALSE(Duration::parse(std::string("s")).first);
  EXPECT_FALSE(Duration::isValid("10 s"));
}

TEST_F(DurationTest, BareNumberIsMilliseconds) {
  auto result = Duration::parse(json::JsonValue(750));
  ASSERT_TRUE(result.first);
  EXPECT_EQ(result.second, 750ms);
}

TEST_F(DurationTest, ToStringPicksLargestUnit) {
  EXPECT_EQ(Duration::toString(7200000ms), "2h");
  EXPECT_EQ(Duration::toString(90000ms), "90s");
  EXPECT_EQ(Duration::toString(1500ms), "1500ms");
}

TEST_F(DurationTest, ErrorNamesField) {
  try {
    parseJsonDuration(json::JsonValue("later"), "request_timeout");
    FAIL() << "expected UnitParseError";
  } catch (const UnitParseError& e) {
    EXPECT_NE(std::string(e.what()).find("request_timeout"),
              std::string::npos);
  }
}

/**
 * Loader tests run against files in a private temp directory.
 */
class ConfigLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char tmpl[] = "/tmp/toolwire_config_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
    unsetenv("TOOLWIRE_CONFIG");
  }

  void TearDown() override {
    for (const auto& file : files_) {
      std::remove(file.c_str());
    }
    rmdir(dir_.c_str());
    unsetenv("TOOLWIRE_CONFIG");
    unsetenv("TOOLWIRE_TEST_NAME");
  }

  std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = dir_ + "/" + name;
    std::ofstream out(path);
    out << content;
    files_.push_back(path);
    return path;
  }

  ServerConfig loadExplicit(const std::string& path) {
    ConfigLoader::Options options;
    options.explicit_path = path;
    return ConfigLoader(options).load();
  }

  std::string dir_;
  std::vector<std::string> files_;
};

TEST_F(ConfigLoaderTest, LoadsYaml) {
  auto path = writeFile("server.yaml",
                        "name: yaml-server\n"
                        "version: \"2.0\"\n"
                        "enable_shell_tools: false\n"
                        "max_concurrent_requests: 4\n"
                        "request_timeout: 30s\n"
                        "allowed_paths:\n"
                        "  - /data\n");

  auto config = loadExplicit(path);
  EXPECT_EQ(config.name, "yaml-server");
  EXPECT_EQ(config.version, "2.0");
  EXPECT_FALSE(config.enable_shell_tools);
  EXPECT_EQ(config.max_concurrent_requests, 4);
  EXPECT_EQ(config.requestTimeout(), 30000ms);
  ASSERT_TRUE(config.allowed_paths.has_value());
  EXPECT_EQ((*config.allowed_paths)[0], "/data");
}

TEST_F(ConfigLoaderTest, LoadsJson) {
  auto path = writeFile("server.json",
                        R"({"name":"json-server","request_timeout":2.5})");

  auto config = loadExplicit(path);
  EXPECT_EQ(config.name, "json-server");
  EXPECT_EQ(config.requestTimeout(), 2500ms);
}

TEST_F(ConfigLoaderTest, EnvironmentVariableSelectsFile) {
  auto path = writeFile("env.yaml", "name: from-env\n");
  setenv("TOOLWIRE_CONFIG", path.c_str(), 1);

  ConfigLoader loader;
  EXPECT_EQ(loader.findConfigFile(), path);
  EXPECT_EQ(loader.load().name, "from-env");
}

TEST_F(ConfigLoaderTest, ExplicitPathBeatsEnvironment) {
  auto env_path = writeFile("env.yaml", "name: from-env\n");
  auto cli_path = writeFile("cli.yaml", "name: from-cli\n");
  setenv("TOOLWIRE_CONFIG", env_path.c_str(), 1);

  EXPECT_EQ(loadExplicit(cli_path).name, "from-cli");
}

TEST_F(ConfigLoaderTest, SubstitutesEnvironmentVariables) {
  setenv("TOOLWIRE_TEST_NAME", "substituted", 1);
  auto path = writeFile("subst.yaml",
                        "name: ${TOOLWIRE_TEST_NAME}\n"
                        "version: \"${TOOLWIRE_TEST_UNSET_VERSION:-9.9}\"\n");

  auto config = loadExplicit(path);
  EXPECT_EQ(config.name, "substituted");
  EXPECT_EQ(config.version, "9.9");
}

TEST_F(ConfigLoaderTest, UndefinedVariableWithoutDefaultFails) {
  auto path = writeFile("bad.yaml", "name: ${TOOLWIRE_TEST_NEVER_SET}\n");
  EXPECT_THROW(loadExplicit(path), ConfigError);
}

TEST_F(ConfigLoaderTest, QuotedScalarsStayStrings) {
  auto value = ConfigLoader::parseContent("name: \"123\"\nport: 123\n",
                                          "inline.yaml");
  EXPECT_TRUE(value["name"].isString());
  EXPECT_TRUE(value["port"].isInteger());
}

TEST_F(ConfigLoaderTest, MalformedFilesFail) {
  EXPECT_THROW(loadExplicit(writeFile("broken.json", "{\"name\":")),
               ConfigError);
  EXPECT_THROW(loadExplicit(writeFile("broken.yaml", "name: [unclosed\n")),
               ConfigError);
  EXPECT_THROW(loadExplicit(dir_ + "/missing.yaml"), ConfigError);
}

}  // namespace
}  // namespace config
}  // namespace toolwire
