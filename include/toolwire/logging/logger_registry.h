#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolwire/logging/logger.h"

namespace toolwire {
namespace logging {

// Glob-style pattern ("server.*", "transport.?tream") bound to a level
struct LogPattern {
  std::string glob;
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& g, LogLevel lvl)
      : glob(g), pattern(globToRegex(g)), level(lvl) {}

  bool matches(const std::string& name) const {
    return std::regex_match(name, pattern);
  }

 private:
  static std::string globToRegex(const std::string& glob);
};

class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  // Get or create a named logger; new loggers share the default sink
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  // Applies to every logger not governed by a pattern
  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Loggers named "<Component>.*"
  void setComponentLevel(Component component, LogLevel level);

  // Later patterns take precedence over earlier ones
  void setPattern(const std::string& pattern, LogLevel level);
  void clearPatterns();

  // Replace the sink used by every logger
  void setSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getSink() const;

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name) const;

  std::vector<std::string> getLoggerNames() const;

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  // Assumes mutex_ is held
  LogLevel effectiveLevelLocked(const std::string& name) const;
  void refreshLevelsLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> sink_;
};

// Logger bound to a component, named "<Component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component),
        logger_(LoggerRegistry::instance().getOrCreateLogger(
            LoggerRegistry::getComponentPath(component, name))) {}

  template <typename... Args>
  void log(LogLevel level, const char* fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      LogContext ctx;
      ctx.component = component_;
      logger_->logWithContext(level, ctx, fmt, std::forward<Args>(args)...);
    }
  }

 private:
  Component component_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace toolwire
