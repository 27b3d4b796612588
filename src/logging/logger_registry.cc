#include "toolwire/logging/logger_registry.h"

namespace toolwire {
namespace logging {

std::string LogPattern::globToRegex(const std::string& glob) {
  std::string regex;
  for (char c : glob) {
    switch (c) {
      case '*':
        regex += ".*";
        break;
      case '?':
        regex += ".";
        break;
      case '.':
      case '(':
      case ')':
      case '[':
      case ']':
      case '+':
      case '^':
      case '$':
      case '|':
      case '\\':
        regex += '\\';
        regex += c;
        break;
      default:
        regex += c;
        break;
    }
  }
  return regex;
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry()
    : sink_(std::make_shared<StdioSink>(StdioSink::Stderr)) {
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(effectiveLevelLocked(name));
  logger->setSink(sink_);
  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[static_cast<int>(component)] = level;
  refreshLevelsLocked();
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  refreshLevelsLocked();
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  refreshLevelsLocked();
}

void LoggerRegistry::setSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sink_;
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel threshold = effectiveLevelLocked(name);
  return threshold != LogLevel::Off && level >= threshold;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return effectiveLevelLocked(name);
}

LogLevel LoggerRegistry::effectiveLevelLocked(const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (it->matches(name)) {
      return it->level;
    }
  }

  size_t dot = name.find('.');
  if (dot != std::string::npos) {
    std::string prefix = name.substr(0, dot);
    for (int i = 0; i < static_cast<int>(Component::Count); ++i) {
      if (prefix == componentToString(static_cast<Component>(i))) {
        auto level = component_levels_.find(i);
        if (level != component_levels_.end()) {
          return level->second;
        }
        break;
      }
    }
  }

  return global_level_;
}

void LoggerRegistry::refreshLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(effectiveLevelLocked(entry.first));
  }
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

std::string LoggerRegistry::getComponentPath(Component comp,
                                             const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace toolwire
