#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>

#include "toolwire/logging/log_formatter.h"
#include "toolwire/logging/log_message.h"

namespace toolwire {
namespace logging {

// Base sink interface
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  virtual bool supportsRotation() const { return false; }
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink. Defaults to stderr: stdout carries protocol frames.
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

// File sink with size and age based rotation
class RotatingFileSink : public LogSink {
 public:
  struct Config {
    std::string base_filename;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
    std::chrono::seconds rotation_period{0};  // zero disables
    bool auto_flush = false;
  };

  explicit RotatingFileSink(const Config& config);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::File; }
  bool supportsRotation() const override { return true; }

  bool isOpen();

 private:
  void openFile();
  void closeFile();
  void rotate();

  Config config_;
  std::ofstream file_;
  size_t current_size_{0};
  std::chrono::system_clock::time_point last_rotation_;
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Forwards formatted lines to a host-provided callback
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback)
      : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg.level, msg.logger_name, formatter_->format(msg));
    }
  }

  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<RotatingFileSink> createFileSink(
      const std::string& filename,
      size_t max_file_size = 10 * 1024 * 1024,
      size_t max_files = 5);
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
  static std::unique_ptr<LogSink> createNullSink();
};

}  // namespace logging
}  // namespace toolwire
