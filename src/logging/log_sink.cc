#include "toolwire/logging/log_sink.h"

#include <cstdio>
#include <filesystem>
#include <iostream>

namespace toolwire {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream << line << '\n';
  stream.flush();
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream.flush();
}

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  openFile();
}

RotatingFileSink::~RotatingFileSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  closeFile();
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string formatted = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    openFile();
  }

  if (config_.max_file_size > 0 &&
      current_size_ + formatted.size() + 1 > config_.max_file_size) {
    rotate();
  } else if (config_.rotation_period != std::chrono::seconds::zero() &&
             std::chrono::system_clock::now() - last_rotation_ >
                 config_.rotation_period) {
    rotate();
  }

  file_ << formatted << '\n';
  current_size_ += formatted.size() + 1;

  if (config_.auto_flush) {
    file_.flush();
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

bool RotatingFileSink::isOpen() {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void RotatingFileSink::openFile() {
  closeFile();
  file_.open(config_.base_filename, std::ios::app);
  if (file_.is_open()) {
    file_.seekp(0, std::ios::end);
    current_size_ = static_cast<size_t>(file_.tellp());
    last_rotation_ = std::chrono::system_clock::now();
  }
}

void RotatingFileSink::closeFile() {
  if (file_.is_open()) {
    file_.close();
  }
}

void RotatingFileSink::rotate() {
  namespace fs = std::filesystem;
  closeFile();

  std::error_code ec;
  if (config_.max_files > 0) {
    // base.N is the oldest; shift base.(i) -> base.(i+1)
    fs::remove(config_.base_filename + "." + std::to_string(config_.max_files),
               ec);
    for (size_t i = config_.max_files - 1; i > 0; --i) {
      std::string from = config_.base_filename + "." + std::to_string(i);
      if (fs::exists(from, ec)) {
        fs::rename(from, config_.base_filename + "." + std::to_string(i + 1),
                   ec);
      }
    }
    if (fs::exists(config_.base_filename, ec)) {
      fs::rename(config_.base_filename, config_.base_filename + ".1", ec);
    }
  } else {
    fs::remove(config_.base_filename, ec);
  }

  openFile();
}

std::unique_ptr<RotatingFileSink> SinkFactory::createFileSink(
    const std::string& filename, size_t max_file_size, size_t max_files) {
  RotatingFileSink::Config config;
  config.base_filename = filename;
  config.max_file_size = max_file_size;
  config.max_files = max_files;
  // Lines must survive an abrupt exit
  config.auto_flush = true;
  return std::make_unique<RotatingFileSink>(config);
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

}  // namespace logging
}  // namespace toolwire
