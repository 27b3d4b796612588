#include "toolwire/logging/log_formatter.h"

#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

namespace toolwire {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", date, static_cast<int>(ms.count()));
}

std::string threadIdString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] [T:{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level), threadIdString(msg.thread_id));

  if (msg.component != Component::Root) {
    fmt::format_to(it, "[{}", componentToString(msg.component));
    if (!msg.component_name.empty()) {
      fmt::format_to(it, ".{}", msg.component_name);
    }
    fmt::format_to(it, "] ");
  }

  fmt::format_to(it, "[{}] ", msg.logger_name);

  if (msg.file && msg.line > 0) {
    fmt::format_to(it, "[{}:{}", msg.file, msg.line);
    if (msg.function) {
      fmt::format_to(it, " {}()", msg.function);
    }
    fmt::format_to(it, "] ");
  }

  if (!msg.request_id.empty()) {
    fmt::format_to(it, "[req:{}] ", msg.request_id);
  }
  if (!msg.method_name.empty()) {
    fmt::format_to(it, "[method:{}] ", msg.method_name);
  }

  fmt::format_to(it, "{}", msg.message);

  if (!msg.key_values.empty()) {
    fmt::format_to(it, " {{");
    bool first = true;
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}{}={}", first ? "" : ", ", kv.first, kv.second);
      first = false;
    }
    fmt::format_to(it, "}}");
  }

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "{{\"timestamp\":\"{}\",\"level\":\"{}\"",
                 formatTimestamp(msg.timestamp), logLevelToString(msg.level));
  fmt::format_to(it, ",\"logger\":\"{}\"", escapeJson(msg.logger_name));
  fmt::format_to(it, ",\"thread\":\"{}\"", threadIdString(msg.thread_id));
  if (msg.process_id > 0) {
    fmt::format_to(it, ",\"pid\":{}", msg.process_id);
  }

  if (msg.component != Component::Root) {
    fmt::format_to(it, ",\"component\":\"{}\"",
                   componentToString(msg.component));
    if (!msg.component_name.empty()) {
      fmt::format_to(it, ",\"component_name\":\"{}\"",
                     escapeJson(msg.component_name));
    }
  }

  if (msg.file) {
    fmt::format_to(it, ",\"file\":\"{}\",\"line\":{}", escapeJson(msg.file),
                   msg.line);
    if (msg.function) {
      fmt::format_to(it, ",\"function\":\"{}\"", escapeJson(msg.function));
    }
  }

  if (!msg.request_id.empty()) {
    fmt::format_to(it, ",\"request_id\":\"{}\"", escapeJson(msg.request_id));
  }
  if (!msg.method_name.empty()) {
    fmt::format_to(it, ",\"method\":\"{}\"", escapeJson(msg.method_name));
  }
  if (!msg.tool_name.empty()) {
    fmt::format_to(it, ",\"tool\":\"{}\"", escapeJson(msg.tool_name));
  }

  fmt::format_to(it, ",\"message\":\"{}\"", escapeJson(msg.message));

  if (!msg.key_values.empty()) {
    fmt::format_to(it, ",\"metadata\":{{");
    bool first = true;
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}\"{}\":\"{}\"", first ? "" : ",",
                     escapeJson(kv.first), escapeJson(kv.second));
      first = false;
    }
    fmt::format_to(it, "}}");
  }

  fmt::format_to(it, "}}");
  return fmt::to_string(out);
}

std::string JsonFormatter::escapeJson(const std::string& str) const {
  std::string out;
  out.reserve(str.size());
  for (char c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          // UTF-8 continuation bytes pass through untouched
          out += c;
        }
        break;
    }
  }
  return out;
}

}  // namespace logging
}  // namespace toolwire
