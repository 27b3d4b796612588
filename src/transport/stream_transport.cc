#define TOOLWIRE_LOG_COMPONENT "transport"

#include "toolwire/transport/stream_transport.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>

#include "toolwire/logging/log_macros.h"
#include "toolwire/protocol/message.h"

namespace toolwire {
namespace transport {

namespace {

constexpr const char* kContentLength = "Content-Length:";
constexpr size_t kReadChunkSize = 65536;

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

size_t parseContentLength(const std::string& value) {
  std::string digits = trim(value);
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos) {
    throw protocol::ParseError(
        fmt::format("Invalid Content-Length: '{}'", digits));
  }
  try {
    return static_cast<size_t>(std::stoull(digits));
  } catch (const std::out_of_range&) {
    throw protocol::ParseError(
        fmt::format("Content-Length out of range: {}", digits));
  }
}

json::JsonValue decodeBody(const std::string& body) {
  try {
    return json::JsonValue::parse(body);
  } catch (const json::JsonException& e) {
    throw protocol::ParseError(fmt::format("Invalid JSON: {}", e.what()));
  }
}

}  // namespace

StreamTransport::StreamTransport(int input_fd, int output_fd, bool owns_fds)
    : input_fd_(input_fd), output_fd_(output_fd), owns_fds_(owns_fds) {
  if (::pipe(wakeup_fd_) != 0) {
    throw TransportException(
        fmt::format("Failed to create wakeup pipe: {}", std::strerror(errno)));
  }
  for (int fd : wakeup_fd_) {
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
  }
}

StreamTransport::~StreamTransport() {
  close();
  std::lock_guard<std::mutex> lock(read_mutex_);
  closeInputLocked();
  ::close(wakeup_fd_[0]);
  ::close(wakeup_fd_[1]);
}

std::unique_ptr<StreamTransport> StreamTransport::createStdio() {
  return std::make_unique<StreamTransport>(STDIN_FILENO, STDOUT_FILENO, false);
}

void StreamTransport::send(const json::JsonValue& message) {
  std::string body = message.toString();
  std::string frame =
      fmt::format("Content-Length: {}\r\n\r\n", body.size()) + body;

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_ || output_fd_ < 0) {
    throw TransportClosedException();
  }
  writeAll(frame);
}

optional<json::JsonValue> StreamTransport::receive() {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (closed_ || input_fd_ < 0) {
    closeInputLocked();
    return nullopt;
  }
  if (interrupted_) {
    return nullopt;
  }

  optional<size_t> content_length;
  std::string line;
  while (true) {
    if (!readLine(line)) {
      return nullopt;
    }
    std::string header = trim(line);
    if (header.empty()) {
      break;
    }
    if (header.compare(0, std::strlen(kContentLength), kContentLength) == 0) {
      content_length =
          parseContentLength(header.substr(std::strlen(kContentLength)));
    }
  }

  if (!content_length) {
    // Non-strict mode: the next full line is the body
    std::string body;
    if (!readLine(body)) {
      return nullopt;
    }
    TOOLWIRE_LOG(Debug, "Header block without Content-Length, reading line");
    return decodeBody(body);
  }

  std::string body;
  if (!readExact(*content_length, body)) {
    TOOLWIRE_LOG(Warning, "Stream ended inside a {} byte message body",
                 *content_length);
    return nullopt;
  }
  return decodeBody(body);
}

void StreamTransport::close() {
  if (closed_.exchange(true)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (owns_fds_ && output_fd_ >= 0) {
      ::close(output_fd_);
    }
    output_fd_ = -1;
  }

  // A reader blocked in read() keeps the input descriptor; it is released
  // when that receive() returns or on destruction.
  std::unique_lock<std::mutex> lock(read_mutex_, std::try_to_lock);
  if (lock.owns_lock()) {
    closeInputLocked();
  }
}

void StreamTransport::interrupt() {
  int saved_errno = errno;
  interrupted_ = true;
  char byte = 1;
  ssize_t rc = ::write(wakeup_fd_[1], &byte, 1);
  (void)rc;  // EAGAIN means a wakeup is already pending
  errno = saved_errno;
}

void StreamTransport::closeInputLocked() {
  if (owns_fds_ && input_fd_ >= 0) {
    ::close(input_fd_);
  }
  input_fd_ = -1;
  read_buffer_.clear();
}

size_t StreamTransport::fill() {
  char chunk[kReadChunkSize];
  while (true) {
    struct pollfd fds[2];
    fds[0].fd = input_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wakeup_fd_[0];
    fds[1].events = POLLIN;
    int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw TransportException(
          fmt::format("Poll failed: {}", std::strerror(errno)));
    }
    if (interrupted_ || (fds[1].revents & POLLIN)) {
      TOOLWIRE_LOG(Debug, "Read interrupted, reporting end of stream");
      return 0;
    }

    ssize_t n = ::read(input_fd_, chunk, sizeof(chunk));
    if (n > 0) {
      read_buffer_.append(chunk, static_cast<size_t>(n));
      return static_cast<size_t>(n);
    }
    if (n == 0) {
      return 0;
    }
    if (errno == EINTR) {
      continue;
    }
    throw TransportException(
        fmt::format("Read failed: {}", std::strerror(errno)));
  }
}

bool StreamTransport::readLine(std::string& line) {
  size_t newline;
  while ((newline = read_buffer_.find('\n')) == std::string::npos) {
    if (fill() == 0) {
      if (read_buffer_.empty() || interrupted_) {
        read_buffer_.clear();
        return false;
      }
      // Last line without a terminator
      line = std::move(read_buffer_);
      read_buffer_.clear();
      return true;
    }
  }
  line = read_buffer_.substr(0, newline);
  read_buffer_.erase(0, newline + 1);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

bool StreamTransport::readExact(size_t length, std::string& out) {
  while (read_buffer_.size() < length) {
    if (fill() == 0) {
      read_buffer_.clear();
      return false;
    }
  }
  out = read_buffer_.substr(0, length);
  read_buffer_.erase(0, length);
  return true;
}

void StreamTransport::writeAll(const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n =
        ::write(output_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw TransportException(
          fmt::format("Write failed: {}", std::strerror(errno)));
    }
    written += static_cast<size_t>(n);
  }
}

}  // namespace transport
}  // namespace toolwire
