#define TOOLWIRE_LOG_COMPONENT "transport"

#include "toolwire/transport/socket_transport.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include <fmt/format.h>

#include "toolwire/logging/log_macros.h"
#include "toolwire/protocol/message.h"

namespace toolwire {
namespace transport {

namespace {

bool isConnectionClosed(int err) {
  return err == ECONNRESET || err == EPIPE || err == ENOTCONN ||
         err == ESHUTDOWN;
}

}  // namespace

SocketTransport::SocketTransport(int fd, bool owns_fd)
    : fd_(fd), owns_fd_(owns_fd) {}

SocketTransport::~SocketTransport() { close(); }

void SocketTransport::send(const json::JsonValue& message) {
  std::string body = message.toString();

  std::lock_guard<std::mutex> lock(send_mutex_);
  if (closed_) {
    throw TransportClosedException();
  }

  while (true) {
    ssize_t n = ::send(fd_, body.data(), body.size(), MSG_NOSIGNAL);
    if (n >= 0) {
      if (static_cast<size_t>(n) != body.size()) {
        throw TransportException(fmt::format(
            "Short send: {} of {} bytes", n, body.size()));
      }
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    throw TransportException(
        fmt::format("Send failed: {}", std::strerror(errno)));
  }
}

optional<json::JsonValue> SocketTransport::receive() {
  std::lock_guard<std::mutex> lock(receive_mutex_);
  if (closed_ || interrupted_) {
    return nullopt;
  }

  // Peek with MSG_TRUNC to learn the size of the pending message
  ssize_t size;
  char peek_byte;
  do {
    size = ::recv(fd_, &peek_byte, 1, MSG_PEEK | MSG_TRUNC);
  } while (size < 0 && errno == EINTR);

  if (size == 0) {
    TOOLWIRE_LOG(Debug, "Peer closed socket fd={}", fd_.load());
    return nullopt;
  }
  if (size < 0) {
    if (isConnectionClosed(errno) || closed_) {
      return nullopt;
    }
    throw TransportException(
        fmt::format("Receive failed: {}", std::strerror(errno)));
  }

  std::string body(static_cast<size_t>(size), '\0');
  ssize_t n;
  do {
    n = ::recv(fd_, &body[0], body.size(), 0);
  } while (n < 0 && errno == EINTR);

  if (n == 0 || interrupted_) {
    return nullopt;
  }
  if (n < 0) {
    if (isConnectionClosed(errno) || closed_) {
      return nullopt;
    }
    throw TransportException(
        fmt::format("Receive failed: {}", std::strerror(errno)));
  }
  body.resize(static_cast<size_t>(n));

  try {
    return json::JsonValue::parse(body);
  } catch (const json::JsonException& e) {
    throw protocol::ParseError(fmt::format("Invalid JSON: {}", e.what()));
  }
}

void SocketTransport::interrupt() {
  int saved_errno = errno;
  interrupted_ = true;
  int fd = fd_.load();
  if (fd >= 0) {
    // A blocked recv() returns 0
    ::shutdown(fd, SHUT_RD);
  }
  errno = saved_errno;
}

void SocketTransport::close() {
  if (closed_.exchange(true)) {
    return;
  }

  // Wakes a receiver blocked in recv()
  ::shutdown(fd_, SHUT_RDWR);

  std::lock_guard<std::mutex> send_lock(send_mutex_);
  std::lock_guard<std::mutex> receive_lock(receive_mutex_);
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
}

}  // namespace transport
}  // namespace toolwire
