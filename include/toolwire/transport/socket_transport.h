#ifndef TOOLWIRE_TRANSPORT_SOCKET_TRANSPORT_H
#define TOOLWIRE_TRANSPORT_SOCKET_TRANSPORT_H

#include <atomic>
#include <mutex>

#include "toolwire/transport/transport.h"

namespace toolwire {
namespace transport {

/**
 * One JSON message per datagram over a connected message-oriented socket
 * (SOCK_SEQPACKET, or any socket preserving message boundaries).
 *
 * A peer that closed or reset the connection ends the stream.
 */
class SocketTransport : public Transport {
 public:
  explicit SocketTransport(int fd, bool owns_fd = true);
  ~SocketTransport() override;

  void send(const json::JsonValue& message) override;
  optional<json::JsonValue> receive() override;
  void close() override;
  void interrupt() override;
  bool isClosed() const override { return closed_; }

  int fd() const { return fd_; }

 private:
  std::atomic<int> fd_;
  const bool owns_fd_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> interrupted_{false};
  std::mutex send_mutex_;
  std::mutex receive_mutex_;
};

}  // namespace transport
}  // namespace toolwire

#endif  // TOOLWIRE_TRANSPORT_SOCKET_TRANSPORT_H
