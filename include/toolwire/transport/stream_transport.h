#ifndef TOOLWIRE_TRANSPORT_STREAM_TRANSPORT_H
#define TOOLWIRE_TRANSPORT_STREAM_TRANSPORT_H

#include <atomic>
#include <mutex>
#include <string>

#include "toolwire/transport/transport.h"

namespace toolwire {
namespace transport {

/**
 * Content-Length framed messages over a pair of byte-stream descriptors.
 *
 * Wire format:
 *   Content-Length: <N>\r\n
 *   \r\n
 *   <N bytes of UTF-8 JSON>
 *
 * Header lines other than Content-Length are ignored. A header block without
 * Content-Length falls back to reading the next line as the body.
 */
class StreamTransport : public Transport {
 public:
  /**
   * @param owns_fds close both descriptors on close()
   */
  StreamTransport(int input_fd, int output_fd, bool owns_fds = false);
  ~StreamTransport() override;

  // stdin/stdout; the descriptors stay open after close()
  static std::unique_ptr<StreamTransport> createStdio();

  void send(const json::JsonValue& message) override;
  optional<json::JsonValue> receive() override;
  void close() override;
  void interrupt() override;
  bool isClosed() const override { return closed_; }

 private:
  // Returns bytes read, 0 at end of stream or once interrupted
  size_t fill();
  bool readLine(std::string& line);
  bool readExact(size_t length, std::string& out);
  void writeAll(const std::string& data);
  void closeInputLocked();

  int input_fd_;
  int output_fd_;
  const bool owns_fds_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> interrupted_{false};
  int wakeup_fd_[2]{-1, -1};  // interrupt() writes, fill() polls

  std::mutex read_mutex_;
  std::mutex write_mutex_;
  std::string read_buffer_;
};

}  // namespace transport
}  // namespace toolwire

#endif  // TOOLWIRE_TRANSPORT_STREAM_TRANSPORT_H
