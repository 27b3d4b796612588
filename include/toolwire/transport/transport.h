#ifndef TOOLWIRE_TRANSPORT_TRANSPORT_H
#define TOOLWIRE_TRANSPORT_TRANSPORT_H

#include <memory>
#include <stdexcept>
#include <string>

#include "toolwire/core/compat.h"
#include "toolwire/json/json_bridge.h"

namespace toolwire {
namespace transport {

// Read or write failure that is not a clean end of stream
class TransportException : public std::runtime_error {
 public:
  explicit TransportException(const std::string& message)
      : std::runtime_error(message) {}
};

class TransportClosedException : public TransportException {
 public:
  TransportClosedException() : TransportException("Transport is closed") {}
};

/**
 * Duplex channel carrying one JSON message at a time in each direction.
 *
 * send() may be called from several threads; implementations serialize
 * writes. receive() has a single reader.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * Serialize and write one message.
   *
   * @throws TransportClosedException after close()
   * @throws TransportException on write failure
   */
  virtual void send(const json::JsonValue& message) = 0;

  /**
   * Block until a full message arrives.
   *
   * @return the decoded message, or nullopt at end of stream (including
   *         after close())
   * @throws protocol::ParseError if the bytes read are not valid JSON
   * @throws TransportException on read failure
   */
  virtual optional<json::JsonValue> receive() = 0;

  // Idempotent
  virtual void close() = 0;

  /**
   * Wake a reader blocked in receive(); it and every later receive() report
   * end of stream. Unlike close() this is async-signal-safe, so a signal
   * handler may call it.
   */
  virtual void interrupt() = 0;

  virtual bool isClosed() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;
using TransportSharedPtr = std::shared_ptr<Transport>;

/**
 * Closes the transport when the guard leaves scope, on every exit path.
 */
class TransportGuard {
 public:
  explicit TransportGuard(Transport& transport) : transport_(transport) {}
  ~TransportGuard() { transport_.close(); }

  TransportGuard(const TransportGuard&) = delete;
  TransportGuard& operator=(const TransportGuard&) = delete;

  Transport& operator*() const { return transport_; }
  Transport* operator->() const { return &transport_; }

 private:
  Transport& transport_;
};

}  // namespace transport
}  // namespace toolwire

#endif  // TOOLWIRE_TRANSPORT_TRANSPORT_H
