#ifndef TOOLWIRE_TRANSPORT_TRANSPORT_POOL_H
#define TOOLWIRE_TRANSPORT_TRANSPORT_POOL_H

#include <mutex>
#include <vector>

#include "toolwire/transport/transport.h"

namespace toolwire {
namespace transport {

// Set of transports sharing outbound notifications
class TransportPool {
 public:
  TransportPool() = default;
  ~TransportPool() = default;

  void add(TransportSharedPtr transport);

  // Returns false if the transport was not a member
  bool remove(const TransportSharedPtr& transport);

  /**
   * Send message to every member. A member that fails is logged and
   * skipped.
   *
   * @return number of members that accepted the message
   */
  size_t broadcast(const json::JsonValue& message);

  void closeAll();

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<TransportSharedPtr> transports_;
};

}  // namespace transport
}  // namespace toolwire

#endif  // TOOLWIRE_TRANSPORT_TRANSPORT_POOL_H
