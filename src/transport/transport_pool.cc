#define TOOLWIRE_LOG_COMPONENT "transport"

#include "toolwire/transport/transport_pool.h"

#include <algorithm>

#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace transport {

void TransportPool::add(TransportSharedPtr transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  transports_.push_back(std::move(transport));
}

bool TransportPool::remove(const TransportSharedPtr& transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(transports_.begin(), transports_.end(), transport);
  if (it == transports_.end()) {
    return false;
  }
  transports_.erase(it);
  return true;
}

size_t TransportPool::broadcast(const json::JsonValue& message) {
  std::vector<TransportSharedPtr> members;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    members = transports_;
  }

  size_t delivered = 0;
  for (auto& transport : members) {
    try {
      transport->send(message);
      ++delivered;
    } catch (const std::exception& e) {
      TOOLWIRE_LOG(Warning, "Broadcast to transport failed: {}", e.what());
    }
  }
  return delivered;
}

void TransportPool::closeAll() {
  std::vector<TransportSharedPtr> members;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    members.swap(transports_);
  }

  for (auto& transport : members) {
    try {
      transport->close();
    } catch (const std::exception& e) {
      TOOLWIRE_LOG(Warning, "Closing transport failed: {}", e.what());
    }
  }
}

size_t TransportPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transports_.size();
}

}  // namespace transport
}  // namespace toolwire
