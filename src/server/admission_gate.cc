#include "toolwire/server/admission_gate.h"

#include <stdexcept>

namespace toolwire {
namespace server {

AdmissionGate::AdmissionGate(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("AdmissionGate capacity must be at least 1");
  }
}

void AdmissionGate::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this]() { return in_use_ < capacity_; });
  ++in_use_;
}

bool AdmissionGate::tryAcquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_use_ >= capacity_) {
    return false;
  }
  ++in_use_;
  return true;
}

void AdmissionGate::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ == 0) {
      throw std::logic_error("AdmissionGate released more often than acquired");
    }
    --in_use_;
  }
  available_.notify_one();
}

size_t AdmissionGate::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

}  // namespace server
}  // namespace toolwire
