#ifndef TOOLWIRE_SERVER_ADMISSION_GATE_H
#define TOOLWIRE_SERVER_ADMISSION_GATE_H

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace toolwire {
namespace server {

/**
 * Counting gate bounding the number of requests executing at once.
 */
class AdmissionGate {
 public:
  // capacity must be at least 1
  explicit AdmissionGate(size_t capacity);

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  // Blocks until a slot is free
  void acquire();

  bool tryAcquire();

  void release();

  size_t inUse() const;
  size_t capacity() const { return capacity_; }

 private:
  const size_t capacity_;
  size_t in_use_{0};
  mutable std::mutex mutex_;
  std::condition_variable available_;
};

}  // namespace server
}  // namespace toolwire

#endif  // TOOLWIRE_SERVER_ADMISSION_GATE_H
