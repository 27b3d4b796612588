#ifndef TOOLWIRE_EVENT_LIBEVENT_DISPATCHER_H
#define TOOLWIRE_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>

#include "toolwire/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace toolwire {
namespace event {

// Rename to avoid conflict with struct event
using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  // DispatcherBase interface
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  // Dispatcher interface
  const std::string& name() override { return name_; }

  TimerPtr createTimer(TimerCb cb) override;

  void exit() override;

  void run(RunType type) override;

  std::chrono::steady_clock::time_point approximateMonotonicTime()
      const override;
  void updateApproximateMonotonicTime() override;

  void shutdown() override;

  event_base* base() { return base_; }

 private:
  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    void enableHRTimer(std::chrono::microseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_;
    bool enabled_;
  };

  void runPostCallbacks();
  void initializeLibevent();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  // Post callback handling
  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};  // Pipe for waking up event loop
  libevent_event* wakeup_event_{nullptr};

  std::chrono::steady_clock::time_point approximate_monotonic_time_;
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace toolwire

#endif  // TOOLWIRE_EVENT_LIBEVENT_DISPATCHER_H
