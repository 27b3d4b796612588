#define TOOLWIRE_LOG_COMPONENT "event"

#include "toolwire/event/libevent_dispatcher.h"

#include <stdexcept>

#include <unistd.h>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace event {

namespace {

// Threading support has to be switched on before the first event_base is
// created; call_once keeps it out of static initialization.
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();

  // thread_id_ is bound when run() is called
  initializeLibevent();
  updateApproximateMonotonicTime();
}

LibeventDispatcher::~LibeventDispatcher() {
  shutdown();

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  const char* method = event_base_get_method(base_);
  TOOLWIRE_LOG(Debug, "Dispatcher {} using backend {}", name_,
               method ? method : "unknown");

  if (pipe(wakeup_fd_) != 0) {
    event_base_free(base_);
    base_ = nullptr;
    throw std::runtime_error("Failed to create wakeup pipe");
  }

  evutil_make_socket_nonblocking(static_cast<evutil_socket_t>(wakeup_fd_[0]));
  evutil_make_socket_nonblocking(static_cast<evutil_socket_t>(wakeup_fd_[1]));

  wakeup_event_ =
      event_new(base_, static_cast<evutil_socket_t>(wakeup_fd_[0]),
                EV_READ | EV_PERSIST,
                reinterpret_cast<event_callback_fn>(
                    &LibeventDispatcher::postWakeupCallback),
                this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }

  event_add(wakeup_event_, nullptr);
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup && !isThreadSafe()) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  auto owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (!isThreadSafe()) {
    // Empty callback just to wake up the loop
    post([]() {});
  } else {
    event_base_loopbreak(base_);
  }
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  int flags = 0;
  switch (type) {
    case RunType::Block:
      break;
    case RunType::NonBlock:
      flags = EVLOOP_NONBLOCK;
      break;
    case RunType::RunUntilExit:
      // exit() may have been called before the thread got here
      while (!exit_requested_) {
        updateApproximateMonotonicTime();
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      exit_requested_ = false;
      return;
  }

  updateApproximateMonotonicTime();
  int result = event_base_loop(base_, flags);
  if (result < 0) {
    TOOLWIRE_LOG(Error, "Dispatcher {} event loop failed", name_);
  }
  runPostCallbacks();
}

std::chrono::steady_clock::time_point
LibeventDispatcher::approximateMonotonicTime() const {
  return approximate_monotonic_time_;
}

void LibeventDispatcher::updateApproximateMonotonicTime() {
  approximate_monotonic_time_ = std::chrono::steady_clock::now();
}

void LibeventDispatcher::shutdown() {
  if (isThreadSafe()) {
    std::lock_guard<std::mutex> lock(post_mutex_);
    if (!post_callbacks_.empty()) {
      TOOLWIRE_LOG(Debug, "Dispatcher {} dropping {} queued callbacks", name_,
                   post_callbacks_.size());
    }
    std::queue<PostCb> empty;
    post_callbacks_.swap(empty);
  }
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

// TimerImpl implementation
LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)), enabled_(false) {
  event_ = evtimer_new(
      dispatcher_.base(),
      reinterpret_cast<event_callback_fn>(&TimerImpl::timerCallback), this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_ && event_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;

  event_add(event_, &tv);
  enabled_ = true;
}

void LibeventDispatcher::TimerImpl::enableHRTimer(
    std::chrono::microseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000000;
  tv.tv_usec = duration.count() % 1000000;

  event_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);

  timer->enabled_ = false;
  timer->dispatcher_.updateApproximateMonotonicTime();

  // The callback may schedule destruction of this timer; do not touch it
  // afterwards.
  timer->cb_();
}

const std::string LibeventDispatcherFactory::backend_name_ = "libevent";

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  return backend_name_;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace toolwire
