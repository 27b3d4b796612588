#ifndef TOOLWIRE_EVENT_EVENT_LOOP_H
#define TOOLWIRE_EVENT_EVENT_LOOP_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace toolwire {
namespace event {

class Dispatcher;
class Timer;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using TimerPtr = std::unique_ptr<Timer>;

using PostCb = std::function<void()>;
using TimerCb = std::function<void()>;

// Run types for dispatcher
enum class RunType {
  Block,        // Run until no more events are pending
  NonBlock,     // Run one iteration
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Abstract interface for timers
 *
 * Timers execute callbacks on their dispatcher thread after a duration.
 * A timer must be enabled, disabled and destroyed on that thread.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  /**
   * Disable the timer. No-op if already disabled.
   */
  virtual void disableTimer() = 0;

  /**
   * Enable the timer to fire once after the given duration.
   */
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  /**
   * Same as enableTimer() with microsecond resolution.
   */
  virtual void enableHRTimer(std::chrono::microseconds duration) = 0;

  virtual bool enabled() = 0;
};

/**
 * @brief Base dispatcher interface
 *
 * Provides minimal interface for posting callbacks and thread safety checks.
 */
class DispatcherBase {
 public:
  virtual ~DispatcherBase() = default;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;
};

/**
 * @brief Event dispatcher
 *
 * Single-threaded event loop. Other threads hand work to it via post().
 * Each worker thread owns one dispatcher.
 */
class Dispatcher : public DispatcherBase {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  /**
   * Exit the event loop. Safe to call from any thread, including before
   * run() has started.
   */
  virtual void exit() = 0;

  virtual void run(RunType type) = 0;

  /**
   * Return approximate monotonic time without a system call.
   */
  virtual std::chrono::steady_clock::time_point approximateMonotonicTime()
      const = 0;
  virtual void updateApproximateMonotonicTime() = 0;

  /**
   * Drop queued callbacks. Only acts on the dispatcher thread.
   */
  virtual void shutdown() = 0;
};

/**
 * @brief Factory for creating dispatchers
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

/**
 * @brief Worker thread running its own dispatcher
 *
 * Tasks handed to post() run in order on the worker thread. load() counts
 * tasks posted but not yet finished and is used to balance work across a
 * ThreadPool.
 */
class Worker {
 public:
  virtual ~Worker() = default;

  virtual void start() = 0;

  /**
   * Stop the worker thread. Tasks still queued are dropped; a running task
   * is waited for.
   */
  virtual void stop() = 0;

  virtual Dispatcher& dispatcher() = 0;

  /**
   * @param on_complete Runs on the worker thread once task has returned and
   * load() no longer counts it
   */
  virtual void post(PostCb task, PostCb on_complete = nullptr) = 0;

  virtual size_t load() const = 0;

  virtual const std::string& name() const = 0;
};

using WorkerPtr = std::unique_ptr<Worker>;

class WorkerFactory {
 public:
  virtual ~WorkerFactory() = default;

  /**
   * @param index Worker index, used for naming ("<prefix>_<index>")
   */
  virtual WorkerPtr createWorker(uint32_t index,
                                 DispatcherFactory& dispatcher_factory) = 0;
};

using WorkerFactoryPtr = std::unique_ptr<WorkerFactory>;

WorkerFactoryPtr createDefaultWorkerFactory(
    const std::string& prefix = "worker");

/**
 * @brief Pool of worker threads
 *
 * nextWorker() returns the worker with the fewest outstanding tasks.
 */
class ThreadPool {
 public:
  virtual ~ThreadPool() = default;

  virtual void initialize(size_t num_threads,
                          DispatcherFactory& dispatcher_factory,
                          WorkerFactory& worker_factory) = 0;

  virtual void start() = 0;

  virtual void stop() = 0;

  virtual Worker& getWorker(size_t index) = 0;

  virtual Worker& nextWorker() = 0;

  virtual size_t size() const = 0;
};

using ThreadPoolPtr = std::unique_ptr<ThreadPool>;

ThreadPoolPtr createThreadPool();

}  // namespace event
}  // namespace toolwire

#endif  // TOOLWIRE_EVENT_EVENT_LOOP_H
