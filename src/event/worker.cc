#define TOOLWIRE_LOG_COMPONENT "event"

#include <pthread.h>

#include <atomic>
#include <limits>
#include <stdexcept>

#include "toolwire/event/event_loop.h"
#include "toolwire/logging/log_macros.h"

namespace toolwire {
namespace event {

/**
 * @brief Default implementation of Worker
 */
class WorkerImpl : public Worker {
 public:
  WorkerImpl(const std::string& name, DispatcherPtr dispatcher)
      : name_(name), dispatcher_(std::move(dispatcher)), running_(false) {}

  ~WorkerImpl() override { stop(); }

  void start() override {
    if (running_.exchange(true)) {
      return;  // Already running
    }

    thread_ = std::make_unique<std::thread>([this]() { threadRoutine(); });
  }

  void stop() override {
    if (!running_.exchange(false)) {
      return;  // Already stopped
    }

    dispatcher_->exit();

    if (thread_ && thread_->joinable()) {
      thread_->join();
    }
    thread_.reset();
  }

  Dispatcher& dispatcher() override { return *dispatcher_; }

  void post(PostCb task, PostCb on_complete) override {
    load_.fetch_add(1);
    dispatcher_->post([this, task = std::move(task),
                       on_complete = std::move(on_complete)]() {
      {
        LoadGuard guard(load_);
        task();
      }
      if (on_complete) {
        on_complete();
      }
    });
  }

  size_t load() const override { return load_.load(); }

  const std::string& name() const override { return name_; }

 private:
  struct LoadGuard {
    explicit LoadGuard(std::atomic<size_t>& load) : load_(load) {}
    ~LoadGuard() { load_.fetch_sub(1); }
    std::atomic<size_t>& load_;
  };

  void threadRoutine() {
    // Linux limits thread names to 15 characters
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

    TOOLWIRE_LOG(Debug, "Worker {} started", name_);
    dispatcher_->run(RunType::RunUntilExit);
    dispatcher_->shutdown();
    TOOLWIRE_LOG(Debug, "Worker {} stopped", name_);
  }

  std::string name_;
  DispatcherPtr dispatcher_;
  std::atomic<bool> running_;
  std::atomic<size_t> load_{0};
  std::unique_ptr<std::thread> thread_;
};

class DefaultWorkerFactory : public WorkerFactory {
 public:
  explicit DefaultWorkerFactory(const std::string& prefix) : prefix_(prefix) {}

  WorkerPtr createWorker(uint32_t index,
                         DispatcherFactory& dispatcher_factory) override {
    std::string name = prefix_ + "_" + std::to_string(index);
    auto dispatcher = dispatcher_factory.createDispatcher(name);
    return std::make_unique<WorkerImpl>(name, std::move(dispatcher));
  }

 private:
  std::string prefix_;
};

WorkerFactoryPtr createDefaultWorkerFactory(const std::string& prefix) {
  return std::make_unique<DefaultWorkerFactory>(prefix);
}

/**
 * @brief Default implementation of ThreadPool
 */
class ThreadPoolImpl : public ThreadPool {
 public:
  ThreadPoolImpl() : next_worker_index_(0) {}

  ~ThreadPoolImpl() override { stop(); }

  void initialize(size_t num_threads,
                  DispatcherFactory& dispatcher_factory,
                  WorkerFactory& worker_factory) override {
    if (!workers_.empty()) {
      throw std::logic_error("ThreadPool already initialized");
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
      workers_.push_back(worker_factory.createWorker(
          static_cast<uint32_t>(i), dispatcher_factory));
    }
  }

  void start() override {
    for (auto& worker : workers_) {
      worker->start();
    }
  }

  void stop() override {
    for (auto& worker : workers_) {
      worker->stop();
    }
  }

  Worker& getWorker(size_t index) override { return *workers_.at(index); }

  Worker& nextWorker() override {
    if (workers_.empty()) {
      throw std::logic_error("ThreadPool has no workers");
    }

    // Least loaded worker; the rotating start index breaks ties round-robin
    size_t start = next_worker_index_.fetch_add(1) % workers_.size();
    size_t best = start;
    size_t best_load = std::numeric_limits<size_t>::max();
    for (size_t i = 0; i < workers_.size(); ++i) {
      size_t index = (start + i) % workers_.size();
      size_t load = workers_[index]->load();
      if (load < best_load) {
        best = index;
        best_load = load;
        if (load == 0) {
          break;
        }
      }
    }
    return *workers_[best];
  }

  size_t size() const override { return workers_.size(); }

 private:
  std::vector<WorkerPtr> workers_;
  std::atomic<size_t> next_worker_index_;
};

ThreadPoolPtr createThreadPool() { return std::make_unique<ThreadPoolImpl>(); }

}  // namespace event
}  // namespace toolwire
