/**
 * @file test_dispatcher.cc
 * @brief Tests for the libevent dispatcher, workers and thread pool
 */

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include <gtest/gtest.h>

#include "toolwire/event/event_loop.h"
#include "toolwire/event/libevent_dispatcher.h"

namespace toolwire {
namespace event {
namespace {

using namespace std::chrono_literals;

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    factory_ = createLibeventDispatcherFactory();
    dispatcher_ = factory_->createDispatcher("test");
  }

  void TearDown() override {
    if (thread_.joinable()) {
      dispatcher_->exit();
      thread_.join();
    }
  }

  void runDispatcher() {
    thread_ = std::thread(
        [this]() { dispatcher_->run(RunType::RunUntilExit); });
  }

  DispatcherFactoryPtr factory_;
  DispatcherPtr dispatcher_;
  std::thread thread_;
};

TEST_F(DispatcherTest, BackendName) {
  EXPECT_EQ(factory_->backendName(), "libevent");
  EXPECT_EQ(dispatcher_->name(), "test");
}

TEST_F(DispatcherTest, PostRunsOnDispatcherThread) {
  runDispatcher();

  std::promise<bool> ran;
  auto result = ran.get_future();
  dispatcher_->post(
      [this, &ran]() { ran.set_value(dispatcher_->isThreadSafe()); });

  ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(result.get());
  EXPECT_FALSE(dispatcher_->isThreadSafe());
}

TEST_F(DispatcherTest, PostedCallbacksRunInOrder) {
  runDispatcher();

  std::vector<int> order;
  std::promise<void> done;
  for (int i = 0; i < 5; ++i) {
    dispatcher_->post([&order, i]() { order.push_back(i); });
  }
  dispatcher_->post([&done]() { done.set_value(); });

  ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(DispatcherTest, ExitBeforeRunReturnsImmediately) {
  dispatcher_->exit();

  auto finished = std::async(std::launch::async, [this]() {
    dispatcher_->run(RunType::RunUntilExit);
  });
  EXPECT_EQ(finished.wait_for(2s), std::future_status::ready);
}

TEST_F(DispatcherTest, TimerFiresOnce) {
  runDispatcher();

  std::atomic<int> fired{0};
  std::promise<void> done;
  TimerPtr timer;
  dispatcher_->post([&]() {
    timer = dispatcher_->createTimer([&]() {
      if (++fired == 1) {
        done.set_value();
      }
    });
    timer->enableTimer(20ms);
  });

  ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(fired.load(), 1);

  std::promise<bool> enabled;
  dispatcher_->post([&]() {
    enabled.set_value(timer->enabled());
    timer.reset();
  });
  EXPECT_FALSE(enabled.get_future().get());
}

TEST_F(DispatcherTest, DisabledTimerDoesNotFire) {
  runDispatcher();

  std::atomic<bool> fired{false};
  TimerPtr timer;
  std::promise<void> armed;
  dispatcher_->post([&]() {
    timer = dispatcher_->createTimer([&]() { fired = true; });
    timer->enableTimer(30ms);
    timer->disableTimer();
    armed.set_value();
  });
  armed.get_future().wait();

  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(fired.load());

  std::promise<void> released;
  dispatcher_->post([&]() {
    timer.reset();
    released.set_value();
  });
  released.get_future().wait();
}

class WorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_factory_ = createLibeventDispatcherFactory();
    worker_factory_ = createDefaultWorkerFactory("unit");
  }

  DispatcherFactoryPtr dispatcher_factory_;
  WorkerFactoryPtr worker_factory_;
};

TEST_F(WorkerTest, NamedAfterPrefix) {
  auto worker = worker_factory_->createWorker(3, *dispatcher_factory_);
  EXPECT_EQ(worker->name(), "unit_3");
}

TEST_F(WorkerTest, LoadDropsBeforeCompletion) {
  auto worker = worker_factory_->createWorker(0, *dispatcher_factory_);
  worker->start();

  std::promise<void> release;
  auto release_future = release.get_future().share();
  std::promise<size_t> load_at_completion;

  worker->post([release_future]() { release_future.wait(); },
               [&]() { load_at_completion.set_value(worker->load()); });

  EXPECT_EQ(worker->load(), 1u);
  release.set_value();

  auto load = load_at_completion.get_future();
  ASSERT_EQ(load.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(load.get(), 0u);

  worker->stop();
}

TEST_F(WorkerTest, PoolPrefersIdleWorker) {
  auto pool = createThreadPool();
  pool->initialize(3, *dispatcher_factory_, *worker_factory_);
  pool->start();
  ASSERT_EQ(pool->size(), 3u);

  std::promise<void> release;
  auto release_future = release.get_future().share();

  Worker& first = pool->nextWorker();
  first.post([release_future]() { release_future.wait(); });
  Worker& second = pool->nextWorker();
  second.post([release_future]() { release_future.wait(); });
  Worker& third = pool->nextWorker();

  EXPECT_NE(&first, &second);
  EXPECT_NE(&third, &first);
  EXPECT_NE(&third, &second);
  EXPECT_EQ(third.load(), 0u);

  release.set_value();
  pool->stop();
}

TEST_F(WorkerTest, PoolInitializeTwiceThrows) {
  auto pool = createThreadPool();
  pool->initialize(1, *dispatcher_factory_, *worker_factory_);
  EXPECT_THROW(pool->initialize(1, *dispatcher_factory_, *worker_factory_),
               std::logic_error);
  EXPECT_THROW(pool->getWorker(5), std::out_of_range);
}

}  // namespace
}  // namespace event
}  // namespace toolwire
