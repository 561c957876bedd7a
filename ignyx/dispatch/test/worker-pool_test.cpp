#include "ignyx/worker-pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "ignyx/background-tasks.hpp"
#include "ignyx/timedef.hpp"
#include "ignyx/timer-queue.hpp"

namespace ignyx {

TEST(WorkerPool, StopRunsQueuedJobs) {
  WorkerPool pool(2, "test");
  EXPECT_EQ(pool.nbThreads(), 2U);
  std::atomic<int> nbRun{0};
  for (int jobPos = 0; jobPos < 100; ++jobPos) {
    ASSERT_TRUE(pool.post([&nbRun] { ++nbRun; }));
  }
  pool.stop();
  EXPECT_EQ(nbRun.load(), 100);
  EXPECT_FALSE(pool.post([&nbRun] { ++nbRun; }));
  pool.stop();
}

TEST(WorkerPool, ZeroThreadsMeansOne) { EXPECT_EQ(WorkerPool(0, "single").nbThreads(), 1U); }

TEST(TimerQueue, FiresInDeadlineOrder) {
  TimerQueue timers;
  std::mutex mutex;
  std::vector<int> fired;
  const auto now = SteadyClock::now();
  for (int delayMs : {30, 10, 20, 10}) {
    timers.schedule(now + std::chrono::milliseconds{delayMs}, [&mutex, &fired, delayMs] {
      std::scoped_lock lock(mutex);
      fired.push_back(delayMs);
    });
  }
  while (timers.nbPending() != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  timers.stop();
  const std::vector<int> expected{10, 10, 20, 30};
  EXPECT_EQ(fired, expected);
}

TEST(TimerQueue, StopFiresPendingCallbacksImmediately) {
  TimerQueue timers;
  std::atomic<int> nbFired{0};
  timers.schedule(SteadyClock::now() + std::chrono::hours{1}, [&nbFired] { ++nbFired; });
  const auto start = SteadyClock::now();
  timers.stop();
  EXPECT_EQ(nbFired.load(), 1);
  EXPECT_LT(SteadyClock::now() - start, std::chrono::seconds{1});

  timers.schedule(SteadyClock::now() + std::chrono::hours{1}, [&nbFired] { ++nbFired; });
  EXPECT_EQ(nbFired.load(), 2);
}

TEST(BackgroundTasks, FailuresDoNotStopLaterTasks) {
  BackgroundTasks tasks;
  std::vector<int> order;
  tasks.add([&order] { order.push_back(1); });
  tasks.add([] { throw std::runtime_error("failed task"); });
  tasks.add([&order] { order.push_back(3); });
  EXPECT_EQ(tasks.size(), 3U);
  EXPECT_EQ(tasks.runAll(), 1U);
  EXPECT_TRUE(tasks.empty());
  const std::vector<int> expected{1, 3};
  EXPECT_EQ(order, expected);
}

}  // namespace ignyx
