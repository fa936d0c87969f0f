#include "core/stop_signal.h"
#include "core/task_group.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace ngl::core;
using namespace std::chrono_literals;

TEST(TaskGroupTest, WaitAllJoinsEverySpawnedTask) {
  TaskGroup group;
  std::atomic<int> done{0};
  for (int i = 0; i < 8; ++i) {
    group.spawn([&done]() {
      std::this_thread::sleep_for(5ms);
      done.fetch_add(1);
    });
  }
  group.wait_all();
  EXPECT_EQ(done.load(), 8);
  EXPECT_EQ(group.size(), 0u);
  EXPECT_EQ(group.running(), 0u);
}

TEST(TaskGroupTest, ReapFinishedLeavesRunningTasksAlone) {
  TaskGroup group;
  auto release = StopSignal::create();
  group.spawn([]() {});
  group.spawn([release]() {
    while (!release->is_stop_requested()) {
      std::this_thread::sleep_for(1ms);
    }
  });

  // Give the quick task time to finish.
  for (int i = 0; i < 200 && group.running() > 1; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(group.reap_finished(), 1u);
  EXPECT_EQ(group.size(), 1u);
  EXPECT_EQ(group.running(), 1u);

  release->request_stop();
  group.wait_all();
  EXPECT_EQ(group.size(), 0u);
}

TEST(TaskGroupTest, DestructorJoins) {
  std::atomic<bool> finished{false};
  {
    TaskGroup group;
    group.spawn([&finished]() {
      std::this_thread::sleep_for(20ms);
      finished.store(true);
    });
  }
  EXPECT_TRUE(finished.load());
}

TEST(StopSignalTest, OnlyFirstRequestFlipsTheFlag) {
  StopSignal signal;
  EXPECT_FALSE(signal.is_stop_requested());
  EXPECT_TRUE(signal.request_stop());
  EXPECT_FALSE(signal.request_stop());
  EXPECT_TRUE(signal.is_stop_requested());
}

TEST(StopSignalTest, CallbacksRunOnceAndLateOnesRunImmediately) {
  auto signal = StopSignal::create();
  int early = 0;
  signal->on_stop([&early]() { ++early; });

  signal->request_stop();
  signal->request_stop();
  EXPECT_EQ(early, 1);

  bool late = false;
  signal->on_stop([&late]() { late = true; });
  EXPECT_TRUE(late);
}

TEST(StopSignalTest, VisibleAcrossThreads) {
  auto signal = StopSignal::create();
  std::atomic<bool> observed{false};
  std::thread watcher([signal, &observed]() {
    while (!signal->is_stop_requested()) {
      std::this_thread::sleep_for(1ms);
    }
    observed.store(true);
  });
  signal->request_stop();
  watcher.join();
  EXPECT_TRUE(observed.load());
}
