// test_control.cpp
// Cancellation and interruptible sleeps.

#include <gtest/gtest.h>

#include <keycadence/engine/control.hpp>

#include <chrono>
#include <thread>

using namespace keycadence::engine;
using namespace std::chrono_literals;

TEST(ControlTest, SleepRunsToDeadlineWhenNotCancelled) {
  Control control;
  const auto start = Control::Clock::now();
  EXPECT_TRUE(control.sleepFor(20ms));
  EXPECT_GE(Control::Clock::now() - start, 20ms);
}

TEST(ControlTest, CancelWakesSleepers) {
  Control control;
  std::thread canceller([&control] {
    std::this_thread::sleep_for(20ms);
    control.cancel();
  });

  const auto start = Control::Clock::now();
  EXPECT_FALSE(control.sleepFor(10s));
  EXPECT_LT(Control::Clock::now() - start, 5s);
  canceller.join();
  EXPECT_TRUE(control.isCancelled());
}

TEST(ControlTest, SleepAfterCancelReturnsImmediately) {
  Control control;
  control.cancel();
  control.cancel();
  EXPECT_FALSE(control.sleepFor(10s));
  EXPECT_FALSE(control.sleepUntil(Control::Clock::now() + 10s));
}

TEST(ControlTest, PastDeadlineDoesNotBlock) {
  Control control;
  EXPECT_TRUE(control.sleepUntil(Control::Clock::now() - 1s));
  EXPECT_TRUE(control.sleepFor(0ms));
}

TEST(ControlTest, PauseFlag) {
  Control control;
  EXPECT_FALSE(control.isPaused());
  control.setPaused(true);
  EXPECT_TRUE(control.isPaused());
  control.setPaused(false);
  EXPECT_FALSE(control.isPaused());
}
