// test_acquirer.cpp
// Bounded search for the target process and its window.

#include <gtest/gtest.h>

#include <keycadence/engine/acquirer.hpp>
#include <keycadence/error.hpp>

#include "support/fakes.hpp"

#include <thread>

using namespace keycadence;
using namespace keycadence::engine;
using namespace keycadence::fakes;
using namespace std::chrono_literals;

namespace {

Configuration configFor(const std::string &name, uint32_t attempts) {
  Configuration c;
  c.processName = name;
  c.maxRetries = attempts;
  c.mode = SequentialMode{{{"a", 10ms}}};
  return c;
}

class AcquirerTest : public ::testing::Test {
protected:
  RunContext ctx() { return {backend, processes, control, reporter}; }

  FakeBackend backend;
  std::shared_ptr<FakeProcessSource> processes =
      std::make_shared<FakeProcessSource>();
  Control control;
  RecordingReporter reporter;
};

} // namespace

TEST_F(AcquirerTest, FindsRunningProcessOnFirstAttempt) {
  processes->set({{1, "init"}, {314, "Game.exe"}});
  TargetAcquirer acquirer(ctx(), 1ms);

  auto window = acquirer.acquire(configFor("game", 3));
  ASSERT_TRUE(window.has_value());
  EXPECT_EQ(window->pid, 314u);
  EXPECT_EQ(window->id, 0x42u);
  EXPECT_EQ(reporter.count(EventKind::AcquireAttempt), 1u);
  EXPECT_EQ(backend.lookups(), (std::vector<uint32_t>{314}));
}

TEST_F(AcquirerTest, ExhaustedAttemptsThrowProcessNotFound) {
  TargetAcquirer acquirer(ctx(), 1ms);
  try {
    (void)acquirer.acquire(configFor("game", 3));
    FAIL() << "acquire succeeded without a process";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::ProcessNotFound);
    EXPECT_NE(std::string(e.what()).find("3 attempts"), std::string::npos);
  }

  auto events = reporter.events();
  ASSERT_EQ(events.size(), 3u);
  for (uint32_t i = 0; i < 3; ++i) {
    EXPECT_EQ(events[i].kind, EventKind::AcquireAttempt);
    EXPECT_EQ(events[i].attempt, i + 1);
    EXPECT_EQ(events[i].maxAttempts, 3u);
  }
}

TEST_F(AcquirerTest, ProcessWithoutWindowKeepsRetrying) {
  processes->set({{7, "game"}});
  backend.window.reset();
  TargetAcquirer acquirer(ctx(), 1ms);
  EXPECT_THROW(acquirer.acquire(configFor("game", 2)), Error);
  EXPECT_EQ(backend.lookups().size(), 2u);
}

TEST_F(AcquirerTest, ProcessAppearingLaterIsFound) {
  TargetAcquirer acquirer(ctx(), 20ms);
  std::thread starter([this] {
    std::this_thread::sleep_for(30ms);
    processes->set({{99, "late-game"}});
  });
  auto window = acquirer.acquire(configFor("game", 50));
  starter.join();
  ASSERT_TRUE(window.has_value());
  EXPECT_EQ(window->pid, 99u);
  EXPECT_GE(reporter.count(EventKind::AcquireAttempt), 2u);
}

TEST_F(AcquirerTest, CancelledBeforeStartReturnsEmpty) {
  control.cancel();
  TargetAcquirer acquirer(ctx(), 1ms);
  EXPECT_FALSE(acquirer.acquire(configFor("game", 5)).has_value());
  EXPECT_EQ(reporter.count(EventKind::AcquireAttempt), 0u);
}

TEST_F(AcquirerTest, CancelDuringRetryDelayReturnsEmpty) {
  TargetAcquirer acquirer(ctx(), 10s);
  std::thread canceller([this] {
    std::this_thread::sleep_for(30ms);
    control.cancel();
  });
  EXPECT_FALSE(acquirer.acquire(configFor("game", 5)).has_value());
  canceller.join();
  EXPECT_EQ(reporter.count(EventKind::AcquireAttempt), 1u);
}
