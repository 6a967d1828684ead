// test_process_watcher.cpp
// Name matching and lookups of ProcessWatcher over a scripted process table.

#include <gtest/gtest.h>

#include <keycadence/process/watcher.hpp>

#include "support/fakes.hpp"

#include <algorithm>
#include <stdexcept>

using namespace keycadence::process;
using keycadence::fakes::FakeProcessSource;

TEST(ProcessNameTest, CaseInsensitiveSubstring) {
  EXPECT_TRUE(processNameMatches("Notepad.exe", "notepad"));
  EXPECT_TRUE(processNameMatches("retroarch", "ARCH"));
  EXPECT_TRUE(processNameMatches("game", "game"));
  EXPECT_FALSE(processNameMatches("game", "games"));
  EXPECT_FALSE(processNameMatches("anything", ""));
}

TEST(ProcessWatcherTest, FindFirstReturnsFirstMatchInTableOrder) {
  auto source = std::make_shared<FakeProcessSource>(std::vector<ProcessInfo>{
      {10, "bash"}, {42, "MyGame-x64"}, {43, "mygame-launcher"}});
  ProcessWatcher watcher(source);

  EXPECT_EQ(watcher.findFirst("mygame"), 42u);
  EXPECT_FALSE(watcher.findFirst("emacs").has_value());
  EXPECT_FALSE(watcher.findFirst("").has_value());
}

TEST(ProcessWatcherTest, EveryQueryTakesAFreshSnapshot) {
  auto source = std::make_shared<FakeProcessSource>(
      std::vector<ProcessInfo>{{5, "game"}});
  ProcessWatcher watcher(source);

  EXPECT_TRUE(watcher.isAlive("game"));
  EXPECT_EQ(watcher.table().size(), 1u);

  source->clear();
  EXPECT_FALSE(watcher.isAlive("game"));
  EXPECT_TRUE(watcher.table().empty());
  EXPECT_EQ(source->listCalls(), 2u);
}

TEST(ProcessWatcherTest, NullSourceIsRejected) {
  EXPECT_THROW(ProcessWatcher(nullptr), std::invalid_argument);
}

#if defined(__linux__) || defined(_WIN32)
TEST(SystemProcessSourceTest, ListsTheTestProcess) {
  auto source = makeSystemProcessSource();
  ASSERT_NE(source, nullptr);
  const auto procs = source->list();
  EXPECT_FALSE(procs.empty());
  EXPECT_TRUE(std::ranges::any_of(
      procs, [](const ProcessInfo &p) { return !p.name.empty(); }));
}
#endif
