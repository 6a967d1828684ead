// test_duration.cpp
// Duration parsing ("250ms", "2s", "5m", bare milliseconds) and formatting.

#include <gtest/gtest.h>

#include <keycadence/engine/duration.hpp>
#include <keycadence/error.hpp>

using namespace keycadence;
using namespace keycadence::engine;
using namespace std::chrono_literals;

TEST(DurationTest, ParsesUnits) {
  EXPECT_EQ(parseDuration("250ms"), 250ms);
  EXPECT_EQ(parseDuration("2s"), 2000ms);
  EXPECT_EQ(parseDuration("5m"), 300000ms);
  EXPECT_EQ(parseDuration("750"), 750ms);
  EXPECT_EQ(parseDuration("0"), 0ms);
}

TEST(DurationTest, IgnoresCaseAndSurroundingWhitespace) {
  EXPECT_EQ(parseDuration(" 3S "), 3000ms);
  EXPECT_EQ(parseDuration("100MS"), 100ms);
  EXPECT_EQ(parseDuration("5 s"), 5000ms);
}

TEST(DurationTest, RejectsMalformedInput) {
  for (const char *bad : {"", "  ", "ms", "-5s", "1.5s", "1h", "abc", "10x",
                          "1 0ms", "s5"}) {
    try {
      (void)parseDuration(bad);
      ADD_FAILURE() << "'" << bad << "' was accepted";
    } catch (const Error &e) {
      EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration) << bad;
    }
  }
}

TEST(DurationTest, RejectsOverflow) {
  EXPECT_THROW(parseDuration("99999999999999999999"), Error);
  EXPECT_THROW(parseDuration("999999999999999999m"), Error);
}

TEST(DurationTest, FormatsLargestExactUnit) {
  EXPECT_EQ(formatDuration(0ms), "0ms");
  EXPECT_EQ(formatDuration(250ms), "250ms");
  EXPECT_EQ(formatDuration(1500ms), "1500ms");
  EXPECT_EQ(formatDuration(2000ms), "2s");
  EXPECT_EQ(formatDuration(120000ms), "2m");
  EXPECT_EQ(formatDuration(90000ms), "90s");
}

TEST(DurationTest, FormattedTextParsesBack) {
  for (auto d : {1ms, 999ms, 1000ms, 61000ms, 3600000ms})
    EXPECT_EQ(parseDuration(formatDuration(d)), d);
}
