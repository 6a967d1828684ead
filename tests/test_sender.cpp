// test_sender.cpp
// Delivery protocol of the Sender against a recording desktop: focus
// handling, press/release ordering and failure mapping.

#include <gtest/gtest.h>

#include <keycadence/keyboard/sender.hpp>

#include "support/fakes.hpp"

#include <stdexcept>

using namespace keycadence::keyboard;
using keycadence::fakes::FakeDesktop;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t kTarget = 0x100;
constexpr uint64_t kOther = 0x200;

class SenderTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto owned = std::make_unique<FakeDesktop>();
    desktop = owned.get();
    sender = std::make_unique<Sender>(std::move(owned));
    sender->setTimings({.focusSettle = 0ms, .pressHold = 0ms});
  }

  SendResult send(const std::string &key) {
    return sender->sendKey(WindowHandle{kTarget, 77}, key);
  }

  FakeDesktop *desktop{nullptr};
  std::unique_ptr<Sender> sender;
};

} // namespace

TEST_F(SenderTest, PlainKeyPressThenRelease) {
  desktop->foreground = kTarget;
  EXPECT_EQ(send("r"), SendResult::Ok);

  EXPECT_TRUE(desktop->activations().empty());
  auto emits = desktop->emits();
  ASSERT_EQ(emits.size(), 2u);
  EXPECT_EQ(emits[0], (std::vector<KeyEvent>{{Key::R, true}}));
  EXPECT_EQ(emits[1], (std::vector<KeyEvent>{{Key::R, false}}));
}

TEST_F(SenderTest, ModifiersWrapThePrimaryKey) {
  desktop->foreground = kTarget;
  EXPECT_EQ(send("ctrl+shift+s"), SendResult::Ok);

  auto emits = desktop->emits();
  ASSERT_EQ(emits.size(), 2u);
  EXPECT_EQ(emits[0], (std::vector<KeyEvent>{{Key::CtrlLeft, true},
                                             {Key::ShiftLeft, true},
                                             {Key::S, true}}));
  EXPECT_EQ(emits[1], (std::vector<KeyEvent>{{Key::S, false},
                                             {Key::ShiftLeft, false},
                                             {Key::CtrlLeft, false}}));
}

TEST_F(SenderTest, FocusIsTakenAndRestored) {
  desktop->foreground = kOther;
  EXPECT_EQ(send("space"), SendResult::Ok);

  ASSERT_EQ(desktop->calls.size(), 4u);
  EXPECT_EQ(desktop->calls[0].op, FakeDesktop::Call::Op::Activate);
  EXPECT_EQ(desktop->calls[0].window, kTarget);
  EXPECT_EQ(desktop->calls[1].op, FakeDesktop::Call::Op::Emit);
  EXPECT_EQ(desktop->calls[2].op, FakeDesktop::Call::Op::Emit);
  EXPECT_EQ(desktop->calls[3].op, FakeDesktop::Call::Op::Activate);
  EXPECT_EQ(desktop->calls[3].window, kOther);
  EXPECT_EQ(desktop->foreground, kOther);
}

TEST_F(SenderTest, NoForegroundMeansNoRestore) {
  desktop->foreground.reset();
  EXPECT_EQ(send("a"), SendResult::Ok);
  EXPECT_EQ(desktop->activations(), (std::vector<uint64_t>{kTarget}));
}

TEST_F(SenderTest, ActivationFailureSendsNothing) {
  desktop->foreground = kOther;
  desktop->activateOk = false;
  EXPECT_EQ(send("a"), SendResult::InjectionFailed);
  EXPECT_TRUE(desktop->emits().empty());
}

TEST_F(SenderTest, EmitFailureStillReleases) {
  desktop->foreground = kTarget;
  desktop->emitOk = false;
  EXPECT_EQ(send("alt+f4"), SendResult::InjectionFailed);
  EXPECT_EQ(desktop->emits().size(), 2u);
}

TEST_F(SenderTest, BadKeysNeverReachTheDesktop) {
  EXPECT_EQ(send("banana"), SendResult::UnsupportedKey);
  EXPECT_EQ(send("ctrl+"), SendResult::InvalidCombination);
  EXPECT_EQ(send("a+b"), SendResult::InvalidCombination);
  EXPECT_TRUE(desktop->calls.empty());
}

TEST_F(SenderTest, DesktopNotReady) {
  desktop->ready = false;
  EXPECT_FALSE(sender->isReady());
  EXPECT_EQ(send("a"), SendResult::InjectionFailed);
  EXPECT_TRUE(desktop->calls.empty());
}

TEST_F(SenderTest, WindowLookupDelegatesToDesktop) {
  desktop->window = WindowHandle{kTarget, 77};
  EXPECT_EQ(sender->findWindowForProcess(77), (WindowHandle{kTarget, 77}));
  EXPECT_FALSE(sender->findWindowForProcess(78).has_value());
}

TEST_F(SenderTest, CancelDuringFocusEmitsNothing) {
  desktop->foreground = kOther;
  bool cancelled = false;
  desktop->onActivate = [&](uint64_t w) {
    if (w == kTarget)
      cancelled = true;
  };
  sender->setAbortCheck([&] { return cancelled; });

  EXPECT_EQ(send("ctrl+r"), SendResult::Aborted);
  EXPECT_TRUE(desktop->emits().empty());
  EXPECT_EQ(desktop->activations(), (std::vector<uint64_t>{kTarget, kOther}));
}

TEST_F(SenderTest, AbortBeforeFocusTouchesNothing) {
  desktop->foreground = kOther;
  sender->setAbortCheck([] { return true; });
  EXPECT_EQ(send("a"), SendResult::Aborted);
  EXPECT_TRUE(desktop->calls.empty());
}

TEST_F(SenderTest, ClearedAbortCheckDeliversAgain) {
  desktop->foreground = kTarget;
  sender->setAbortCheck([] { return true; });
  sender->setAbortCheck({});
  EXPECT_EQ(send("a"), SendResult::Ok);
  EXPECT_EQ(desktop->emits().size(), 2u);
}

TEST(SenderConstructionTest, NullDesktopIsRejected) {
  EXPECT_THROW({ Sender s{std::unique_ptr<Desktop>()}; }, std::invalid_argument);
}

TEST(SendResultTest, Names) {
  EXPECT_STREQ(sendResultToString(SendResult::Ok), "Ok");
  EXPECT_STREQ(sendResultToString(SendResult::InjectionFailed),
               "InjectionFailed");
  EXPECT_STREQ(sendResultToString(SendResult::Aborted), "Aborted");
}
