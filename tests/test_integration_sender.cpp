/**
 * @file test_integration_sender.cpp
 * @brief Integration tests for the keycadence Sender on the real desktop.
 *
 * This file exercises the real OS backend by delivering keystrokes to the
 * focused terminal window and capturing them via STDIN. The tests only run
 * when KEYCADENCE_RUN_INTEGRATION_TESTS=1 is set; keep the terminal focused.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <future>
#include <gtest/gtest.h>
#include <iostream>
#include <keycadence/keyboard/desktop.hpp>
#include <keycadence/keyboard/sender.hpp>
#include <keycadence/log.hpp>
#include <string>
#include <thread>

using namespace keycadence::keyboard;
using namespace std::chrono_literals;

namespace {

bool integrationEnabled() {
  const char *v = std::getenv("KEYCADENCE_RUN_INTEGRATION_TESTS");
  return v && v[0] == '1';
}

} // namespace

class SenderIntegrationTest : public ::testing::Test {
protected:
  Sender sender;
  WindowHandle terminal;

  void SetUp() override {
    if (!integrationEnabled())
      GTEST_SKIP() << "set KEYCADENCE_RUN_INTEGRATION_TESTS=1 to run";
    if (!sender.isReady())
      GTEST_SKIP() << "input injection is not available here";

    auto desktop = makePlatformDesktop();
    auto focused = desktop->foregroundWindow();
    if (!focused || *focused == 0)
      GTEST_SKIP() << "no foreground window to target";
    terminal = WindowHandle{*focused, 0};

    KEYCADENCE_LOG_INFO("Sender integration: target window 0x%llx",
                        static_cast<unsigned long long>(terminal.id));
    std::cout << "\n====================================================\n"
              << "SENDER INTEGRATION TESTS\n"
              << "====================================================\n"
              << "IMPORTANT: Keep this terminal window focused!\n"
              << "Press [ENTER] to begin the sequence..." << std::endl;

    std::string start_buffer;
    std::getline(std::cin, start_buffer);
  }

  std::string deliverAndRead(const std::vector<std::string> &keys) {
    auto task = std::async(std::launch::async, [this, keys]() {
      std::this_thread::sleep_for(500ms);
      bool ok = true;
      for (const std::string &k : keys)
        ok = sender.sendKey(terminal, k) == SendResult::Ok && ok;
      ok = sender.sendKey(terminal, "enter") == SendResult::Ok && ok;
      return ok;
    });
    std::string received;
    std::getline(std::cin, received);
    EXPECT_TRUE(task.get());
    KEYCADENCE_LOG_INFO("Sender integration: received '%s'", received.c_str());
    return received;
  }
};

TEST_F(SenderIntegrationTest, LettersAndDigits) {
  std::cout << "[RUNNING] Sending z, w, 1..." << std::endl;
  std::string received = deliverAndRead({"z", "w", "1"});
  std::ranges::transform(received, received.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });

  // Logical keys must produce these characters regardless of layout.
  EXPECT_NE(received.find('z'), std::string::npos) << received;
  EXPECT_NE(received.find('w'), std::string::npos) << received;
  EXPECT_NE(received.find('1'), std::string::npos) << received;
}

TEST_F(SenderIntegrationTest, ShiftCombination) {
  std::cout << "[RUNNING] Sending shift+h, shift+i..." << std::endl;
  std::string received = deliverAndRead({"shift+h", "shift+i"});
  EXPECT_NE(received.find("HI"), std::string::npos) << received;
}

TEST_F(SenderIntegrationTest, NoModifierStaysLatched) {
  std::cout << "[RUNNING] Sending shift+a then b..." << std::endl;
  std::string received = deliverAndRead({"shift+a", "b"});
  EXPECT_NE(received.find("Ab"), std::string::npos) << received;
}
