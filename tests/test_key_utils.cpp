// test_key_utils.cpp
// Unit tests for the key name helpers and modifier bit operations.
//
// These tests use Google Test and exercise:
//  - keyToString / stringToKey over every logical key value
//  - the accepted aliases ("return", "esc", "control")
//  - rejected input (unknown names, untrimmed names)
//  - Modifier bit-ops and the modifier classification helpers
//  - comboToString canonical rendering
//
// To run these tests enable KEYCADENCE_BUILD_TESTS=ON when configuring the
// project.

#include <gtest/gtest.h>

#include <keycadence/keyboard/common.hpp>
#include <keycadence/log.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>

using namespace keycadence::keyboard;

static std::string toLowerCopy(const std::string &s) {
  std::string out = s;
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

TEST(KeyUtilsTest, RoundtripAndUniqueness) {
  KEYCADENCE_LOG_INFO("test_key_utils: roundtrip/uniqueness start");
  std::unordered_set<std::string> seen;
  int canonicalCount = 0;

  for (unsigned i = 0; i <= 255u; ++i) {
    Key k = static_cast<Key>(i);
    std::string name = keyToString(k);

    if (name == "Unknown") {
      EXPECT_EQ(stringToKey(name), Key::Unknown);
      continue;
    }

    ++canonicalCount;
    EXPECT_EQ(stringToKey(name), k);
    EXPECT_TRUE(seen.emplace(toLowerCopy(name)).second)
        << "Canonical name '" << name << "' collides case-insensitively";
    EXPECT_EQ(stringToKey(toLowerCopy(name)), k);
  }

  // Letters, digits, F1-F12, 5 editing keys, 9 navigation keys, 3 modifiers.
  EXPECT_EQ(canonicalCount, 65);
}

TEST(KeyUtilsTest, Aliases) {
  EXPECT_EQ(stringToKey("esc"), Key::Escape);
  EXPECT_EQ(stringToKey("ESC"), Key::Escape);
  EXPECT_EQ(stringToKey("return"), Key::Enter);
  EXPECT_EQ(stringToKey("space"), Key::Space);
  EXPECT_EQ(stringToKey("ctrl"), Key::CtrlLeft);
  EXPECT_EQ(stringToKey("control"), Key::CtrlLeft);
  EXPECT_EQ(stringToKey("shift"), Key::ShiftLeft);
  EXPECT_EQ(stringToKey("alt"), Key::AltLeft);
  EXPECT_EQ(stringToKey("pageup"), Key::PageUp);
  EXPECT_EQ(stringToKey("PAGEDOWN"), Key::PageDown);
}

TEST(KeyUtilsTest, InvalidEdgeCaseInputs) {
  KEYCADENCE_LOG_INFO("test_key_utils: edge-case inputs start");
  EXPECT_EQ(stringToKey("NotAKey"), Key::Unknown);
  EXPECT_EQ(stringToKey(""), Key::Unknown);
  // Trimming is the resolver's job, not this helper's.
  EXPECT_EQ(stringToKey(" Enter"), Key::Unknown);
  EXPECT_EQ(stringToKey("Enter "), Key::Unknown);
  // Keys outside the supported set are unknown.
  EXPECT_EQ(stringToKey("super"), Key::Unknown);
  EXPECT_EQ(stringToKey("numpad1"), Key::Unknown);
  EXPECT_EQ(stringToKey("f13"), Key::Unknown);
}

TEST(KeyUtilsTest, CanonicalValues) {
  EXPECT_EQ(keyToString(Key::A), "A");
  EXPECT_EQ(keyToString(Key::Num1), "1");
  EXPECT_EQ(keyToString(Key::F5), "F5");
  EXPECT_EQ(keyToString(Key::Tab), "Tab");
  EXPECT_EQ(keyToString(Key::CtrlLeft), "Ctrl");
  EXPECT_EQ(keyToString(Key::Unknown), "Unknown");
}

TEST(KeyUtilsTest, ComboToStringIsLowercase) {
  KeyCombo plain{{}, Key::R};
  EXPECT_EQ(comboToString(plain), "r");

  KeyCombo combo{{Key::CtrlLeft, Key::ShiftLeft}, Key::S};
  EXPECT_EQ(comboToString(combo), "ctrl+shift+s");
}

TEST(ModifierTest, BitOpsAndHelpers) {
  KEYCADENCE_LOG_INFO("test_key_utils: modifier bit-ops start");
  Modifier m = Modifier::None;
  EXPECT_FALSE(hasModifier(m, Modifier::Shift));

  m |= Modifier::Shift;
  EXPECT_TRUE(hasModifier(m, Modifier::Shift));

  m |= Modifier::Ctrl;
  EXPECT_TRUE(hasModifier(m, Modifier::Shift));
  EXPECT_TRUE(hasModifier(m, Modifier::Ctrl));
  EXPECT_FALSE(hasModifier(m, Modifier::Alt));

  Modifier n = m & Modifier::Ctrl;
  EXPECT_EQ(n, Modifier::Ctrl);
}

TEST(ModifierTest, ModifierForKey) {
  EXPECT_EQ(modifierForKey(Key::ShiftLeft), Modifier::Shift);
  EXPECT_EQ(modifierForKey(Key::CtrlLeft), Modifier::Ctrl);
  EXPECT_EQ(modifierForKey(Key::AltLeft), Modifier::Alt);
  EXPECT_EQ(modifierForKey(Key::A), Modifier::None);
  EXPECT_TRUE(isModifierKey(Key::AltLeft));
  EXPECT_FALSE(isModifierKey(Key::Space));
}
