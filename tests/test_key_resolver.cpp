// test_key_resolver.cpp
// Key name resolution and modifier combination parsing.

#include <gtest/gtest.h>

#include <keycadence/error.hpp>
#include <keycadence/keyboard/key_resolver.hpp>

#include <string>
#include <vector>

using namespace keycadence;
using namespace keycadence::keyboard;

namespace {

ErrorKind parseFailure(const KeyResolver &r, const std::string &name) {
  try {
    (void)r.parseCombo(name);
  } catch (const Error &e) {
    return e.kind();
  }
  ADD_FAILURE() << "'" << name << "' parsed unexpectedly";
  return ErrorKind::InvalidConfiguration;
}

} // namespace

TEST(KeyResolverTest, ResolvesCaseInsensitiveAndTrimmed) {
  KeyResolver r;
  EXPECT_EQ(r.resolve("r"), Key::R);
  EXPECT_EQ(r.resolve("R"), Key::R);
  EXPECT_EQ(r.resolve("  Space "), Key::Space);
  EXPECT_EQ(r.resolve("f12"), Key::F12);
  EXPECT_EQ(r.resolve("7"), Key::Num7);
  EXPECT_EQ(r.resolve("Return"), Key::Enter);
  EXPECT_EQ(r.resolve("esc"), Key::Escape);
  EXPECT_EQ(r.resolve("control"), Key::CtrlLeft);
  EXPECT_FALSE(r.resolve("f13").has_value());
  EXPECT_FALSE(r.resolve("").has_value());
}

TEST(KeyResolverTest, PlainKeyHasNoModifiers) {
  KeyResolver r;
  KeyCombo c = r.parseCombo("space");
  EXPECT_TRUE(c.modifiers.empty());
  EXPECT_EQ(c.primary, Key::Space);
}

TEST(KeyResolverTest, ModifiersKeepWrittenOrder) {
  KeyResolver r;
  KeyCombo c = r.parseCombo("shift + Ctrl+s");
  ASSERT_EQ(c.modifiers.size(), 2u);
  EXPECT_EQ(c.modifiers[0], Key::ShiftLeft);
  EXPECT_EQ(c.modifiers[1], Key::CtrlLeft);
  EXPECT_EQ(c.primary, Key::S);

  KeyCombo all = r.parseCombo("ctrl+alt+shift+f4");
  EXPECT_EQ(all.modifiers.size(), 3u);
  EXPECT_EQ(all.primary, Key::F4);
}

TEST(KeyResolverTest, ModifierAloneIsAPlainKey) {
  KeyResolver r;
  KeyCombo c = r.parseCombo("ctrl");
  EXPECT_TRUE(c.modifiers.empty());
  EXPECT_EQ(c.primary, Key::CtrlLeft);
}

TEST(KeyResolverTest, RejectsUnknownKeys) {
  KeyResolver r;
  EXPECT_EQ(parseFailure(r, "banana"), ErrorKind::UnsupportedKey);
  EXPECT_EQ(parseFailure(r, ""), ErrorKind::UnsupportedKey);
  EXPECT_EQ(parseFailure(r, "ctrl+banana"), ErrorKind::UnsupportedKey);
}

TEST(KeyResolverTest, RejectsMalformedCombinations) {
  KeyResolver r;
  EXPECT_EQ(parseFailure(r, "ctrl+"), ErrorKind::InvalidCombination);
  EXPECT_EQ(parseFailure(r, "+a"), ErrorKind::InvalidCombination);
  EXPECT_EQ(parseFailure(r, "ctrl++a"), ErrorKind::InvalidCombination);
  EXPECT_EQ(parseFailure(r, "a+b"), ErrorKind::InvalidCombination);
  EXPECT_EQ(parseFailure(r, "ctrl+shift"), ErrorKind::InvalidCombination);
}

TEST(KeyResolverTest, RepeatedModifierIsHeldOnce) {
  KeyResolver r;
  const KeyCombo combo = r.parseCombo("ctrl+ctrl+a");
  EXPECT_EQ(combo.modifiers, (std::vector<Key>{Key::CtrlLeft}));
  EXPECT_EQ(combo.primary, Key::A);

  const KeyCombo aliased = r.parseCombo("shift+control+SHIFT+ctrl+x");
  EXPECT_EQ(aliased.modifiers,
            (std::vector<Key>{Key::ShiftLeft, Key::CtrlLeft}));
  EXPECT_EQ(aliased.primary, Key::X);
}

TEST(KeyResolverTest, TryParseReportsReason) {
  KeyResolver r;
  ErrorKind reason = ErrorKind::InvalidConfiguration;
  EXPECT_FALSE(r.tryParseCombo("alt+", &reason).has_value());
  EXPECT_EQ(reason, ErrorKind::InvalidCombination);
  EXPECT_FALSE(r.tryParseCombo("zz", &reason).has_value());
  EXPECT_EQ(reason, ErrorKind::UnsupportedKey);
  EXPECT_TRUE(r.tryParseCombo("alt+f4", nullptr).has_value());
}

TEST(KeyResolverTest, ValidateThrowsKeycadenceError) {
  KeyResolver r;
  EXPECT_NO_THROW(r.validate("ctrl+alt+r"));
  EXPECT_THROW(r.validate("hyper+r"), Error);
}
