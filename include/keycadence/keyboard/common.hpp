#pragma once
/**
 * @file keyboard/common.hpp
 * @brief Core keyboard types and utilities for keycadence::keyboard.
 *
 * This header defines the logical key identifiers, modifier flags and the
 * parsed form of a key combination. Platform desktops translate logical keys
 * into their own codes (evdev codes on Linux, virtual-key codes on Windows).
 */

#include <keycadence/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace keycadence {
namespace keyboard {

/**
 * @enum Key
 * @brief Logical key identifiers (layout-agnostic).
 *
 * Stable numeric values are chosen to allow serialization and round-tripping.
 * These values represent logical keys, not platform-specific scan codes.
 */
enum class Key : uint16_t {
  Unknown = 0,
  // Letters
  A = 1,
  B = 2,
  C = 3,
  D = 4,
  E = 5,
  F = 6,
  G = 7,
  H = 8,
  I = 9,
  J = 10,
  K = 11,
  L = 12,
  M = 13,
  N = 14,
  O = 15,
  P = 16,
  Q = 17,
  R = 18,
  S = 19,
  T = 20,
  U = 21,
  V = 22,
  W = 23,
  X = 24,
  Y = 25,
  Z = 26,

  // Numbers (main/top row)
  Num0 = 33,
  Num1 = 34,
  Num2 = 35,
  Num3 = 36,
  Num4 = 37,
  Num5 = 38,
  Num6 = 39,
  Num7 = 40,
  Num8 = 41,
  Num9 = 42,

  // Function keys
  F1 = 43,
  F2 = 44,
  F3 = 45,
  F4 = 46,
  F5 = 47,
  F6 = 48,
  F7 = 49,
  F8 = 50,
  F9 = 51,
  F10 = 52,
  F11 = 53,
  F12 = 54,

  // Control / editing
  Enter = 63,
  Escape = 64,
  Backspace = 65,
  Tab = 66,
  Space = 67,

  // Navigation
  Left = 68,
  Right = 69,
  Up = 70,
  Down = 71,
  Home = 72,
  End = 73,
  PageUp = 74,
  PageDown = 75,
  Delete = 76,

  // Modifiers
  ShiftLeft = 99,
  CtrlLeft = 101,
  AltLeft = 103,
};

/**
 * @enum Modifier
 * @brief Modifier bitmask flags (type-safe enum class).
 */
enum class Modifier : uint8_t {
  None = 0,
  Shift = 0x01,
  Ctrl = 0x02,
  Alt = 0x04,
};

inline Modifier operator|(Modifier a, Modifier b) {
  return static_cast<Modifier>(static_cast<uint8_t>(a) |
                               static_cast<uint8_t>(b));
}
inline Modifier operator&(Modifier a, Modifier b) {
  return static_cast<Modifier>(static_cast<uint8_t>(a) &
                               static_cast<uint8_t>(b));
}
inline Modifier &operator|=(Modifier &a, Modifier b) {
  a = a | b;
  return a;
}

/**
 * @brief Check whether @p flag is present in @p state.
 */
inline bool hasModifier(Modifier state, Modifier flag) {
  return (static_cast<uint8_t>(state) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Return the modifier flag a key stands for, or Modifier::None for
 * every non-modifier key.
 */
inline Modifier modifierForKey(Key key) {
  switch (key) {
  case Key::ShiftLeft:
    return Modifier::Shift;
  case Key::CtrlLeft:
    return Modifier::Ctrl;
  case Key::AltLeft:
    return Modifier::Alt;
  default:
    return Modifier::None;
  }
}

inline bool isModifierKey(Key key) {
  return modifierForKey(key) != Modifier::None;
}

/**
 * @struct KeyCombo
 * @brief A parsed key name: modifiers in the order they were written, then the
 * primary key.
 *
 * A plain key has no modifiers. The modifiers are pressed in order before the
 * primary key and released in reverse order after it.
 */
struct KeyCombo {
  std::vector<Key> modifiers;
  Key primary{Key::Unknown};

  bool operator==(const KeyCombo &) const = default;
};

/**
 * @struct KeyEvent
 * @brief One synthetic key transition handed to a platform desktop.
 */
struct KeyEvent {
  Key key{Key::Unknown};
  bool down{false};

  bool operator==(const KeyEvent &) const = default;
};

/**
 * @brief Convert a Key to its canonical textual name.
 * @param key Logical key to convert.
 * @return std::string Canonical name for the key (e.g., "A", "Enter").
 */
KEYCADENCE_API std::string keyToString(Key key);

/**
 * @brief Parse a single textual key name into a Key value.
 *
 * Matching is case-insensitive and accepts the documented aliases
 * ("return", "esc", "control"). No fuzzy matching is performed.
 * @param str Input string.
 * @return Key Parsed key value or Key::Unknown for unrecognized strings.
 */
KEYCADENCE_API Key stringToKey(const std::string &str);

/**
 * @brief Render a combination in its canonical lowercase form
 * (e.g. "ctrl+shift+s").
 */
KEYCADENCE_API std::string comboToString(const KeyCombo &combo);

} // namespace keyboard
} // namespace keycadence
