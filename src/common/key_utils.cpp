#include <keycadence/keyboard/common.hpp>
#include <keycadence/log.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace keycadence::keyboard {

namespace {

std::string toLower(std::string inputString) {
  std::ranges::transform(
      inputString, inputString.begin(), [](char character) -> char {
        return static_cast<char>(
            std::tolower(static_cast<unsigned char>(character)));
      });
  return inputString;
}

// Central list of canonical names for keys. These are used as the canonical
// string returned by `keyToString` and seed the reverse map in `stringToKey`.
const std::vector<std::pair<Key, std::string>> &keyStringPairs() {
  static const std::vector<std::pair<Key, std::string>> pairs = {
      {Key::Unknown, "Unknown"},
      // Letters
      {Key::A, "A"},
      {Key::B, "B"},
      {Key::C, "C"},
      {Key::D, "D"},
      {Key::E, "E"},
      {Key::F, "F"},
      {Key::G, "G"},
      {Key::H, "H"},
      {Key::I, "I"},
      {Key::J, "J"},
      {Key::K, "K"},
      {Key::L, "L"},
      {Key::M, "M"},
      {Key::N, "N"},
      {Key::O, "O"},
      {Key::P, "P"},
      {Key::Q, "Q"},
      {Key::R, "R"},
      {Key::S, "S"},
      {Key::T, "T"},
      {Key::U, "U"},
      {Key::V, "V"},
      {Key::W, "W"},
      {Key::X, "X"},
      {Key::Y, "Y"},
      {Key::Z, "Z"},
      // Numbers (top row)
      {Key::Num0, "0"},
      {Key::Num1, "1"},
      {Key::Num2, "2"},
      {Key::Num3, "3"},
      {Key::Num4, "4"},
      {Key::Num5, "5"},
      {Key::Num6, "6"},
      {Key::Num7, "7"},
      {Key::Num8, "8"},
      {Key::Num9, "9"},
      // Function keys
      {Key::F1, "F1"},
      {Key::F2, "F2"},
      {Key::F3, "F3"},
      {Key::F4, "F4"},
      {Key::F5, "F5"},
      {Key::F6, "F6"},
      {Key::F7, "F7"},
      {Key::F8, "F8"},
      {Key::F9, "F9"},
      {Key::F10, "F10"},
      {Key::F11, "F11"},
      {Key::F12, "F12"},
      // Control keys
      {Key::Enter, "Enter"},
      {Key::Escape, "Escape"},
      {Key::Backspace, "Backspace"},
      {Key::Tab, "Tab"},
      {Key::Space, "Space"},
      // Navigation
      {Key::Left, "Left"},
      {Key::Right, "Right"},
      {Key::Up, "Up"},
      {Key::Down, "Down"},
      {Key::Home, "Home"},
      {Key::End, "End"},
      {Key::PageUp, "PageUp"},
      {Key::PageDown, "PageDown"},
      {Key::Delete, "Delete"},
      // Modifiers
      {Key::ShiftLeft, "Shift"},
      {Key::CtrlLeft, "Ctrl"},
      {Key::AltLeft, "Alt"},
  };
  return pairs;
}

const std::unordered_map<std::string, Key> &reverseMap() {
  static const std::unordered_map<std::string, Key> rev = [] {
    std::unordered_map<std::string, Key> out;
    for (const auto &pair : keyStringPairs()) {
      if (pair.first == Key::Unknown)
        continue;
      out.emplace(toLower(pair.second), pair.first);
    }

    // Accepted aliases
    out.emplace("return", Key::Enter);
    out.emplace("esc", Key::Escape);
    out.emplace("control", Key::CtrlLeft);

    KEYCADENCE_LOG_DEBUG("stringToKey: reverse map seeded with %zu entries",
                         out.size());
    return out;
  }();
  return rev;
}

} // namespace

KEYCADENCE_API std::string keyToString(Key key) {
  for (const auto &pair : keyStringPairs()) {
    if (pair.first == key) {
      return pair.second;
    }
  }
  return {"Unknown"};
}

KEYCADENCE_API Key stringToKey(const std::string &input) {
  if (input.empty()) {
    return Key::Unknown;
  }
  const auto &rev = reverseMap();
  auto it = rev.find(toLower(input));
  if (it != rev.end()) {
    return it->second;
  }
  return Key::Unknown;
}

KEYCADENCE_API std::string comboToString(const KeyCombo &combo) {
  std::string out;
  for (Key mod : combo.modifiers) {
    out += toLower(keyToString(mod));
    out += '+';
  }
  out += toLower(keyToString(combo.primary));
  return out;
}

} // namespace keycadence::keyboard
