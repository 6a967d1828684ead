/**
 * @file keyboard/common/linux_keysym.cpp
 * @brief Logical key to evdev code mapping for the Linux desktop.
 */

#if defined(__linux__)

#include "keyboard/common/linux_keysym.hpp"

#include <keycadence/log.hpp>

#include <cstdlib>
#include <fstream>
#include <linux/input-event-codes.h>
#include <xkbcommon/xkbcommon-keysyms.h>

namespace keycadence::keyboard::detail {

namespace {

std::string envOrEmpty(const char *name) {
  const char *v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

// Parses KEY="value" lines as written by keyboard-configuration.
void readDefaultKeyboardFile(XkbRuleNames &out) {
  std::ifstream in("/etc/default/keyboard");
  if (!in)
    return;
  std::string line;
  while (std::getline(in, line)) {
    const auto eq = line.find('=');
    if (line.empty() || line[0] == '#' || eq == std::string::npos)
      continue;
    const std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
      value = value.substr(1, value.size() - 2);

    if (key == "XKBMODEL" && out.model.empty())
      out.model = value;
    else if (key == "XKBLAYOUT" && out.layout.empty())
      out.layout = value;
    else if (key == "XKBVARIANT" && out.variant.empty())
      out.variant = value;
    else if (key == "XKBOPTIONS" && out.options.empty())
      out.options = value;
  }
}

} // namespace

XkbRuleNames detectXkbRuleNames() {
  XkbRuleNames names;
  names.rules = envOrEmpty("XKB_DEFAULT_RULES");
  names.model = envOrEmpty("XKB_DEFAULT_MODEL");
  names.layout = envOrEmpty("XKB_DEFAULT_LAYOUT");
  names.variant = envOrEmpty("XKB_DEFAULT_VARIANT");
  names.options = envOrEmpty("XKB_DEFAULT_OPTIONS");
  if (names.layout.empty())
    readDefaultKeyboardFile(names);
  return names;
}

Key keysymToKey(xkb_keysym_t sym) {
  if (sym >= XKB_KEY_a && sym <= XKB_KEY_z)
    return static_cast<Key>(static_cast<int>(Key::A) + (sym - XKB_KEY_a));
  if (sym >= XKB_KEY_A && sym <= XKB_KEY_Z)
    return static_cast<Key>(static_cast<int>(Key::A) + (sym - XKB_KEY_A));
  if (sym >= XKB_KEY_0 && sym <= XKB_KEY_9)
    return static_cast<Key>(static_cast<int>(Key::Num0) + (sym - XKB_KEY_0));
  if (sym >= XKB_KEY_F1 && sym <= XKB_KEY_F12)
    return static_cast<Key>(static_cast<int>(Key::F1) + (sym - XKB_KEY_F1));

  switch (sym) {
  case XKB_KEY_Return:
    return Key::Enter;
  case XKB_KEY_Escape:
    return Key::Escape;
  case XKB_KEY_BackSpace:
    return Key::Backspace;
  case XKB_KEY_Tab:
    return Key::Tab;
  case XKB_KEY_space:
    return Key::Space;
  case XKB_KEY_Left:
    return Key::Left;
  case XKB_KEY_Right:
    return Key::Right;
  case XKB_KEY_Up:
    return Key::Up;
  case XKB_KEY_Down:
    return Key::Down;
  case XKB_KEY_Home:
    return Key::Home;
  case XKB_KEY_End:
    return Key::End;
  case XKB_KEY_Page_Up:
    return Key::PageUp;
  case XKB_KEY_Page_Down:
    return Key::PageDown;
  case XKB_KEY_Delete:
    return Key::Delete;
  case XKB_KEY_Shift_L:
    return Key::ShiftLeft;
  case XKB_KEY_Control_L:
    return Key::CtrlLeft;
  case XKB_KEY_Alt_L:
    return Key::AltLeft;
  default:
    return Key::Unknown;
  }
}

void fillLinuxFallbackMappings(LinuxKeyMap &keyMap) {
  auto set = [&keyMap](Key k, int v) { keyMap.keyToEvdev.try_emplace(k, v); };

  static constexpr int kLetters[] = {
      KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
      KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
      KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z};
  for (int i = 0; i < 26; ++i)
    set(static_cast<Key>(static_cast<int>(Key::A) + i), kLetters[i]);

  // evdev orders the top row 1..9 then 0.
  set(Key::Num0, KEY_0);
  for (int i = 1; i <= 9; ++i)
    set(static_cast<Key>(static_cast<int>(Key::Num0) + i), KEY_1 + (i - 1));

  static constexpr int kFunction[] = {KEY_F1, KEY_F2, KEY_F3,  KEY_F4,
                                      KEY_F5, KEY_F6, KEY_F7,  KEY_F8,
                                      KEY_F9, KEY_F10, KEY_F11, KEY_F12};
  for (int i = 0; i < 12; ++i)
    set(static_cast<Key>(static_cast<int>(Key::F1) + i), kFunction[i]);

  set(Key::ShiftLeft, KEY_LEFTSHIFT);
  set(Key::CtrlLeft, KEY_LEFTCTRL);
  set(Key::AltLeft, KEY_LEFTALT);

  set(Key::Space, KEY_SPACE);
  set(Key::Enter, KEY_ENTER);
  set(Key::Tab, KEY_TAB);
  set(Key::Backspace, KEY_BACKSPACE);
  set(Key::Delete, KEY_DELETE);
  set(Key::Escape, KEY_ESC);
  set(Key::Left, KEY_LEFT);
  set(Key::Right, KEY_RIGHT);
  set(Key::Up, KEY_UP);
  set(Key::Down, KEY_DOWN);
  set(Key::Home, KEY_HOME);
  set(Key::End, KEY_END);
  set(Key::PageUp, KEY_PAGEUP);
  set(Key::PageDown, KEY_PAGEDOWN);
}

LinuxKeyMap initLinuxKeyMap(struct xkb_keymap *keymap,
                            struct xkb_state *state) {
  LinuxKeyMap out;

  if (keymap && state) {
    const xkb_keycode_t minKey = xkb_keymap_min_keycode(keymap);
    const xkb_keycode_t maxKey = xkb_keymap_max_keycode(keymap);
    for (xkb_keycode_t xkbKey = minKey; xkbKey <= maxKey; ++xkbKey) {
      const int evdevCode = static_cast<int>(xkbKey) - 8; // XKB offset
      if (evdevCode <= 0)
        continue;
      const Key mapped = keysymToKey(xkb_state_key_get_one_sym(state, xkbKey));
      if (mapped != Key::Unknown)
        out.keyToEvdev.try_emplace(mapped, evdevCode);
    }
  }

  const size_t discovered = out.keyToEvdev.size();
  fillLinuxFallbackMappings(out);

  KEYCADENCE_LOG_DEBUG("Linux keymap: %zu keys from layout, %zu total",
                       discovered, out.keyToEvdev.size());
  return out;
}

} // namespace keycadence::keyboard::detail

#endif // __linux__
