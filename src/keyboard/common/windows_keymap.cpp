/**
 * @file keyboard/common/windows_keymap.cpp
 * @brief Logical key to VK code mapping for the Windows desktop.
 */

#ifdef _WIN32

#include "keyboard/common/windows_keymap.hpp"

#include <keycadence/log.hpp>

namespace keycadence::keyboard::detail {

bool isWindowsExtendedKey(WORD vk) {
  switch (vk) {
  case VK_DELETE:
  case VK_HOME:
  case VK_END:
  case VK_PRIOR:
  case VK_NEXT:
  case VK_LEFT:
  case VK_RIGHT:
  case VK_UP:
  case VK_DOWN:
    return true;
  default:
    return false;
  }
}

void fillWindowsFallbackMappings(WindowsKeyMap &keyMap) {
  auto setIfMissing = [&keyMap](Key key, WORD vk) {
    keyMap.keyToVk.try_emplace(key, vk);
  };

  // VK codes for letters and digits equal their uppercase ASCII value.
  for (int i = 0; i < 26; ++i)
    setIfMissing(static_cast<Key>(static_cast<int>(Key::A) + i),
                 static_cast<WORD>('A' + i));
  for (int i = 0; i < 10; ++i)
    setIfMissing(static_cast<Key>(static_cast<int>(Key::Num0) + i),
                 static_cast<WORD>('0' + i));
  for (int i = 0; i < 12; ++i)
    setIfMissing(static_cast<Key>(static_cast<int>(Key::F1) + i),
                 static_cast<WORD>(VK_F1 + i));

  setIfMissing(Key::Space, VK_SPACE);
  setIfMissing(Key::Enter, VK_RETURN);
  setIfMissing(Key::Tab, VK_TAB);
  setIfMissing(Key::Backspace, VK_BACK);
  setIfMissing(Key::Delete, VK_DELETE);
  setIfMissing(Key::Escape, VK_ESCAPE);
  setIfMissing(Key::Left, VK_LEFT);
  setIfMissing(Key::Right, VK_RIGHT);
  setIfMissing(Key::Up, VK_UP);
  setIfMissing(Key::Down, VK_DOWN);
  setIfMissing(Key::Home, VK_HOME);
  setIfMissing(Key::End, VK_END);
  setIfMissing(Key::PageUp, VK_PRIOR);
  setIfMissing(Key::PageDown, VK_NEXT);

  setIfMissing(Key::ShiftLeft, VK_LSHIFT);
  setIfMissing(Key::CtrlLeft, VK_LCONTROL);
  setIfMissing(Key::AltLeft, VK_LMENU);
}

WindowsKeyMap initWindowsKeyMap(HKL layout) {
  WindowsKeyMap out;
  if (!layout)
    layout = GetKeyboardLayout(0);

  auto scan = [&out, layout](Key key, wchar_t ch) {
    const SHORT res = VkKeyScanExW(ch, layout);
    if (res == -1)
      return;
    // Only accept keys that produce the character without modifiers.
    if (HIBYTE(res) != 0)
      return;
    out.keyToVk.try_emplace(key, static_cast<WORD>(LOBYTE(res)));
  };

  for (int i = 0; i < 26; ++i)
    scan(static_cast<Key>(static_cast<int>(Key::A) + i),
         static_cast<wchar_t>(L'a' + i));
  for (int i = 0; i < 10; ++i)
    scan(static_cast<Key>(static_cast<int>(Key::Num0) + i),
         static_cast<wchar_t>(L'0' + i));

  const size_t discovered = out.keyToVk.size();
  fillWindowsFallbackMappings(out);

  KEYCADENCE_LOG_DEBUG("Windows keymap: %zu keys from layout, %zu total",
                       discovered, out.keyToVk.size());
  return out;
}

} // namespace keycadence::keyboard::detail

#endif // _WIN32
