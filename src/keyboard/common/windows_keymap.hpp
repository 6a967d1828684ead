#pragma once
/**
 * @file keyboard/common/windows_keymap.hpp
 * @brief Internal helpers for mapping logical keys to Windows virtual-key
 * codes.
 *
 * This header is intentionally placed under `src/` (not installed) because it
 * is an internal implementation detail of the Windows desktop.
 */

#ifdef _WIN32

#include <Windows.h>
#include <keycadence/keyboard/common.hpp>
#include <unordered_map>

namespace keycadence::keyboard::detail {

/**
 * @brief Logical key to VK code table used by the SendInput emitter.
 */
struct WindowsKeyMap {
  std::unordered_map<Key, WORD> keyToVk;
};

/**
 * @brief Build the key table for a keyboard layout.
 *
 * Letters and digits are resolved through `VkKeyScanExW` so that the key named
 * "a" produces an `a` on layouts that move it; the remaining keys use their
 * fixed VK codes.
 *
 * @param layout Keyboard layout handle; nullptr uses the calling thread's.
 */
WindowsKeyMap initWindowsKeyMap(HKL layout = nullptr);

/**
 * @brief Fill fixed VK codes for every logical key that has no mapping yet.
 */
void fillWindowsFallbackMappings(WindowsKeyMap &keyMap);

/**
 * @brief Whether @p vk needs KEYEVENTF_EXTENDEDKEY when synthesized.
 */
bool isWindowsExtendedKey(WORD vk);

} // namespace keycadence::keyboard::detail

#endif // _WIN32
