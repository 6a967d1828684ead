#pragma once
/**
 * @file keyboard/common/linux_keysym.hpp
 * @brief Internal helpers for mapping logical keys to evdev codes on Linux.
 *
 * The Linux desktop emits raw evdev codes through uinput; the active XKB
 * layout decides which code yields which letter, so the table is built by
 * walking the compiled keymap and falling back to the US evdev layout for
 * everything the walk does not find.
 *
 * This header is intentionally placed under `src/` (not installed).
 */

#if defined(__linux__)

#include <keycadence/keyboard/common.hpp>

#include <string>
#include <unordered_map>
#include <xkbcommon/xkbcommon.h>

namespace keycadence::keyboard::detail {

/**
 * @brief Logical key to evdev keycode table used by the uinput emitter.
 */
struct LinuxKeyMap {
  std::unordered_map<Key, int> keyToEvdev;
};

/**
 * @brief XKB rule names discovered from the environment.
 *
 * Empty members mean "let xkbcommon pick its default".
 */
struct XkbRuleNames {
  std::string rules;
  std::string model;
  std::string layout;
  std::string variant;
  std::string options;

  [[nodiscard]] bool empty() const {
    return rules.empty() && model.empty() && layout.empty() &&
           variant.empty() && options.empty();
  }
};

/**
 * @brief Detect the configured keyboard layout.
 *
 * Looks at the `XKB_DEFAULT_*` environment variables first, then at the
 * `XKB*` entries of `/etc/default/keyboard`.
 */
XkbRuleNames detectXkbRuleNames();

/**
 * @brief Map an XKB keysym to a logical Key, or Key::Unknown.
 */
Key keysymToKey(xkb_keysym_t sym);

/**
 * @brief Fill fixed evdev codes for every logical key that has no mapping yet.
 */
void fillLinuxFallbackMappings(LinuxKeyMap &keyMap);

/**
 * @brief Build the key table from a compiled XKB keymap.
 * @param keymap Keymap to walk; may be nullptr for fallback-only mode.
 * @param state State for @p keymap; may be nullptr for fallback-only mode.
 */
LinuxKeyMap initLinuxKeyMap(struct xkb_keymap *keymap, struct xkb_state *state);

} // namespace keycadence::keyboard::detail

#endif // __linux__
