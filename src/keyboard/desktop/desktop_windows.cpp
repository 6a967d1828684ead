/**
 * @file keyboard/desktop/desktop_windows.cpp
 * @brief Windows desktop: Win32 window enumeration, focus and SendInput.
 */

#ifdef _WIN32
#include <Windows.h>
#include <keycadence/keyboard/desktop.hpp>
#include <keycadence/log.hpp>
#include <unordered_map>
#include <vector>

#include "keyboard/common/windows_keymap.hpp"

namespace keycadence::keyboard {

namespace {

struct EnumContext {
  DWORD pid{0};
  HWND found{nullptr};
};

BOOL CALLBACK findProcessWindow(HWND hwnd, LPARAM lParam) {
  auto *ctx = reinterpret_cast<EnumContext *>(lParam);
  DWORD owner = 0;
  GetWindowThreadProcessId(hwnd, &owner);
  if (owner != ctx->pid)
    return TRUE;
  if (!IsWindowVisible(hwnd))
    return TRUE;
  if (GetWindowTextLengthW(hwnd) <= 0)
    return TRUE;
  ctx->found = hwnd;
  return FALSE; // stop enumeration
}

HWND toHwnd(uint64_t id) {
  return reinterpret_cast<HWND>(static_cast<uintptr_t>(id));
}

} // namespace

/**
 * @internal
 * @brief Win32 implementation of Desktop.
 *
 * Holds the layout-aware VK table; every other call goes straight to user32.
 */
class WindowsDesktop final : public Desktop {
public:
  WindowsDesktop()
      : m_keyMap(detail::initWindowsKeyMap(GetKeyboardLayout(0)).keyToVk) {
    KEYCADENCE_LOG_INFO("WindowsDesktop: created; keys=%zu", m_keyMap.size());
  }

  bool isReady() const override { return true; }

  std::optional<WindowHandle> findWindowForProcess(uint32_t pid) override {
    EnumContext ctx{static_cast<DWORD>(pid), nullptr};
    EnumWindows(findProcessWindow, reinterpret_cast<LPARAM>(&ctx));
    if (!ctx.found)
      return std::nullopt;
    KEYCADENCE_LOG_DEBUG("WindowsDesktop: pid %u owns window %p", pid,
                         static_cast<void *>(ctx.found));
    return WindowHandle{
        static_cast<uint64_t>(reinterpret_cast<uintptr_t>(ctx.found)), pid};
  }

  std::optional<uint64_t> foregroundWindow() override {
    HWND hwnd = GetForegroundWindow();
    if (!hwnd)
      return std::nullopt;
    return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(hwnd));
  }

  bool activate(uint64_t windowId) override {
    HWND hwnd = toHwnd(windowId);
    if (!IsWindow(hwnd))
      return false;
    if (IsIconic(hwnd))
      ShowWindow(hwnd, SW_RESTORE);
    BringWindowToTop(hwnd);
    if (!SetForegroundWindow(hwnd)) {
      KEYCADENCE_LOG_WARN("WindowsDesktop: SetForegroundWindow(%p) refused",
                          static_cast<void *>(hwnd));
      return false;
    }
    return true;
  }

  bool emit(const std::vector<KeyEvent> &batch) override {
    if (batch.empty())
      return false;

    std::vector<INPUT> inputs;
    inputs.reserve(batch.size());
    for (const KeyEvent &ke : batch) {
      auto it = m_keyMap.find(ke.key);
      if (it == m_keyMap.end()) {
        KEYCADENCE_LOG_ERROR("WindowsDesktop: no VK code for key=%s",
                             keyToString(ke.key).c_str());
        return false;
      }
      const WORD vk = it->second;
      INPUT input{};
      input.type = INPUT_KEYBOARD;
      input.ki.wVk = vk;
      input.ki.wScan = static_cast<WORD>(MapVirtualKeyW(vk, MAPVK_VK_TO_VSC));
      input.ki.dwFlags = 0;
      if (detail::isWindowsExtendedKey(vk))
        input.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
      if (!ke.down)
        input.ki.dwFlags |= KEYEVENTF_KEYUP;
      inputs.push_back(input);
    }

    const UINT accepted = SendInput(static_cast<UINT>(inputs.size()),
                                    inputs.data(), sizeof(INPUT));
    if (accepted < inputs.size()) {
      KEYCADENCE_LOG_ERROR("WindowsDesktop: SendInput accepted %u of %zu "
                           "events (error %lu)",
                           accepted, inputs.size(), GetLastError());
      return false;
    }
    return true;
  }

private:
  std::unordered_map<Key, WORD> m_keyMap;
};

std::unique_ptr<Desktop> makePlatformDesktop() {
  return std::make_unique<WindowsDesktop>();
}

} // namespace keycadence::keyboard

#endif // _WIN32
