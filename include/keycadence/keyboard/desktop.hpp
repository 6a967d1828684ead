#pragma once
/**
 * @file keyboard/desktop.hpp
 * @brief Platform primitives the `Sender` builds its delivery protocol on.
 *
 * One implementation exists per host: X11 + uinput on Linux, Win32 on
 * Windows. Hosts without an implementation get a desktop that reports itself
 * not ready.
 */

#include <keycadence/keyboard/backend.hpp>
#include <keycadence/keyboard/common.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace keycadence::keyboard {

/**
 * @class Desktop
 * @brief Window lookup, focus control and raw event emission.
 *
 * All members may be called concurrently from several threads.
 */
class KEYCADENCE_API Desktop {
public:
  virtual ~Desktop() = default;

  /**
   * @brief Whether the desktop could acquire its OS resources (display
   * connection, virtual keyboard device, ...).
   */
  [[nodiscard]] virtual bool isReady() const = 0;

  virtual std::optional<WindowHandle> findWindowForProcess(uint32_t pid) = 0;

  /**
   * @brief Return the window currently receiving keyboard input.
   * @return std::optional<uint64_t> Its id, or nullopt when none is known.
   */
  virtual std::optional<uint64_t> foregroundWindow() = 0;

  /**
   * @brief Restore @p windowId if minimized, raise it and make it the
   * foreground window.
   * @return true if the request was accepted by the OS.
   */
  virtual bool activate(uint64_t windowId) = 0;

  /**
   * @brief Emit a batch of key transitions, atomically where the OS allows.
   * @return true only if every event was accepted.
   */
  virtual bool emit(const std::vector<KeyEvent> &batch) = 0;
};

/**
 * @brief Create the desktop implementation for the host platform.
 */
KEYCADENCE_API std::unique_ptr<Desktop> makePlatformDesktop();

} // namespace keycadence::keyboard
