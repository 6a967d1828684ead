#pragma once
/**
 * @file keyboard/backend.hpp
 * @brief Capability boundary between the engine and the operating system.
 *
 * The engine is written against `InputBackend` only; `Sender` is the
 * production implementation and tests substitute their own.
 */

#include <keycadence/core.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace keycadence::keyboard {

/**
 * @struct WindowHandle
 * @brief Opaque OS window identifier paired with its owning process id.
 *
 * `id` is an X11 `Window` on Linux and an `HWND` on Windows. A handle is only
 * meaningful while the owning process is alive.
 */
struct WindowHandle {
  uint64_t id{0};
  uint32_t pid{0};

  bool operator==(const WindowHandle &) const = default;
};

/**
 * @enum SendResult
 * @brief Outcome of a single `sendKey` call.
 */
enum class SendResult : uint8_t {
  Ok,
  UnsupportedKey,
  InvalidCombination,
  InjectionFailed,
  /// The abort check fired before anything was emitted.
  Aborted,
};

KEYCADENCE_API const char *sendResultToString(SendResult result);

/**
 * @class InputBackend
 * @brief Locates windows and delivers synthetic keystrokes to them.
 *
 * Implementations must accept concurrent calls from several runner threads.
 */
class KEYCADENCE_API InputBackend {
public:
  virtual ~InputBackend() = default;

  /**
   * @brief Return the first visible, titled top-level window owned by @p pid.
   * @param pid Process id.
   * @return std::optional<WindowHandle> A qualifying window, or nullopt.
   */
  virtual std::optional<WindowHandle> findWindowForProcess(uint32_t pid) = 0;

  /**
   * @brief Deliver one press-release of @p keyName (possibly a combination)
   * to @p window.
   * @param window Target window.
   * @param keyName Key name as written in the configuration.
   * @return SendResult Ok on success.
   */
  virtual SendResult sendKey(const WindowHandle &window,
                             const std::string &keyName) = 0;

  /**
   * @brief Install a predicate consulted before a keystroke is emitted.
   *
   * When it returns true the backend emits nothing and `sendKey` returns
   * `SendResult::Aborted`. Must be set before concurrent `sendKey` calls
   * start. The default implementation ignores the predicate.
   */
  virtual void setAbortCheck(std::function<bool()> /*check*/) {}
};

} // namespace keycadence::keyboard
