#pragma once

/**
 * @file keyboard/sender.hpp
 * @brief Production `InputBackend`: focus-aware keystroke delivery.
 *
 * @par Usage:
 * @code{.cpp}
 * #include <keycadence/keyboard/sender.hpp>
 *
 * int main() {
 *   keycadence::keyboard::Sender sender;
 *   if (auto win = sender.findWindowForProcess(1234)) {
 *     sender.sendKey(*win, "ctrl+s");
 *   }
 *   return 0;
 * }
 * @endcode
 */

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <keycadence/keyboard/backend.hpp>
#include <keycadence/keyboard/desktop.hpp>

namespace keycadence::keyboard {

/**
 * @struct DeliveryTimings
 * @brief Pauses used by the delivery protocol.
 */
struct DeliveryTimings {
  /// Wait after changing focus and before restoring it.
  std::chrono::milliseconds focusSettle{50};
  /// Time the primary key is held down.
  std::chrono::milliseconds pressHold{30};
};

/**
 * @class Sender
 * @brief Delivers key presses to a window through a platform `Desktop`.
 *
 * For a combination `M1+...+Mk+P` the sender:
 *  1. focuses the target if it is not the foreground window (remembering the
 *     previous one) and waits for focus to settle;
 *  2. emits `down M1..Mk, down P` as one batch, holds, then emits
 *     `up P, up Mk..M1` as one batch;
 *  3. restores the previous foreground window if focus was changed.
 *
 * The implementation is hidden in the pimpl (`Impl`) type.
 */
class KEYCADENCE_API Sender final : public InputBackend {
public:
  /**
   * @brief Construct a Sender over the host platform's desktop.
   */
  Sender();

  /**
   * @brief Construct a Sender over a caller-supplied desktop.
   * @param desktop Desktop to drive; must not be null.
   */
  explicit Sender(std::unique_ptr<Desktop> desktop);

  ~Sender() override;

  // Non-copyable, movable
  Sender(const Sender &) = delete;
  Sender &operator=(const Sender &) = delete;
  Sender(Sender &&) noexcept;
  Sender &operator=(Sender &&) noexcept;

  /**
   * @brief Check whether the underlying desktop is ready to inject input.
   */
  [[nodiscard]] bool isReady() const;

  std::optional<WindowHandle> findWindowForProcess(uint32_t pid) override;

  SendResult sendKey(const WindowHandle &window,
                     const std::string &keyName) override;

  /**
   * @brief Checked before focusing the target and again right before the
   * press batch. A check that fires after focus moved still restores it.
   */
  void setAbortCheck(std::function<bool()> check) override;

  /**
   * @brief Override the protocol pauses (tests use zero).
   */
  void setTimings(DeliveryTimings timings);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace keycadence::keyboard
