/**
 * @file keyboard/sender.cpp
 * @brief Platform-independent delivery protocol of keycadence::keyboard::Sender.
 *
 * The platform specifics (window lookup, focus, event emission) live in the
 * `Desktop` implementations under `src/keyboard/desktop/`.
 */

#include <keycadence/keyboard/sender.hpp>

#include <keycadence/keyboard/key_resolver.hpp>
#include <keycadence/log.hpp>

#include <functional>
#include <ranges>
#include <stdexcept>
#include <thread>
#include <vector>

namespace keycadence::keyboard {

const char *sendResultToString(SendResult result) {
  switch (result) {
  case SendResult::Ok:
    return "Ok";
  case SendResult::UnsupportedKey:
    return "UnsupportedKey";
  case SendResult::InvalidCombination:
    return "InvalidCombination";
  case SendResult::InjectionFailed:
    return "InjectionFailed";
  case SendResult::Aborted:
    return "Aborted";
  default:
    return "Unknown";
  }
}

/**
 * @internal
 * @brief Pimpl for Sender.
 *
 * Holds the desktop, the key resolver and the protocol timings. Only the
 * desktop carries OS state; every `send` call works on stack-local batches.
 */
struct Sender::Impl {
  std::unique_ptr<Desktop> desktop;
  KeyResolver resolver;
  DeliveryTimings timings;
  std::function<bool()> abortCheck;

  explicit Impl(std::unique_ptr<Desktop> d) : desktop(std::move(d)) {
    if (!desktop)
      throw std::invalid_argument("Sender requires a desktop");
    KEYCADENCE_LOG_INFO("Sender: created; ready=%u",
                        static_cast<unsigned>(desktop->isReady()));
  }

  void pause(std::chrono::milliseconds d) const {
    if (d.count() > 0)
      std::this_thread::sleep_for(d);
  }

  static std::vector<KeyEvent> pressBatch(const KeyCombo &combo) {
    std::vector<KeyEvent> batch;
    batch.reserve(combo.modifiers.size() + 1);
    for (Key mod : combo.modifiers)
      batch.push_back({mod, true});
    batch.push_back({combo.primary, true});
    return batch;
  }

  static std::vector<KeyEvent> releaseBatch(const KeyCombo &combo) {
    std::vector<KeyEvent> batch;
    batch.reserve(combo.modifiers.size() + 1);
    batch.push_back({combo.primary, false});
    for (Key mod : combo.modifiers | std::views::reverse)
      batch.push_back({mod, false});
    return batch;
  }

  bool aborted() const { return abortCheck && abortCheck(); }

  void restoreFocus(const std::optional<uint64_t> &previous) {
    if (!previous || *previous == 0)
      return;
    pause(timings.focusSettle);
    if (!desktop->activate(*previous)) {
      KEYCADENCE_LOG_WARN("Sender: could not restore foreground 0x%llx",
                          static_cast<unsigned long long>(*previous));
    }
  }

  SendResult send(const WindowHandle &window, const std::string &keyName) {
    ErrorKind reason = ErrorKind::UnsupportedKey;
    auto combo = resolver.tryParseCombo(keyName, &reason);
    if (!combo) {
      KEYCADENCE_LOG_WARN("Sender: cannot parse key '%s' (%s)",
                          keyName.c_str(), errorKindToString(reason));
      return reason == ErrorKind::InvalidCombination
                 ? SendResult::InvalidCombination
                 : SendResult::UnsupportedKey;
    }

    if (!desktop->isReady()) {
      KEYCADENCE_LOG_ERROR("Sender: desktop not ready; cannot send '%s'",
                           keyName.c_str());
      return SendResult::InjectionFailed;
    }

    if (aborted())
      return SendResult::Aborted;

    // Step 1: bring the target to the foreground if it is not already.
    std::optional<uint64_t> previous = desktop->foregroundWindow();
    const bool focusChanged = !previous || *previous != window.id;
    if (focusChanged) {
      if (!desktop->activate(window.id)) {
        KEYCADENCE_LOG_WARN("Sender: could not activate window 0x%llx",
                            static_cast<unsigned long long>(window.id));
        return SendResult::InjectionFailed;
      }
      pause(timings.focusSettle);
    }

    // Nothing has been pressed yet; a cancellation during focus settle ends
    // here.
    if (aborted()) {
      KEYCADENCE_LOG_DEBUG("Sender: '%s' aborted before press",
                           keyName.c_str());
      if (focusChanged)
        restoreFocus(previous);
      return SendResult::Aborted;
    }

    // Step 2: press, hold, release. The release batch is sent even when the
    // press batch failed so no modifier stays latched.
    const bool pressed = desktop->emit(pressBatch(*combo));
    pause(timings.pressHold);
    const bool released = desktop->emit(releaseBatch(*combo));

    // Step 3: hand focus back.
    if (focusChanged)
      restoreFocus(previous);

    if (!pressed || !released) {
      KEYCADENCE_LOG_ERROR("Sender: emit failed for '%s' (press=%u release=%u)",
                           keyName.c_str(), static_cast<unsigned>(pressed),
                           static_cast<unsigned>(released));
      return SendResult::InjectionFailed;
    }

    KEYCADENCE_LOG_DEBUG("Sender: delivered '%s' to window 0x%llx (pid %u)",
                         comboToString(*combo).c_str(),
                         static_cast<unsigned long long>(window.id),
                         window.pid);
    return SendResult::Ok;
  }
};

// Public interface implementation
Sender::Sender() : m_impl(std::make_unique<Impl>(makePlatformDesktop())) {}
Sender::Sender(std::unique_ptr<Desktop> desktop)
    : m_impl(std::make_unique<Impl>(std::move(desktop))) {}
Sender::~Sender() = default;
Sender::Sender(Sender &&) noexcept = default;
Sender &Sender::operator=(Sender &&) noexcept = default;

bool Sender::isReady() const { return m_impl && m_impl->desktop->isReady(); }

std::optional<WindowHandle> Sender::findWindowForProcess(uint32_t pid) {
  if (!m_impl)
    return std::nullopt;
  return m_impl->desktop->findWindowForProcess(pid);
}

SendResult Sender::sendKey(const WindowHandle &window,
                           const std::string &keyName) {
  if (!m_impl)
    return SendResult::InjectionFailed;
  return m_impl->send(window, keyName);
}

void Sender::setAbortCheck(std::function<bool()> check) {
  if (m_impl)
    m_impl->abortCheck = std::move(check);
}

void Sender::setTimings(DeliveryTimings timings) {
  if (m_impl)
    m_impl->timings = timings;
}

} // namespace keycadence::keyboard
