/**
 * @file keyboard/desktop/desktop_unsupported.cpp
 * @brief Desktop for hosts without a native implementation.
 */

#if !defined(__linux__) && !defined(_WIN32)

#include <keycadence/keyboard/desktop.hpp>
#include <keycadence/log.hpp>

namespace keycadence::keyboard {

namespace {

class UnsupportedDesktop final : public Desktop {
public:
  UnsupportedDesktop() {
    KEYCADENCE_LOG_WARN("Desktop: no input injection support on this platform");
  }

  bool isReady() const override { return false; }
  std::optional<WindowHandle> findWindowForProcess(uint32_t) override {
    return std::nullopt;
  }
  std::optional<uint64_t> foregroundWindow() override { return std::nullopt; }
  bool activate(uint64_t) override { return false; }
  bool emit(const std::vector<KeyEvent> &) override { return false; }
};

} // namespace

std::unique_ptr<Desktop> makePlatformDesktop() {
  return std::make_unique<UnsupportedDesktop>();
}

} // namespace keycadence::keyboard

#endif
