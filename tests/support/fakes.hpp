#pragma once
/**
 * @file support/fakes.hpp
 * @brief In-memory stand-ins for the OS-facing seams, shared by the unit
 * tests.
 */

#include <keycadence/engine/reporter.hpp>
#include <keycadence/keyboard/backend.hpp>
#include <keycadence/keyboard/desktop.hpp>
#include <keycadence/process/watcher.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace keycadence::fakes {

/// Records every desktop call in order.
class FakeDesktop final : public keyboard::Desktop {
public:
  struct Call {
    enum class Op { Activate, Emit } op;
    uint64_t window{0};
    std::vector<keyboard::KeyEvent> batch;
  };

  bool ready{true};
  std::optional<uint64_t> foreground;
  std::optional<keyboard::WindowHandle> window;
  bool activateOk{true};
  bool emitOk{true};
  std::vector<Call> calls;
  /// Runs inside `activate`, after the call is recorded.
  std::function<void(uint64_t)> onActivate;

  [[nodiscard]] bool isReady() const override { return ready; }

  std::optional<keyboard::WindowHandle>
  findWindowForProcess(uint32_t pid) override {
    if (window && window->pid == pid)
      return window;
    return std::nullopt;
  }

  std::optional<uint64_t> foregroundWindow() override { return foreground; }

  bool activate(uint64_t windowId) override {
    calls.push_back({Call::Op::Activate, windowId, {}});
    if (onActivate)
      onActivate(windowId);
    if (activateOk)
      foreground = windowId;
    return activateOk;
  }

  bool emit(const std::vector<keyboard::KeyEvent> &batch) override {
    calls.push_back({Call::Op::Emit, 0, batch});
    return emitOk;
  }

  std::vector<uint64_t> activations() const {
    std::vector<uint64_t> out;
    for (const Call &c : calls) {
      if (c.op == Call::Op::Activate)
        out.push_back(c.window);
    }
    return out;
  }

  std::vector<std::vector<keyboard::KeyEvent>> emits() const {
    std::vector<std::vector<keyboard::KeyEvent>> out;
    for (const Call &c : calls) {
      if (c.op == Call::Op::Emit)
        out.push_back(c.batch);
    }
    return out;
  }
};

/**
 * Thread-safe backend that records sent keys. Results can be scripted per
 * key; unscripted sends return `defaultResult`. `onSend` runs after each
 * send, outside the lock.
 */
class FakeBackend final : public keyboard::InputBackend {
public:
  std::optional<keyboard::WindowHandle> window{keyboard::WindowHandle{0x42, 0}};
  std::function<void(const std::string &)> onSend;

  std::optional<keyboard::WindowHandle>
  findWindowForProcess(uint32_t pid) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lookups.push_back(pid);
    if (!window)
      return std::nullopt;
    keyboard::WindowHandle w = *window;
    w.pid = pid;
    return w;
  }

  keyboard::SendResult sendKey(const keyboard::WindowHandle &,
                               const std::string &keyName) override {
    keyboard::SendResult result;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_sent.push_back(keyName);
      auto &queue = m_scripted[keyName];
      if (!queue.empty()) {
        result = queue.front();
        queue.pop_front();
      } else {
        result = m_defaultResult;
      }
    }
    if (onSend)
      onSend(keyName);
    return result;
  }

  void script(const std::string &key, std::vector<keyboard::SendResult> r) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scripted[key].assign(r.begin(), r.end());
  }

  void setDefaultResult(keyboard::SendResult r) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultResult = r;
  }

  std::vector<std::string> sent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sent;
  }

  size_t count(const std::string &key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::ranges::count(m_sent, key));
  }

  std::vector<uint32_t> lookups() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lookups;
  }

  void setAbortCheck(std::function<bool()> check) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_abortCheck = std::move(check);
  }

  std::function<bool()> abortCheck() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_abortCheck;
  }

private:
  mutable std::mutex m_mutex;
  std::vector<std::string> m_sent;
  std::vector<uint32_t> m_lookups;
  std::unordered_map<std::string, std::deque<keyboard::SendResult>> m_scripted;
  keyboard::SendResult m_defaultResult{keyboard::SendResult::Ok};
  std::function<bool()> m_abortCheck;
};

/// Process table that tests can edit while a runner polls it.
class FakeProcessSource final : public process::ProcessSource {
public:
  FakeProcessSource() = default;
  explicit FakeProcessSource(std::vector<process::ProcessInfo> procs)
      : m_procs(std::move(procs)) {}

  std::vector<process::ProcessInfo> list() const override {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_listCalls;
    return m_procs;
  }

  void set(std::vector<process::ProcessInfo> procs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_procs = std::move(procs);
  }

  void clear() { set({}); }

  size_t listCalls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_listCalls;
  }

private:
  mutable std::mutex m_mutex;
  mutable size_t m_listCalls{0};
  std::vector<process::ProcessInfo> m_procs;
};

class RecordingReporter final : public engine::Reporter {
public:
  void report(const engine::Event &event) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(event);
  }

  std::vector<engine::Event> events() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
  }

  std::vector<engine::EventKind> kinds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<engine::EventKind> out;
    for (const engine::Event &e : m_events)
      out.push_back(e.kind);
    return out;
  }

  size_t count(engine::EventKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::ranges::count_if(
        m_events, [kind](const engine::Event &e) { return e.kind == kind; }));
  }

private:
  mutable std::mutex m_mutex;
  std::vector<engine::Event> m_events;
};

} // namespace keycadence::fakes
