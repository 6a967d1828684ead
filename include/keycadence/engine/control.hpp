#pragma once
/**
 * @file engine/control.hpp
 * @brief Shared run state: cancellation, pause and cancelable waits.
 */

#include <keycadence/core.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace keycadence::engine {

/**
 * @class Control
 * @brief Cancellation and pause flags shared by every task of a run.
 *
 * `cancel()` is one-way and wakes every thread blocked in `sleepFor` or
 * `sleepUntil`. `setPaused()` only flips a flag; runners poll it. All members
 * are safe to call from any thread; `cancel()` is not async-signal-safe, so
 * signal handlers should set a flag that another thread relays.
 */
class KEYCADENCE_API Control {
public:
  using Clock = std::chrono::steady_clock;

  Control() = default;
  Control(const Control &) = delete;
  Control &operator=(const Control &) = delete;

  /**
   * @brief Request cancellation. Idempotent.
   */
  void cancel();

  [[nodiscard]] bool isCancelled() const noexcept {
    return m_cancelled.load(std::memory_order_acquire);
  }

  void setPaused(bool paused) noexcept {
    m_paused.store(paused, std::memory_order_release);
  }

  [[nodiscard]] bool isPaused() const noexcept {
    return m_paused.load(std::memory_order_acquire);
  }

  /**
   * @brief Sleep for @p d unless cancelled first.
   * @return true if the full duration elapsed, false if cancelled.
   */
  bool sleepFor(std::chrono::milliseconds d);

  /**
   * @brief Sleep until @p deadline unless cancelled first.
   * @return true if the deadline was reached, false if cancelled.
   */
  bool sleepUntil(Clock::time_point deadline);

private:
  std::atomic<bool> m_cancelled{false};
  std::atomic<bool> m_paused{false};
  std::mutex m_mutex;
  std::condition_variable m_cv;
};

} // namespace keycadence::engine
