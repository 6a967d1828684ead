/**
 * @file engine/control.cpp
 */

#include <keycadence/engine/control.hpp>

#include <keycadence/log.hpp>

namespace keycadence::engine {

void Control::cancel() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled.exchange(true, std::memory_order_acq_rel))
      return;
  }
  KEYCADENCE_LOG_DEBUG("Control: cancellation requested");
  m_cv.notify_all();
}

bool Control::sleepFor(std::chrono::milliseconds d) {
  return sleepUntil(Clock::now() + d);
}

bool Control::sleepUntil(Clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(m_mutex);
  // wait_until returns the predicate: true means cancelled.
  return !m_cv.wait_until(lock, deadline, [this] {
    return m_cancelled.load(std::memory_order_acquire);
  });
}

} // namespace keycadence::engine
