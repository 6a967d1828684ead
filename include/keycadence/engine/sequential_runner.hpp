#pragma once
/**
 * @file engine/sequential_runner.hpp
 * @brief One timeline of (key, pause-after) steps.
 */

#include <keycadence/engine/config.hpp>
#include <keycadence/engine/run_context.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace keycadence::engine {

/**
 * @class SequentialRunner
 * @brief Presses the configured steps in order, looping or repeating as
 * configured.
 *
 * Each iteration first checks that the target process is still alive, then
 * the repeat bound, then the pause flag; only then is the current step sent
 * and its pause slept. A pause requested mid-sleep is observed at the next
 * iteration.
 */
class KEYCADENCE_API SequentialRunner {
public:
  SequentialRunner(RunContext ctx, std::string processName, SequentialMode mode,
                   bool verbose, keyboard::WindowHandle window);

  /**
   * @brief Run until completion, cancellation, process exit or failure budget.
   */
  RunOutcome run();

  [[nodiscard]] uint64_t passesCompleted() const noexcept {
    return m_passesCompleted;
  }

  /// Poll interval while paused (100 ms by default).
  void setPausePoll(std::chrono::milliseconds poll) { m_pausePoll = poll; }

private:
  RunContext m_ctx;
  std::string m_processName;
  SequentialMode m_mode;
  bool m_verbose;
  keyboard::WindowHandle m_window;
  std::chrono::milliseconds m_pausePoll{100};
  uint64_t m_passesCompleted{0};
};

} // namespace keycadence::engine
