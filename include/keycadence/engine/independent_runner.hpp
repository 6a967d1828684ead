#pragma once
/**
 * @file engine/independent_runner.hpp
 * @brief Parallel periodic timers, one per configured key.
 */

#include <keycadence/engine/config.hpp>
#include <keycadence/engine/run_context.hpp>

#include <atomic>
#include <string>

namespace keycadence::engine {

/**
 * @class IndependentRunner
 * @brief Drives every timer on its own thread against one shared backend.
 *
 * A timer fires immediately and then every period, measured on the steady
 * clock from its start instant. A timer that falls more than one period
 * behind fires once and skips to the next future multiple of its period
 * (missed ticks are coalesced, not replayed).
 *
 * Each timer keeps its own failure counter and process watcher. `run()`
 * returns once every timer thread has exited.
 */
class KEYCADENCE_API IndependentRunner {
public:
  IndependentRunner(RunContext ctx, std::string processName,
                    IndependentMode mode, bool verbose,
                    keyboard::WindowHandle window);

  /**
   * @brief Run all timers and wait for them.
   * @return RunOutcome The most severe timer outcome, ordered
   * FailureBudgetExhausted > ProcessExited > Cancelled > Completed.
   */
  RunOutcome run();

private:
  RunOutcome runTimer(const Timer &timer);
  void notePaused(bool paused);

  RunContext m_ctx;
  std::string m_processName;
  IndependentMode m_mode;
  bool m_verbose;
  keyboard::WindowHandle m_window;
  std::atomic<bool> m_pauseReported{false};
};

} // namespace keycadence::engine
