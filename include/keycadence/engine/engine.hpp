#pragma once
/**
 * @file engine/engine.hpp
 * @brief Run-until-done entry point of the keystroke engine.
 *
 * @par Usage:
 * @code{.cpp}
 * #include <keycadence/engine/engine.hpp>
 * #include <keycadence/keyboard/sender.hpp>
 *
 * keycadence::keyboard::KeyResolver resolver;
 * auto config = keycadence::engine::validate(settings, resolver);
 * keycadence::keyboard::Sender sender;
 * keycadence::engine::Control control;
 * keycadence::engine::LogReporter reporter;
 * keycadence::engine::Engine engine(
 *     {sender, keycadence::process::makeSystemProcessSource(), control,
 *      reporter});
 * auto outcome = engine.run(config);
 * @endcode
 */

#include <keycadence/engine/acquirer.hpp>
#include <keycadence/engine/config.hpp>
#include <keycadence/engine/control.hpp>
#include <keycadence/engine/independent_runner.hpp>
#include <keycadence/engine/reporter.hpp>
#include <keycadence/engine/run_context.hpp>
#include <keycadence/engine/sequential_runner.hpp>

#include <chrono>

namespace keycadence::engine {

/**
 * @class Engine
 * @brief Acquires the target window and runs the configured mode on it.
 *
 * One runner is active per `run()` call. The configuration is copied into the
 * runner at startup and never read again.
 */
class KEYCADENCE_API Engine {
public:
  explicit Engine(RunContext ctx);

  /**
   * @brief Acquire the target and run until done.
   * @return RunOutcome How the run ended; Cancelled also covers a
   * cancellation during acquisition.
   * @throws keycadence::Error (ProcessNotFound) when acquisition exhausts its
   * attempts.
   */
  RunOutcome run(const Configuration &config);

  /// Delay between acquisition attempts (1 s by default).
  void setRetryDelay(std::chrono::milliseconds delay) { m_retryDelay = delay; }

private:
  RunContext m_ctx;
  std::chrono::milliseconds m_retryDelay{1000};
};

} // namespace keycadence::engine
