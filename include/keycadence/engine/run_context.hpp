#pragma once
/**
 * @file engine/run_context.hpp
 * @brief Collaborators shared by the acquirer and the runners, and the way a
 * run ends.
 */

#include <keycadence/core.hpp>
#include <keycadence/engine/control.hpp>
#include <keycadence/engine/reporter.hpp>
#include <keycadence/keyboard/backend.hpp>
#include <keycadence/process/watcher.hpp>

#include <cstdint>
#include <memory>

namespace keycadence::engine {

/// Adjacent failed keystrokes after which a runner (or timer) gives up.
inline constexpr uint32_t kFailureBudget = 5;

/**
 * @enum RunOutcome
 * @brief How a runner finished.
 */
enum class RunOutcome : uint8_t {
  /// Single pass or the requested number of passes done.
  Completed,
  /// `Control::cancel()` was observed.
  Cancelled,
  /// The target process disappeared.
  ProcessExited,
  /// `kFailureBudget` adjacent keystrokes failed.
  FailureBudgetExhausted,
};

KEYCADENCE_API const char *runOutcomeToString(RunOutcome outcome);

/**
 * @struct RunContext
 * @brief References to the collaborators of one engine invocation.
 *
 * The referenced objects must outlive every runner built from the context.
 * `backend` and `reporter` are shared by all threads of a run; each thread
 * builds its own `ProcessWatcher` over `processes`.
 */
struct RunContext {
  keyboard::InputBackend &backend;
  std::shared_ptr<const process::ProcessSource> processes;
  Control &control;
  Reporter &reporter;
};

} // namespace keycadence::engine
