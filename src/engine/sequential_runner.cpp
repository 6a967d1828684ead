/**
 * @file engine/sequential_runner.cpp
 */

#include <keycadence/engine/sequential_runner.hpp>

#include <keycadence/log.hpp>

#include <stdexcept>

namespace keycadence::engine {

SequentialRunner::SequentialRunner(RunContext ctx, std::string processName,
                                   SequentialMode mode, bool verbose,
                                   keyboard::WindowHandle window)
    : m_ctx(std::move(ctx)), m_processName(std::move(processName)),
      m_mode(std::move(mode)), m_verbose(verbose), m_window(window) {
  if (m_mode.steps.empty())
    throw std::invalid_argument("SequentialRunner requires at least one step");
}

RunOutcome SequentialRunner::run() {
  process::ProcessWatcher watcher(m_ctx.processes);
  const auto &steps = m_mode.steps;
  size_t stepIndex = 0;
  uint32_t failures = 0;
  bool paused = false;

  KEYCADENCE_LOG_DEBUG("SequentialRunner: %zu steps, loop=%u repeat=%u",
                       steps.size(), static_cast<unsigned>(m_mode.loopForever),
                       m_mode.repeatCount);

  while (!m_ctx.control.isCancelled()) {
    if (!watcher.isAlive(m_processName)) {
      m_ctx.reporter.report(
          {.kind = EventKind::ProcessExited, .detail = m_processName});
      return RunOutcome::ProcessExited;
    }

    if (m_mode.repeatCount > 0 && m_passesCompleted >= m_mode.repeatCount)
      return RunOutcome::Completed;

    if (m_ctx.control.isPaused()) {
      if (!paused) {
        paused = true;
        m_ctx.reporter.report({.kind = EventKind::Paused});
      }
      m_ctx.control.sleepFor(m_pausePoll);
      continue;
    }
    if (paused) {
      paused = false;
      m_ctx.reporter.report({.kind = EventKind::Resumed});
    }

    const Step &step = steps[stepIndex];
    if (m_ctx.control.isCancelled())
      break;

    const keyboard::SendResult result =
        m_ctx.backend.sendKey(m_window, step.key);
    if (result == keyboard::SendResult::Aborted)
      break;
    if (result == keyboard::SendResult::Ok) {
      failures = 0;
      if (m_verbose) {
        m_ctx.reporter.report({.kind = EventKind::Emitted,
                               .key = step.key,
                               .stepIndex = stepIndex,
                               .stepCount = steps.size()});
      }
    } else {
      ++failures;
      m_ctx.reporter.report({.kind = EventKind::InjectionFailed,
                             .key = step.key,
                             .detail = keyboard::sendResultToString(result),
                             .failures = failures});
      if (failures >= kFailureBudget) {
        m_ctx.reporter.report({.kind = EventKind::FailureBudgetExhausted,
                               .key = step.key,
                               .failures = failures});
        return RunOutcome::FailureBudgetExhausted;
      }
    }

    if (!m_ctx.control.sleepFor(step.pauseAfter))
      break;

    if (++stepIndex == steps.size()) {
      stepIndex = 0;
      ++m_passesCompleted;
      if (m_verbose) {
        m_ctx.reporter.report(
            {.kind = EventKind::PassCompleted, .passes = m_passesCompleted});
      }
      if (!m_mode.loopForever)
        return RunOutcome::Completed;
    }
  }
  return RunOutcome::Cancelled;
}

} // namespace keycadence::engine
