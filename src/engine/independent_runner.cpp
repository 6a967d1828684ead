/**
 * @file engine/independent_runner.cpp
 */

#include <keycadence/engine/independent_runner.hpp>

#include <keycadence/log.hpp>

#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace keycadence::engine {

namespace {

int severity(RunOutcome outcome) {
  switch (outcome) {
  case RunOutcome::FailureBudgetExhausted:
    return 3;
  case RunOutcome::ProcessExited:
    return 2;
  case RunOutcome::Cancelled:
    return 1;
  default:
    return 0;
  }
}

} // namespace

IndependentRunner::IndependentRunner(RunContext ctx, std::string processName,
                                     IndependentMode mode, bool verbose,
                                     keyboard::WindowHandle window)
    : m_ctx(std::move(ctx)), m_processName(std::move(processName)),
      m_mode(std::move(mode)), m_verbose(verbose), m_window(window) {
  if (m_mode.timers.empty())
    throw std::invalid_argument("IndependentRunner requires at least one timer");
}

void IndependentRunner::notePaused(bool paused) {
  // Several timers observe the same flip; report it once.
  if (m_pauseReported.exchange(paused) != paused) {
    m_ctx.reporter.report(
        {.kind = paused ? EventKind::Paused : EventKind::Resumed});
  }
}

RunOutcome IndependentRunner::runTimer(const Timer &timer) {
  using Clock = Control::Clock;
  process::ProcessWatcher watcher(m_ctx.processes);
  const Clock::duration period = timer.period;
  Clock::time_point next = Clock::now();
  uint32_t failures = 0;

  while (!m_ctx.control.isCancelled()) {
    if (!m_ctx.control.sleepUntil(next))
      break;

    const Clock::time_point now = Clock::now();
    next += period;
    if (next <= now) {
      const auto missed = (now - next) / period + 1;
      next += missed * period;
      KEYCADENCE_LOG_DEBUG("IndependentRunner: timer '%s' coalesced %lld "
                           "missed tick(s)",
                           timer.key.c_str(), static_cast<long long>(missed));
    }

    if (!watcher.isAlive(m_processName)) {
      m_ctx.reporter.report(
          {.kind = EventKind::ProcessExited, .detail = m_processName});
      return RunOutcome::ProcessExited;
    }

    const bool paused = m_ctx.control.isPaused();
    notePaused(paused);
    if (paused)
      continue;

    if (m_ctx.control.isCancelled())
      break;

    const keyboard::SendResult result =
        m_ctx.backend.sendKey(m_window, timer.key);
    if (result == keyboard::SendResult::Aborted)
      break;
    if (result == keyboard::SendResult::Ok) {
      failures = 0;
      if (m_verbose)
        m_ctx.reporter.report({.kind = EventKind::Emitted, .key = timer.key});
    } else {
      ++failures;
      m_ctx.reporter.report({.kind = EventKind::InjectionFailed,
                             .key = timer.key,
                             .detail = keyboard::sendResultToString(result),
                             .failures = failures});
      if (failures >= kFailureBudget) {
        m_ctx.reporter.report({.kind = EventKind::FailureBudgetExhausted,
                               .key = timer.key,
                               .failures = failures});
        return RunOutcome::FailureBudgetExhausted;
      }
    }
  }
  return RunOutcome::Cancelled;
}

RunOutcome IndependentRunner::run() {
  const size_t count = m_mode.timers.size();
  std::vector<RunOutcome> outcomes(count, RunOutcome::Cancelled);
  std::vector<std::exception_ptr> errors(count);
  std::vector<std::thread> threads;
  threads.reserve(count);

  KEYCADENCE_LOG_DEBUG("IndependentRunner: starting %zu timer(s)", count);
  auto joinAll = [&threads] {
    for (std::thread &t : threads) {
      if (t.joinable())
        t.join();
    }
  };

  try {
    for (size_t i = 0; i < count; ++i) {
      threads.emplace_back([this, i, &outcomes, &errors] {
        try {
          outcomes[i] = runTimer(m_mode.timers[i]);
        } catch (...) {
          // Rethrown on the calling thread after every timer stopped.
          errors[i] = std::current_exception();
          m_ctx.control.cancel();
        }
      });
    }
  } catch (const std::system_error &e) {
    KEYCADENCE_LOG_ERROR("IndependentRunner: cannot start timer thread: %s",
                         e.what());
    m_ctx.control.cancel();
    joinAll();
    throw;
  }
  joinAll();

  for (const std::exception_ptr &e : errors) {
    if (e)
      std::rethrow_exception(e);
  }

  RunOutcome result = RunOutcome::Completed;
  for (RunOutcome o : outcomes) {
    if (severity(o) > severity(result))
      result = o;
  }
  return result;
}

} // namespace keycadence::engine
