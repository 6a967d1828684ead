/**
 * @file engine/engine.cpp
 */

#include <keycadence/engine/engine.hpp>

#include <keycadence/error.hpp>
#include <keycadence/log.hpp>

#include <type_traits>
#include <variant>

namespace keycadence::engine {

const char *runOutcomeToString(RunOutcome outcome) {
  switch (outcome) {
  case RunOutcome::Completed:
    return "Completed";
  case RunOutcome::Cancelled:
    return "Cancelled";
  case RunOutcome::ProcessExited:
    return "ProcessExited";
  case RunOutcome::FailureBudgetExhausted:
    return "FailureBudgetExhausted";
  default:
    return "Unknown";
  }
}

namespace {

// Ties the backend's abort check to the run's Control for one run.
class AbortCheckScope {
public:
  AbortCheckScope(keyboard::InputBackend &backend, const Control &control)
      : m_backend(backend) {
    m_backend.setAbortCheck([&control] { return control.isCancelled(); });
  }
  ~AbortCheckScope() { m_backend.setAbortCheck({}); }

  AbortCheckScope(const AbortCheckScope &) = delete;
  AbortCheckScope &operator=(const AbortCheckScope &) = delete;

private:
  keyboard::InputBackend &m_backend;
};

} // namespace

Engine::Engine(RunContext ctx) : m_ctx(std::move(ctx)) {}

RunOutcome Engine::run(const Configuration &config) {
  m_ctx.reporter.report(
      {.kind = EventKind::Started, .detail = config.processName});

  std::optional<keyboard::WindowHandle> window;
  try {
    window = TargetAcquirer(m_ctx, m_retryDelay).acquire(config);
  } catch (const Error &e) {
    m_ctx.reporter.report({.kind = EventKind::Exiting, .detail = e.what()});
    throw;
  }

  if (!window) {
    m_ctx.reporter.report(
        {.kind = EventKind::Exiting, .detail = "cancelled during acquisition"});
    return RunOutcome::Cancelled;
  }
  m_ctx.reporter.report({.kind = EventKind::Acquired, .window = *window});

  const AbortCheckScope abortScope(m_ctx.backend, m_ctx.control);

  const RunOutcome outcome = std::visit(
      [&](const auto &mode) -> RunOutcome {
        using ModeT = std::decay_t<decltype(mode)>;
        if constexpr (std::is_same_v<ModeT, SequentialMode>) {
          return SequentialRunner(m_ctx, config.processName, mode,
                                  config.verbose, *window)
              .run();
        } else {
          return IndependentRunner(m_ctx, config.processName, mode,
                                   config.verbose, *window)
              .run();
        }
      },
      config.mode);

  KEYCADENCE_LOG_INFO("Engine: run finished (%s)", runOutcomeToString(outcome));
  m_ctx.reporter.report(
      {.kind = EventKind::Exiting, .detail = runOutcomeToString(outcome)});
  return outcome;
}

} // namespace keycadence::engine
