/**
 * @file engine/acquirer.cpp
 */

#include <keycadence/engine/acquirer.hpp>

#include <keycadence/error.hpp>
#include <keycadence/log.hpp>

namespace keycadence::engine {

TargetAcquirer::TargetAcquirer(RunContext ctx,
                               std::chrono::milliseconds retryDelay)
    : m_ctx(std::move(ctx)), m_retryDelay(retryDelay) {}

std::optional<keyboard::WindowHandle>
TargetAcquirer::acquire(const Configuration &config) {
  process::ProcessWatcher watcher(m_ctx.processes);

  for (uint32_t attempt = 1; attempt <= config.maxRetries; ++attempt) {
    if (m_ctx.control.isCancelled())
      return std::nullopt;

    m_ctx.reporter.report({.kind = EventKind::AcquireAttempt,
                           .attempt = attempt,
                           .maxAttempts = config.maxRetries});

    if (auto pid = watcher.findFirst(config.processName)) {
      if (auto window = m_ctx.backend.findWindowForProcess(*pid))
        return window;
      KEYCADENCE_LOG_DEBUG("Acquirer: process %u has no visible titled "
                           "window yet",
                           *pid);
    }

    if (attempt < config.maxRetries && !m_ctx.control.sleepFor(m_retryDelay))
      return std::nullopt;
  }

  throw Error(ErrorKind::ProcessNotFound,
              "Process '" + config.processName +
                  "' with a visible window not found after " +
                  std::to_string(config.maxRetries) + " attempt" +
                  (config.maxRetries == 1 ? "" : "s"));
}

} // namespace keycadence::engine
