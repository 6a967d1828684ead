/**
 * @file engine/reporter.cpp
 */

#include <keycadence/engine/reporter.hpp>

#include <keycadence/log.hpp>

#include <cstdio>

namespace keycadence::engine {

const char *eventKindToString(EventKind kind) {
  switch (kind) {
  case EventKind::Started:
    return "Started";
  case EventKind::AcquireAttempt:
    return "AcquireAttempt";
  case EventKind::Acquired:
    return "Acquired";
  case EventKind::Emitted:
    return "Emitted";
  case EventKind::InjectionFailed:
    return "InjectionFailed";
  case EventKind::Paused:
    return "Paused";
  case EventKind::Resumed:
    return "Resumed";
  case EventKind::PassCompleted:
    return "PassCompleted";
  case EventKind::ProcessExited:
    return "ProcessExited";
  case EventKind::FailureBudgetExhausted:
    return "FailureBudgetExhausted";
  case EventKind::Exiting:
    return "Exiting";
  default:
    return "Unknown";
  }
}

std::string ConsoleReporter::format(const Event &e) {
  char window[64];
  switch (e.kind) {
  case EventKind::Started:
    return "Looking for process '" + e.detail + "'...";
  case EventKind::AcquireAttempt:
    return "Searching for target window (attempt " + std::to_string(e.attempt) +
           "/" + std::to_string(e.maxAttempts) + ")";
  case EventKind::Acquired:
    std::snprintf(window, sizeof(window), "0x%llx",
                  static_cast<unsigned long long>(e.window.id));
    return std::string("Found target window ") + window + " (pid " +
           std::to_string(e.window.pid) + ")";
  case EventKind::Emitted:
    if (e.stepCount > 0)
      return "Sent '" + e.key + "' [step " + std::to_string(e.stepIndex + 1) +
             "/" + std::to_string(e.stepCount) + "]";
    return "Sent '" + e.key + "'";
  case EventKind::InjectionFailed:
    return "Failed to send '" + e.key + "' (" + e.detail + "), " +
           std::to_string(e.failures) + " consecutive failure" +
           (e.failures == 1 ? "" : "s");
  case EventKind::Paused:
    return "Paused";
  case EventKind::Resumed:
    return "Resumed";
  case EventKind::PassCompleted:
    return "Completed cycle " + std::to_string(e.passes) + " of sequence";
  case EventKind::ProcessExited:
    return "Target process has been closed";
  case EventKind::FailureBudgetExhausted:
    return "Giving up on '" + e.key + "' after " + std::to_string(e.failures) +
           " consecutive failures";
  case EventKind::Exiting:
    return "Exiting: " + e.detail;
  default:
    return eventKindToString(e.kind);
  }
}

void ConsoleReporter::report(const Event &event) {
  const std::string line = format(event);
  std::lock_guard<std::mutex> lock(m_mutex);
  m_out << line << std::endl;
}

void LogReporter::report(const Event &e) {
  const std::string line = ConsoleReporter::format(e);
  switch (e.kind) {
  case EventKind::Emitted:
  case EventKind::AcquireAttempt:
    KEYCADENCE_LOG_DEBUG("%s", line.c_str());
    break;
  case EventKind::InjectionFailed:
    KEYCADENCE_LOG_WARN("%s", line.c_str());
    break;
  case EventKind::FailureBudgetExhausted:
    KEYCADENCE_LOG_ERROR("%s", line.c_str());
    break;
  default:
    KEYCADENCE_LOG_INFO("%s", line.c_str());
    break;
  }
}

} // namespace keycadence::engine
