#pragma once
/**
 * @file engine/reporter.hpp
 * @brief Structured progress events and their sinks.
 */

#include <keycadence/core.hpp>
#include <keycadence/keyboard/backend.hpp>

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace keycadence::engine {

enum class EventKind : uint8_t {
  Started,
  AcquireAttempt,
  Acquired,
  Emitted,
  InjectionFailed,
  Paused,
  Resumed,
  PassCompleted,
  ProcessExited,
  FailureBudgetExhausted,
  Exiting,
};

KEYCADENCE_API const char *eventKindToString(EventKind kind);

/**
 * @struct Event
 * @brief One progress notification. Fields that do not apply to a kind keep
 * their default values.
 */
struct Event {
  EventKind kind{EventKind::Started};
  /// Key name for Emitted, InjectionFailed and FailureBudgetExhausted.
  std::string key;
  /// Process name for Started/ProcessExited, reason for Exiting and
  /// InjectionFailed.
  std::string detail;
  /// AcquireAttempt: 1-based attempt and the attempt budget.
  uint32_t attempt{0};
  uint32_t maxAttempts{0};
  /// Emitted in sequential mode: 0-based step index and step count.
  size_t stepIndex{0};
  size_t stepCount{0};
  /// PassCompleted: number of passes completed so far.
  uint64_t passes{0};
  /// InjectionFailed and FailureBudgetExhausted: consecutive failures.
  uint32_t failures{0};
  /// Acquired: the target window.
  keyboard::WindowHandle window{};
};

/**
 * @class Reporter
 * @brief Receives progress events. Must accept calls from several threads.
 */
class KEYCADENCE_API Reporter {
public:
  virtual ~Reporter() = default;
  virtual void report(const Event &event) = 0;
};

/**
 * @class LogReporter
 * @brief Forwards events to the keycadence logger.
 */
class KEYCADENCE_API LogReporter final : public Reporter {
public:
  void report(const Event &event) override;
};

/**
 * @class ConsoleReporter
 * @brief Prints one user-facing line per event to a stream.
 */
class KEYCADENCE_API ConsoleReporter final : public Reporter {
public:
  explicit ConsoleReporter(std::ostream &out) : m_out(out) {}
  void report(const Event &event) override;

  /**
   * @brief The line printed for @p event (without newline).
   */
  static std::string format(const Event &event);

private:
  std::ostream &m_out;
  std::mutex m_mutex;
};

} // namespace keycadence::engine
