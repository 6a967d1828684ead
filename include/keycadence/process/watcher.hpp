#pragma once
/**
 * @file process/watcher.hpp
 * @brief Process enumeration and name-based liveness checks.
 *
 * A `ProcessSource` lists the processes of the host; it is stateless and may
 * be shared between threads. A `ProcessWatcher` keeps the table of its last
 * snapshot and is therefore owned by exactly one consumer. Runners that need
 * their own liveness checks build their own watcher over the shared source.
 *
 * @par Usage:
 * @code{.cpp}
 * auto source = keycadence::process::makeSystemProcessSource();
 * keycadence::process::ProcessWatcher watcher(source);
 * if (auto pid = watcher.findFirst("notepad")) {
 *   // ...
 * }
 * @endcode
 */

#include <keycadence/core.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keycadence::process {

/**
 * @struct ProcessInfo
 * @brief One entry of a process table.
 */
struct ProcessInfo {
  uint32_t pid{0};
  /// Executable file name without directory (e.g. "notepad.exe", "gedit").
  std::string name;
};

/**
 * @class ProcessSource
 * @brief Lists the processes currently running on the host.
 *
 * Implementations must be safe for concurrent calls.
 */
class KEYCADENCE_API ProcessSource {
public:
  virtual ~ProcessSource() = default;

  /**
   * @brief Enumerate running processes.
   * @return std::vector<ProcessInfo> Processes in OS-defined order.
   */
  virtual std::vector<ProcessInfo> list() const = 0;
};

/**
 * @brief Create the process source of the host platform.
 */
KEYCADENCE_API std::shared_ptr<ProcessSource> makeSystemProcessSource();

/**
 * @brief Case-insensitive substring test used for process names.
 * @param processName Executable name of a process.
 * @param pattern Configured process name.
 */
KEYCADENCE_API bool processNameMatches(std::string_view processName,
                                       std::string_view pattern);

/**
 * @class ProcessWatcher
 * @brief Snapshot-based process lookup by name.
 *
 * Not thread-safe: every thread keeps its own instance.
 */
class KEYCADENCE_API ProcessWatcher {
public:
  explicit ProcessWatcher(std::shared_ptr<const ProcessSource> source);

  /**
   * @brief Refresh the internal process table.
   */
  void snapshot();

  /**
   * @brief Take a fresh snapshot and return the first process whose name
   * contains @p name (case-insensitive).
   */
  std::optional<uint32_t> findFirst(std::string_view name);

  /**
   * @brief Take a fresh snapshot and report whether any process matches
   * @p name.
   */
  bool isAlive(std::string_view name);

  /**
   * @brief The table of the most recent snapshot.
   */
  [[nodiscard]] const std::vector<ProcessInfo> &table() const noexcept {
    return m_table;
  }

private:
  std::shared_ptr<const ProcessSource> m_source;
  std::vector<ProcessInfo> m_table;
};

} // namespace keycadence::process
