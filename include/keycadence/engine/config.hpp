#pragma once
/**
 * @file engine/config.hpp
 * @brief Settings file model and the validated, immutable run configuration.
 *
 * `Settings` mirrors the JSON file and the command line; it may be incomplete
 * or contradictory. `validate()` turns it into a `Configuration`, which the
 * engine consumes and never modifies.
 *
 * @par File format:
 * @code{.json}
 * {
 *   "process_name": "notepad",
 *   "key_sequence": [ { "key": "r", "interval_after": "1s" } ],
 *   "independent_keys": [],
 *   "max_retries": 10,
 *   "pause_hotkey": "ctrl+alt+r",
 *   "verbose": false,
 *   "loop_sequence": true,
 *   "repeat_count": 0
 * }
 * @endcode
 */

#include <keycadence/core.hpp>
#include <keycadence/keyboard/key_resolver.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keycadence::engine {

/// One `key_sequence` entry as written in the settings.
struct SequenceEntry {
  std::string key;
  std::chrono::milliseconds intervalAfter{1000};

  bool operator==(const SequenceEntry &) const = default;
};

/// One `independent_keys` entry as written in the settings.
struct IndependentEntry {
  std::string key;
  std::chrono::milliseconds interval{1000};

  bool operator==(const IndependentEntry &) const = default;
};

/**
 * @struct Settings
 * @brief Mutable mirror of the settings file.
 */
struct Settings {
  std::string processName;
  std::vector<SequenceEntry> keySequence;
  std::vector<IndependentEntry> independentKeys;
  uint32_t maxRetries{10};
  /// Empty means "no pause hotkey".
  std::string pauseHotkey{"ctrl+alt+r"};
  bool verbose{false};
  bool loopSequence{true};
  uint32_t repeatCount{0};

  bool operator==(const Settings &) const = default;
};

/**
 * @brief Parse settings from JSON text.
 * @throws keycadence::Error (InvalidConfiguration) on malformed JSON, wrong
 * field types or bad durations.
 */
KEYCADENCE_API Settings parseSettings(std::string_view jsonText);

/**
 * @brief Serialize settings: fixed field order, 2-space indentation, compact
 * durations, trailing newline.
 */
KEYCADENCE_API std::string serializeSettings(const Settings &settings);

/**
 * @brief Read and parse a settings file.
 * @throws keycadence::Error (InvalidConfiguration) when the file cannot be
 * read or parsed.
 */
KEYCADENCE_API Settings loadSettings(const std::filesystem::path &path);

/**
 * @brief Write `serializeSettings(settings)` to @p path.
 * @throws keycadence::Error (InvalidConfiguration) when the file cannot be
 * written.
 */
KEYCADENCE_API void saveSettings(const Settings &settings,
                                 const std::filesystem::path &path);

/// One step of a sequential run.
struct Step {
  std::string key;
  std::chrono::milliseconds pauseAfter{0};

  bool operator==(const Step &) const = default;
};

/// One periodic timer of an independent run.
struct Timer {
  std::string key;
  std::chrono::milliseconds period{0};

  bool operator==(const Timer &) const = default;
};

/**
 * @struct SequentialMode
 * @brief Keys pressed one after another, each followed by its pause.
 */
struct SequentialMode {
  std::vector<Step> steps;
  /// When false the run stops after one pass.
  bool loopForever{true};
  /// Zero means unbounded; otherwise the number of passes to run.
  uint32_t repeatCount{0};
};

/**
 * @struct IndependentMode
 * @brief Keys each driven by their own periodic timer.
 */
struct IndependentMode {
  std::vector<Timer> timers;
};

using Mode = std::variant<SequentialMode, IndependentMode>;

/**
 * @struct Configuration
 * @brief Validated run configuration. Never modified once built.
 */
struct Configuration {
  std::string processName;
  Mode mode;
  uint32_t maxRetries{10};
  bool verbose{false};
  std::string pauseHotkey;
};

/**
 * @brief Validate settings and build the run configuration.
 *
 * Checks, in order: process name, retry count, presence of keys, mode
 * exclusivity, key names, durations, pause hotkey.
 *
 * @throws keycadence::Error (InvalidConfiguration) describing the first
 * problem found.
 */
KEYCADENCE_API Configuration validate(const Settings &settings,
                                      const keyboard::KeyResolver &resolver);

/**
 * @brief Multi-line human summary of a configuration, printed at startup.
 */
KEYCADENCE_API std::string describe(const Configuration &config);

} // namespace keycadence::engine
