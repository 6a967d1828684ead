#pragma once
/**
 * @file cli/options.hpp
 * @brief Command line parsing for the keycadence executable.
 *
 * Options only override settings that were given explicitly; everything else
 * keeps the value loaded from the settings file (or the default).
 */

#include <keycadence/core.hpp>
#include <keycadence/engine/config.hpp>
#include <keycadence/engine/run_context.hpp>
#include <keycadence/error.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keycadence::cli {

/// Process exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitInvalidConfiguration = 1;
inline constexpr int kExitProcessNotFound = 2;
inline constexpr int kExitFailureBudget = 3;

/**
 * @struct Options
 * @brief Parsed command line. Unset optionals were not given.
 */
struct Options {
  std::optional<std::string> process;
  std::optional<std::string> key;
  std::optional<std::chrono::milliseconds> interval;
  std::optional<std::string> sequence;
  std::optional<std::string> independentKeys;
  std::optional<uint32_t> maxRetries;
  std::optional<std::string> pauseHotkey;
  bool verbose{false};
  std::optional<std::string> configPath;
  std::optional<std::string> saveConfigPath;
  std::optional<bool> loopSequence;
  std::optional<uint32_t> repeatCount;
  bool debug{false};
  bool help{false};
  bool version{false};
};

/**
 * @brief Parse `argv`.
 *
 * Both `--flag value` and `--flag=value` are accepted for long options.
 *
 * @throws keycadence::Error (InvalidConfiguration) for unknown flags, missing
 * or malformed values, and conflicting mode flags.
 */
KEYCADENCE_API Options parseArguments(int argc, const char *const *argv);

/**
 * @brief Parse `key:dur,key:dur,...`. A missing `:dur` means 1000 ms.
 */
KEYCADENCE_API std::vector<engine::SequenceEntry>
parseSequenceList(std::string_view text);

/**
 * @brief Parse `key:dur;key:dur;...`. A missing `:dur` means 1000 ms.
 */
KEYCADENCE_API std::vector<engine::IndependentEntry>
parseIndependentList(std::string_view text);

/**
 * @brief Apply the given options on top of @p base.
 *
 * A mode option (`--key`, `--sequence`, `--independent-keys`) replaces both
 * key lists of @p base.
 */
KEYCADENCE_API engine::Settings mergeSettings(const Options &options,
                                              engine::Settings base);

KEYCADENCE_API std::string usage();

/// Text printed before every run.
KEYCADENCE_API std::string banner();

KEYCADENCE_API int exitCodeFor(engine::RunOutcome outcome);
KEYCADENCE_API int exitCodeFor(ErrorKind kind);

} // namespace keycadence::cli
