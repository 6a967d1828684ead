#pragma once
/**
 * @file error.hpp
 * @brief Error kinds and the exception type thrown by keycadence.
 *
 * Configuration, acquisition and file errors propagate as `Error`. Failures
 * of a single keystroke never throw; they are reported through
 * `keyboard::SendResult` and absorbed by the runners.
 */

#include <keycadence/core.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace keycadence {

/**
 * @enum ErrorKind
 * @brief Classification of everything that can stop or disturb a run.
 */
enum class ErrorKind : uint8_t {
  InvalidConfiguration,
  ProcessNotFound,
  WindowNotFound,
  UnsupportedKey,
  InvalidCombination,
  InjectionFailed,
  ProcessExited,
  Cancelled,
};

/**
 * @brief Stable name of an error kind (e.g. "ProcessNotFound").
 */
KEYCADENCE_API const char *errorKindToString(ErrorKind kind);

/**
 * @class Error
 * @brief Exception carrying an `ErrorKind` alongside a human message.
 */
class KEYCADENCE_API Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message);

  [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
  ErrorKind m_kind;
};

} // namespace keycadence
