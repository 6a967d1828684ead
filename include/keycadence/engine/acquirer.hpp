#pragma once
/**
 * @file engine/acquirer.hpp
 * @brief Bounded polling for the target process and its window.
 */

#include <keycadence/engine/config.hpp>
#include <keycadence/engine/run_context.hpp>

#include <chrono>
#include <optional>

namespace keycadence::engine {

/**
 * @class TargetAcquirer
 * @brief Finds a visible, titled window of the configured process.
 *
 * Each attempt takes a fresh process snapshot, picks the first matching
 * process and asks the backend for one of its windows. Attempts are
 * separated by a cancelable retry delay.
 */
class KEYCADENCE_API TargetAcquirer {
public:
  explicit TargetAcquirer(RunContext ctx,
                          std::chrono::milliseconds retryDelay =
                              std::chrono::milliseconds(1000));

  /**
   * @brief Poll up to `config.maxRetries` times.
   * @return std::optional<keyboard::WindowHandle> The window, or nullopt when
   * cancelled.
   * @throws keycadence::Error (ProcessNotFound) once all attempts failed.
   */
  std::optional<keyboard::WindowHandle> acquire(const Configuration &config);

private:
  RunContext m_ctx;
  std::chrono::milliseconds m_retryDelay;
};

} // namespace keycadence::engine
