#pragma once
/**
 * @file engine/duration.hpp
 * @brief Human duration strings ("250ms", "2s", "5m", "750").
 */

#include <keycadence/core.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace keycadence::engine {

/**
 * @brief Parse a duration string.
 *
 * Accepts a non-negative integer followed by an optional unit: `ms`, `s` or
 * `m`. Without a unit the value is in milliseconds. Case and surrounding
 * whitespace are ignored.
 *
 * @param text Duration text.
 * @return std::chrono::milliseconds Parsed value.
 * @throws keycadence::Error (InvalidConfiguration) for malformed, negative or
 * overflowing input.
 */
KEYCADENCE_API std::chrono::milliseconds parseDuration(std::string_view text);

/**
 * @brief Render a duration in its most compact form: `Nm` for whole minutes,
 * otherwise `Ns` for whole seconds, otherwise `Nms`.
 */
KEYCADENCE_API std::string formatDuration(std::chrono::milliseconds d);

} // namespace keycadence::engine
