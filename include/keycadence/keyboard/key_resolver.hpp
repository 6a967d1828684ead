#pragma once
/**
 * @file keyboard/key_resolver.hpp
 * @brief Resolution of human key names and combinations to logical keys.
 *
 * @par Usage:
 * @code{.cpp}
 * keycadence::keyboard::KeyResolver resolver;
 * auto combo = resolver.parseCombo("ctrl+shift+s");
 * // combo.modifiers == {CtrlLeft, ShiftLeft}, combo.primary == S
 * @endcode
 */

#include <keycadence/error.hpp>
#include <keycadence/keyboard/common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keycadence::keyboard {

/**
 * @class KeyResolver
 * @brief Stateless (after construction) mapping from key names to `Key`.
 *
 * The resolution table is built once in the constructor; afterwards every
 * member is const and the resolver may be shared between threads.
 */
class KEYCADENCE_API KeyResolver {
public:
  KeyResolver();

  /**
   * @brief Resolve one token (no '+') to a key.
   * @param name Token, case-insensitive, surrounding whitespace ignored.
   * @return std::optional<Key> The key, or nullopt for an unsupported name.
   */
  [[nodiscard]] std::optional<Key> resolve(std::string_view name) const;

  /**
   * @brief Split a name on '+' into modifiers and a primary key.
   *
   * Every token but the last must be a modifier and the last must be a
   * non-modifier; a repeated modifier is kept once, at its first position. A single token may be any key, modifiers included.
   *
   * @throws Error with ErrorKind::UnsupportedKey for an unknown token and
   *         ErrorKind::InvalidCombination for a malformed combination.
   */
  [[nodiscard]] KeyCombo parseCombo(std::string_view name) const;

  /**
   * @brief Non-throwing variant of `parseCombo`.
   * @param name Key name to parse.
   * @param reason Receives the error kind on failure when non-null.
   * @return std::optional<KeyCombo> Parsed combination or nullopt.
   */
  [[nodiscard]] std::optional<KeyCombo>
  tryParseCombo(std::string_view name, ErrorKind *reason = nullptr) const;

  /**
   * @brief Fail fast on a key name at configuration time.
   * @throws Error exactly as `parseCombo` does.
   */
  void validate(std::string_view name) const;

private:
  std::unordered_map<std::string, Key> m_table;
};

} // namespace keycadence::keyboard
