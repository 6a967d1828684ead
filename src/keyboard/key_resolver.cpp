/**
 * @file keyboard/key_resolver.cpp
 * @brief Key name and combination parsing.
 */

#include <keycadence/keyboard/key_resolver.hpp>
#include <keycadence/log.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace keycadence::keyboard {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

std::string toLower(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

std::vector<std::string_view> splitOnPlus(std::string_view s) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t pos = s.find('+', start);
    if (pos == std::string_view::npos) {
      parts.push_back(trim(s.substr(start)));
      break;
    }
    parts.push_back(trim(s.substr(start, pos - start)));
    start = pos + 1;
  }
  return parts;
}

} // namespace

KeyResolver::KeyResolver() {
  // Canonical names of every logical key, then the documented aliases.
  for (unsigned v = 1; v <= 255u; ++v) {
    const Key key = static_cast<Key>(v);
    const std::string name = keyToString(key);
    if (name == "Unknown")
      continue;
    m_table.emplace(toLower(name), key);
  }
  for (const char *alias : {"return", "esc", "control"}) {
    m_table.emplace(alias, stringToKey(alias));
  }
  KEYCADENCE_LOG_DEBUG("KeyResolver: table built with %zu names",
                       m_table.size());
}

std::optional<Key> KeyResolver::resolve(std::string_view name) const {
  auto it = m_table.find(toLower(trim(name)));
  if (it == m_table.end())
    return std::nullopt;
  return it->second;
}

std::optional<KeyCombo> KeyResolver::tryParseCombo(std::string_view name,
                                                   ErrorKind *reason) const {
  auto fail = [reason](ErrorKind kind) -> std::optional<KeyCombo> {
    if (reason)
      *reason = kind;
    return std::nullopt;
  };

  const std::vector<std::string_view> tokens = splitOnPlus(name);
  if (std::ranges::any_of(tokens,
                          [](std::string_view t) { return t.empty(); })) {
    return fail(tokens.size() == 1 ? ErrorKind::UnsupportedKey
                                   : ErrorKind::InvalidCombination);
  }

  std::vector<Key> keys;
  keys.reserve(tokens.size());
  for (std::string_view token : tokens) {
    auto key = resolve(token);
    if (!key)
      return fail(ErrorKind::UnsupportedKey);
    keys.push_back(*key);
  }

  KeyCombo combo;
  combo.primary = keys.back();
  if (keys.size() == 1)
    return combo;

  if (isModifierKey(combo.primary))
    return fail(ErrorKind::InvalidCombination);

  Modifier seen = Modifier::None;
  for (size_t i = 0; i + 1 < keys.size(); ++i) {
    const Modifier mod = modifierForKey(keys[i]);
    if (mod == Modifier::None)
      return fail(ErrorKind::InvalidCombination);
    // A repeated modifier is held once.
    if (hasModifier(seen, mod))
      continue;
    seen |= mod;
    combo.modifiers.push_back(keys[i]);
  }
  return combo;
}

KeyCombo KeyResolver::parseCombo(std::string_view name) const {
  ErrorKind reason = ErrorKind::UnsupportedKey;
  auto combo = tryParseCombo(name, &reason);
  if (!combo) {
    if (reason == ErrorKind::InvalidCombination) {
      throw Error(reason,
                  "Invalid key combination '" + std::string(name) +
                      "': expected modifier+...+key with modifiers from "
                      "ctrl, shift, alt");
    }
    throw Error(reason, "Unsupported key: '" + std::string(name) + "'");
  }
  return *combo;
}

void KeyResolver::validate(std::string_view name) const {
  (void)parseCombo(name);
}

} // namespace keycadence::keyboard
