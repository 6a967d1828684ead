/**
 * @file engine/duration.cpp
 * @brief Duration parsing and compact formatting.
 */

#include <keycadence/engine/duration.hpp>

#include <keycadence/error.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace keycadence::engine {

namespace {

std::string normalized(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

[[noreturn]] void invalid(std::string_view text, const char *why) {
  throw Error(ErrorKind::InvalidConfiguration,
              "Invalid duration '" + std::string(text) + "': " + why);
}

} // namespace

std::chrono::milliseconds parseDuration(std::string_view text) {
  const std::string s = normalized(text);
  if (s.empty())
    invalid(text, "empty value");
  if (s.front() == '-')
    invalid(text, "durations cannot be negative");

  std::string_view digits = s;
  int64_t scale = 1;
  if (digits.ends_with("ms")) {
    digits.remove_suffix(2);
  } else if (digits.ends_with("s")) {
    digits.remove_suffix(1);
    scale = 1000;
  } else if (digits.ends_with("m")) {
    digits.remove_suffix(1);
    scale = 60 * 1000;
  }

  // "5 s" is accepted the same way as "5s".
  while (!digits.empty() &&
         std::isspace(static_cast<unsigned char>(digits.back())))
    digits.remove_suffix(1);

  if (digits.empty())
    invalid(text, "missing number");

  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  int64_t value = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      invalid(text, "expected <number>[ms|s|m]");
    const int64_t digit = c - '0';
    if (value > (kMax - digit) / 10)
      invalid(text, "value too large");
    value = value * 10 + digit;
  }
  if (value > kMax / scale)
    invalid(text, "value too large");

  return std::chrono::milliseconds(value * scale);
}

std::string formatDuration(std::chrono::milliseconds d) {
  const auto ms = d.count();
  if (ms != 0 && ms % 60000 == 0)
    return std::to_string(ms / 60000) + "m";
  if (ms != 0 && ms % 1000 == 0)
    return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

} // namespace keycadence::engine
