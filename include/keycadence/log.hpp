#pragma once

/**
 * @file log.hpp
 * @brief Lightweight, header-only logging utility used across keycadence.
 *
 * Usage:
 *   @code{.cpp}
 *   #include <keycadence/log.hpp>
 *   KEYCADENCE_LOG_DEBUG("emitted %zu events", count);
 *   KEYCADENCE_LOG_INFO("ready");
 *   @endcode
 *
 * Runtime configuration is controlled by environment variables:
 *  - KEYCADENCE_LOG_LEVEL: one of "debug", "info", "warn", "error".
 *    Unset or unrecognized values select "info".
 *  - KEYCADENCE_FORCE_COLORS: non-empty -> force ANSI colors on.
 *  - KEYCADENCE_NO_COLOR: non-empty -> disable ANSI colors.
 *
 * The level can also be changed at runtime with `setLevel()`; the command
 * line front end does so for `--debug`.
 */

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace keycadence {
namespace log {

/**
 * @enum Level
 * @brief Logging severity levels.
 *
 * Lower enum values are more verbose (Debug is the most verbose).
 */
enum class Level : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

inline const char *levelToString(Level l) {
  switch (l) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief Parse a textual level name ("debug", "w", "3", ...).
 * @param s Level name, case-insensitive.
 * @return std::optional<Level> Parsed level or nullopt when unrecognized.
 */
inline std::optional<Level> levelFromString(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (s == "debug" || s == "d" || s == "0")
    return Level::Debug;
  if (s == "info" || s == "i" || s == "1")
    return Level::Info;
  if (s == "warn" || s == "warning" || s == "w" || s == "2")
    return Level::Warn;
  if (s == "error" || s == "e" || s == "3")
    return Level::Error;
  return std::nullopt;
}

/**
 * @brief Determine the default log level from KEYCADENCE_LOG_LEVEL.
 * @return Level The level named by the environment, or Info.
 */
inline Level parseLevelFromEnv() {
  const char *lvlEnv = std::getenv("KEYCADENCE_LOG_LEVEL");
  if (lvlEnv && lvlEnv[0] != '\0') {
    return levelFromString(lvlEnv).value_or(Level::Info);
  }
  return Level::Info;
}

/**
 * @brief Accessor for the global log level.
 *
 * The log level is stored in an atomic so it can be changed safely at runtime
 * while runner threads are logging.
 * @return std::atomic<Level>& Reference to the global atomic log level.
 */
inline std::atomic<Level> &globalLevel() {
  static std::atomic<Level> lvl(parseLevelFromEnv());
  return lvl;
}

inline void setLevel(Level l) { globalLevel().store(l); }
inline Level getLevel() { return globalLevel().load(); }

inline bool isEnabled(Level level) {
  return static_cast<int>(level) >= static_cast<int>(getLevel());
}

/**
 * @internal
 * @brief Internal mutex used to serialize access to stderr.
 */
inline std::mutex &outputMutex() {
  static std::mutex m;
  return m;
}

/**
 * @internal
 * @brief Return an ANSI color escape sequence for the given log level.
 */
inline const char *levelColor(Level l) {
  switch (l) {
  case Level::Debug:
    return "\x1b[33m"; // Yellow
  case Level::Info:
    return "\x1b[34m"; // Blue
  case Level::Warn:
    return "\x1b[38;5;208m"; // Orange (256-color)
  case Level::Error:
    return "\x1b[31m"; // Red
  default:
    return "\x1b[0m";
  }
}

/**
 * @internal
 * @brief Determine whether ANSI colors should be emitted.
 *
 * Colors can be forced via KEYCADENCE_FORCE_COLORS or disabled with
 * KEYCADENCE_NO_COLOR. Otherwise colors are enabled when stderr is a TTY.
 */
inline bool colorsEnabled() {
  const char *force = std::getenv("KEYCADENCE_FORCE_COLORS");
  if (force && force[0] != '\0')
    return true;
  const char *no = std::getenv("KEYCADENCE_NO_COLOR");
  if (no && no[0] != '\0')
    return false;
#if defined(_WIN32) || defined(_WIN64)
  return _isatty(_fileno(stderr));
#else
  return isatty(fileno(stderr));
#endif
}

/**
 * @internal
 * @brief Trim a source path so it starts at the last "src" or "include"
 * component, or at the basename when neither is present.
 */
inline const char *trimSourcePath(const char *path) {
  if (!path)
    return path;
  const char *last = nullptr;
  for (const char *needle : {"src", "include", "tests", "cli"}) {
    const size_t needle_len = std::strlen(needle);
    const char *p = path;
    while (true) {
      const char *found = std::strstr(p, needle);
      if (!found)
        break;
      const char *after = found + needle_len;
      const bool atBoundary =
          found == path || found[-1] == '/' || found[-1] == '\\';
      if (atBoundary && (*after == '/' || *after == '\\') &&
          (!last || found > last))
        last = found;
      p = found + 1;
    }
  }
  if (last)
    return last;
  const char *last_slash = std::strrchr(path, '/');
  const char *last_backslash = std::strrchr(path, '\\');
  const char *base = path;
  if (last_slash && last_backslash)
    base = (last_slash > last_backslash) ? last_slash + 1 : last_backslash + 1;
  else if (last_slash)
    base = last_slash + 1;
  else if (last_backslash)
    base = last_backslash + 1;
  return base;
}

/**
 * @internal
 * @brief Emit a formatted log message using a va_list (thread-safe).
 *
 * Produces a timestamp (local time, millisecond precision), level name,
 * and source file/line prefix before the formatted message body.
 */
inline void vlog(Level level, const char *file, int line, const char *fmt,
                 va_list ap) {
  if (!isEnabled(level))
    return;

  using namespace std::chrono;
  auto now = system_clock::now();
  auto ms =
      duration_cast<milliseconds>(now.time_since_epoch()) % milliseconds(1000);
  std::time_t t = system_clock::to_time_t(now);

  std::tm tmbuf;
#if defined(_MSC_VER) || defined(_WIN32)
  localtime_s(&tmbuf, &t);
#else
  localtime_r(&t, &tmbuf);
#endif

  char timebuf[64];
  if (std::strftime(timebuf, sizeof(timebuf), "%Y-%m-%d %H:%M:%S", &tmbuf) ==
      0) {
    std::snprintf(timebuf, sizeof(timebuf), "%lld", static_cast<long long>(t));
  }

  // Runner threads log concurrently; keep lines whole.
  std::lock_guard<std::mutex> lk(outputMutex());

  const bool use_colors = colorsEnabled();
  const char *reset = use_colors ? "\x1b[0m" : "";
  const char *file_color = use_colors ? "\x1b[90m" : "";
  const char *lvl_color = use_colors ? levelColor(level) : "";

  const char *trimmed = trimSourcePath(file);

  std::fprintf(stderr, "[keycadence] %s.%03d [", timebuf,
               static_cast<int>(ms.count()));
  if (use_colors)
    std::fputs(lvl_color, stderr);
  std::fprintf(stderr, "%s", levelToString(level));
  if (use_colors)
    std::fputs(reset, stderr);
  std::fprintf(stderr, "] ");
  if (use_colors)
    std::fputs(file_color, stderr);
  std::fprintf(stderr, "%s:%d: ", trimmed, line);
  if (use_colors)
    std::fputs(reset, stderr);

  std::vfprintf(stderr, fmt, ap);

  std::fprintf(stderr, "\n");
  std::fflush(stderr);
}

/**
 * @brief Log a message with varargs.
 *
 * Convenience wrapper around `vlog` that accepts printf-style variadic
 * arguments. Checks the log level before formatting.
 */
inline void log(Level level, const char *file, int line, const char *fmt, ...) {
  if (!isEnabled(level))
    return;
  va_list ap;
  va_start(ap, fmt);
  vlog(level, file, line, fmt, ap);
  va_end(ap);
}

inline bool debugEnabled() { return isEnabled(Level::Debug); }

} // namespace log
} // namespace keycadence

/**
 * @defgroup LoggingMacros Helper logging macros
 * @brief Convenience macros that include file and line automatically.
 * @{
 */
#define KEYCADENCE_LOG_DEBUG(fmt, ...)                                         \
  ::keycadence::log::log(::keycadence::log::Level::Debug, __FILE__, __LINE__,  \
                         fmt, ##__VA_ARGS__)
#define KEYCADENCE_LOG_INFO(fmt, ...)                                          \
  ::keycadence::log::log(::keycadence::log::Level::Info, __FILE__, __LINE__,   \
                         fmt, ##__VA_ARGS__)
#define KEYCADENCE_LOG_WARN(fmt, ...)                                          \
  ::keycadence::log::log(::keycadence::log::Level::Warn, __FILE__, __LINE__,   \
                         fmt, ##__VA_ARGS__)
#define KEYCADENCE_LOG_ERROR(fmt, ...)                                         \
  ::keycadence::log::log(::keycadence::log::Level::Error, __FILE__, __LINE__,  \
                         fmt, ##__VA_ARGS__)
/** @} */ /* end of LoggingMacros */
