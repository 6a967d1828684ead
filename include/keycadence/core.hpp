#pragma once
/**
 * @file core.hpp
 * @brief Library version and export macros for keycadence.
 *
 * For key names and modifier types include `<keycadence/keyboard/common.hpp>`;
 * for the scheduling engine include `<keycadence/engine/engine.hpp>`.
 */

#ifndef KEYCADENCE_VERSION
// Default version; CMake overrides these through -D flags.
#define KEYCADENCE_VERSION "0.1.0"
#define KEYCADENCE_VERSION_MAJOR 0
#define KEYCADENCE_VERSION_MINOR 1
#define KEYCADENCE_VERSION_PATCH 0
#endif

// Symbol export macro to support building shared libraries on Windows.
// CMake configures `keycadence_EXPORTS` when building the shared target and
// `KEYCADENCE_STATIC` for the static one.
#ifndef KEYCADENCE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(keycadence_EXPORTS)
#define KEYCADENCE_API __declspec(dllexport)
#elif defined(KEYCADENCE_STATIC)
#define KEYCADENCE_API
#else
#define KEYCADENCE_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) && (__GNUC__ >= 4)
#define KEYCADENCE_API __attribute__((visibility("default")))
#else
#define KEYCADENCE_API
#endif
#endif
#endif

namespace keycadence {

/**
 * @brief Convenience access to the library version string (mirrors
 * KEYCADENCE_VERSION).
 * @return const char* Null-terminated version string (statically allocated).
 */
inline const char *libraryVersion() noexcept { return KEYCADENCE_VERSION; }

} // namespace keycadence
