#pragma once

/// @file platform.hpp
/// @brief Platform and standard library requirements for execbridge.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__linux__)
/// @brief True when building for Linux.
#define EXECBRIDGE_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define EXECBRIDGE_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define EXECBRIDGE_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define EXECBRIDGE_PLATFORM_MACOS 0
#endif

#if !defined(_WIN32) && (defined(__unix__) || EXECBRIDGE_PLATFORM_MACOS || EXECBRIDGE_PLATFORM_LINUX)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define EXECBRIDGE_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define EXECBRIDGE_PLATFORM_POSIX 0
#endif

#if !EXECBRIDGE_PLATFORM_POSIX
#error "execbridge drives child processes through POSIX pipes and signals"
#endif

#if !defined(__cpp_lib_expected) || (__cpp_lib_expected < 202202L)
#error "execbridge requires std::expected (C++23)"
#endif
