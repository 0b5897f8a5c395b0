#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: LK_COMPILER_MSVC, LK_COMPILER_CLANG, LK_COMPILER_GCC, LK_COMPILER_POSIX

#if defined(_MSC_VER)
#define LK_COMPILER_MSVC
#elif defined(__clang__)
#define LK_COMPILER_CLANG
#elif defined(__GNUC__)
#define LK_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(LK_COMPILER_CLANG) || defined(LK_COMPILER_GCC)
#define LK_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: LK_OS_WINDOWS, LK_OS_LINUX, LK_OS_APPLE, LK_OS_BSD
// The OS decides which entropy source lk::secure_rng reads from.

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define LK_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define LK_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define LK_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define LK_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: LK_DEBUG, LK_RELEASE, LK_RELWITHDEBINFO, LK_ASSERT_ENABLED

#ifndef LK_ASSERT_ENABLED
#if defined(LK_DEBUG) || defined(LK_RELWITHDEBINFO) || defined(LK_ENABLE_ASSERT_IN_RELEASE)
#define LK_ASSERT_ENABLED 1
#else
#define LK_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// LK_FORCE_INLINE - Force function to be inlined
#define LK_FORCE_INLINE LK_IMPL_FORCE_INLINE

// LK_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
#define LK_COLD_FUNC LK_IMPL_COLD_FUNC

// LK_UNUSED(expr) - Suppress unused warnings without evaluating expr
#define LK_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(LK_COMPILER_MSVC)

#define LK_IMPL_FORCE_INLINE __forceinline
#define LK_IMPL_COLD_FUNC

#else

// additional 'inline' is required on gcc and makes no difference on clang
#define LK_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define LK_IMPL_COLD_FUNC __attribute__((cold))

#endif
