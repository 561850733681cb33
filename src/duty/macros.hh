#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: DUTY_COMPILER_MSVC, DUTY_COMPILER_CLANG, DUTY_COMPILER_GCC, DUTY_COMPILER_MINGW,
//                        DUTY_COMPILER_POSIX

#if defined(_MSC_VER)
#define DUTY_COMPILER_MSVC
#elif defined(__clang__)
#define DUTY_COMPILER_CLANG
#elif defined(__GNUC__)
#define DUTY_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define DUTY_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(DUTY_COMPILER_CLANG) || defined(DUTY_COMPILER_GCC) || defined(DUTY_COMPILER_MINGW)
#define DUTY_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: DUTY_OS_WINDOWS, DUTY_OS_LINUX, DUTY_OS_APPLE, DUTY_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define DUTY_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define DUTY_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define DUTY_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define DUTY_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: DUTY_DEBUG, DUTY_RELEASE, DUTY_RELWITHDEBINFO
// Optional:   DUTY_ENABLE_ASSERT_IN_RELEASE
// Always defined: DUTY_ASSERT_ENABLED (0 or 1)
//
// Assertions are active unless this is a release build.
// Builds that define none of the modes (e.g. consumed without our CMake) count as checked builds.

#if defined(DUTY_RELEASE) && !defined(DUTY_ENABLE_ASSERT_IN_RELEASE)
#define DUTY_ASSERT_ENABLED 0
#else
#define DUTY_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// DUTY_FORCE_INLINE - Force function to be inlined
#define DUTY_FORCE_INLINE DUTY_IMPL_FORCE_INLINE

// DUTY_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: DUTY_COLD_FUNC void handle_error() { ... }
#define DUTY_COLD_FUNC DUTY_IMPL_COLD_FUNC

// DUTY_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: DUTY_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define DUTY_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(DUTY_COMPILER_MSVC)

#define DUTY_IMPL_FORCE_INLINE __forceinline
#define DUTY_IMPL_COLD_FUNC

#elif defined(DUTY_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define DUTY_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define DUTY_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
