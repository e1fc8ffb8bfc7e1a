#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: FL_COMPILER_MSVC, FL_COMPILER_CLANG, FL_COMPILER_GCC, FL_COMPILER_MINGW, FL_COMPILER_POSIX

#if defined(_MSC_VER)
#define FL_COMPILER_MSVC
#elif defined(__clang__)
#define FL_COMPILER_CLANG
#elif defined(__GNUC__)
#define FL_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define FL_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(FL_COMPILER_CLANG) || defined(FL_COMPILER_GCC) || defined(FL_COMPILER_MINGW)
#define FL_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: FL_HAS_CPP_EXCEPTIONS
// From CMake: FL_DEBUG, FL_RELEASE, FL_RELWITHDEBINFO
// Derived: FL_ASSERT_ENABLED (0 or 1)

#ifdef FL_COMPILER_MSVC
#ifdef _CPPUNWIND
#define FL_HAS_CPP_EXCEPTIONS
#endif
#elif defined(FL_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define FL_HAS_CPP_EXCEPTIONS
#endif
#elif defined(FL_COMPILER_GCC) || defined(FL_COMPILER_MINGW)
#if __EXCEPTIONS
#define FL_HAS_CPP_EXCEPTIONS
#endif
#endif

// option::unwrap, result::expect and attempt are specified in terms of exceptions
#ifndef FL_HAS_CPP_EXCEPTIONS
#error "fallible requires C++ exceptions to be enabled"
#endif

#if defined(FL_DEBUG) || defined(FL_RELWITHDEBINFO) || defined(FL_ENABLE_ASSERT_IN_RELEASE)
#define FL_ASSERT_ENABLED 1
#elif defined(FL_RELEASE)
#define FL_ASSERT_ENABLED 0
#else
// no build mode given (e.g. consumed without our CMake): keep checks on
#define FL_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: FL_OS_LINUX
// (only needed for debugger detection, other platforms fall back to "no debugger")

#if defined(__linux__) || defined(linux)
#define FL_OS_LINUX
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// FL_FORCE_INLINE - Force function to be inlined
#define FL_FORCE_INLINE FL_IMPL_FORCE_INLINE

// FL_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: FL_COLD_FUNC void handle_error() { ... }
#define FL_COLD_FUNC FL_IMPL_COLD_FUNC

// FL_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: FL_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define FL_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(FL_COMPILER_MSVC)

#define FL_IMPL_FORCE_INLINE __forceinline
#define FL_IMPL_COLD_FUNC

#elif defined(FL_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define FL_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define FL_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
