#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: AL_COMPILER_MSVC, AL_COMPILER_CLANG, AL_COMPILER_GCC, AL_COMPILER_MINGW, AL_COMPILER_POSIX

#if defined(_MSC_VER)
#define AL_COMPILER_MSVC
#elif defined(__clang__)
#define AL_COMPILER_CLANG
#elif defined(__GNUC__)
#define AL_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define AL_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(AL_COMPILER_CLANG) || defined(AL_COMPILER_GCC) || defined(AL_COMPILER_MINGW)
#define AL_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: AL_DEBUG, AL_RELEASE, AL_RELWITHDEBINFO, AL_ENABLE_ASSERT_IN_RELEASE
// Always defined (0 or 1): AL_ASSERT_ENABLED

#if defined(AL_DEBUG) || defined(AL_RELWITHDEBINFO) || defined(AL_ENABLE_ASSERT_IN_RELEASE)
#define AL_ASSERT_ENABLED 1
#elif defined(AL_RELEASE)
#define AL_ASSERT_ENABLED 0
#elif defined(NDEBUG)
#define AL_ASSERT_ENABLED 0
#else
// no build configuration from CMake: behave like a debug build
#define AL_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: AL_OS_WINDOWS, AL_OS_LINUX, AL_OS_APPLE, AL_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define AL_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define AL_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define AL_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define AL_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// AL_FORCE_INLINE - Force function to be inlined
#define AL_FORCE_INLINE AL_IMPL_FORCE_INLINE

// AL_COLD_FUNC - Mark function as rarely executed (error paths, assertions, reallocation)
// Usage: AL_COLD_FUNC void handle_error() { ... }
#define AL_COLD_FUNC AL_IMPL_COLD_FUNC

// AL_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Usage: AL_MACRO_JOIN(foo_, bar) -> foo_bar
// Note: Indirection ensures arguments are expanded before concatenation
#define AL_MACRO_JOIN(arg1, arg2) AL_IMPL_MACRO_JOIN(arg1, arg2)

// AL_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: AL_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define AL_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(AL_COMPILER_MSVC)

#define AL_IMPL_FORCE_INLINE __forceinline

#define AL_IMPL_COLD_FUNC

#elif defined(AL_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define AL_IMPL_FORCE_INLINE __attribute__((always_inline)) inline

#define AL_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define AL_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
