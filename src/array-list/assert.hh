#pragma once

// Lean header with minimal dependencies, included by every container header.
#include <array-list/macros.hh>
#include <array-list/source_location.hh>

// =========================================================================================================
// AL_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Enabled in AL_DEBUG and AL_RELWITHDEBINFO builds.
//   In AL_RELEASE builds, assertions are disabled unless AL_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS of the unchecked API
//   (operator[], front(), back(), allocation ranges, growth policy factors).
//
// What assertions are NOT for:
//   - NOT for out-of-range indices passed to the checked list API (get/set/insert/remove/swap),
//     those are silent no-ops or empty optionals by contract
//   - NOT for allocation failure, which throws al::allocation_failure
//
// Error handling strategy:
//   - Assertions             -> programmer errors, violated invariants/preconditions
//   - Exceptions             -> resource exhaustion (al::allocation_failure)
//   - optional / bool / -1   -> expected outcomes (missing element, ignored index)
//
// Usage:
//   AL_ASSERT(ptr != nullptr, "pointer must not be null");
//   AL_ASSERT(0 <= idx && idx < size(), "index out of bounds");
//
#define AL_ASSERT(cond, msg) AL_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// AL_ASSERT_ALWAYS - Always-active assertion
//
// Like AL_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   AL_ASSERT_ALWAYS(policy.growth_factor >= 1, "growth factor must not shrink the buffer");
//
#define AL_ASSERT_ALWAYS(cond, msg) AL_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// AL_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define AL_DEBUG_BREAK() AL_IMPL_DEBUG_BREAK()

// =========================================================================================================
// AL_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by AL_ASSERT after the assertion handlers ran.
//
#define AL_BREAK_AND_ABORT() (AL_DEBUG_BREAK(), ::al::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace al::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr if none is installed)
// Note: does not abort, caller must follow with AL_BREAK_AND_ABORT()
AL_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, al::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace al::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef AL_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define AL_IMPL_DEBUG_BREAK() (::al::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(AL_COMPILER_POSIX)

// we use a SIGTRAP to signal a trace/breakpoint
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
//       SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
extern "C" int raise(int) noexcept;
#define AL_IMPL_DEBUG_BREAK() (::al::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define AL_IMPL_DEBUG_BREAK() void(0)

#endif

#define AL_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::al::impl::handle_assert_failure(#cond, msg, ::al::source_location::current()); \
            AL_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if AL_ASSERT_ENABLED

#define AL_IMPL_ASSERT(cond, msg) AL_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message must still compile
#define AL_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AL_UNUSED(cond);          \
        AL_UNUSED(msg);           \
    } while (false)

#endif
