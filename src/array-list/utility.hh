#pragma once

#include <array-list/assert.hh>
#include <array-list/fwd.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Swapping:
//   swap(a, b)                  - swap values, respects ADL swap overloads
//
// Alignment (value or pointer):
//   is_power_of_two(value)           - check if value is a power of 2
//   align_up(value, alignment)       - increment to next aligned boundary (power of 2)
//   is_aligned(value, alignment)     - check if aligned at boundary (power of 2)
//
// Raw storage:
//   placement_new                    - tag for `new (al::placement_new, ptr) T(...)` without <new>
//   storage_for<T>                   - uninitialized storage with size and alignment of T
//   memcpy(dest, src, bytes)         - byte copy for trivially copyable payloads
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   function_ptr<Signature>          - convert function signature to function pointer type
//
// Scope utilities:
//   AL_DEFER { code }                - execute code at scope-exit (RAII cleanup)
//


namespace al
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   list.add(al::move(obj));  // transfer obj into the list
template <class T>
[[nodiscard]] AL_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] AL_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AL_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ptr = al::exchange(p, nullptr);     // take ownership of p, set p to null
template <class T, class U = T>
[[nodiscard]] AL_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = static_cast<U&&>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Swapping
// =========================================================================================================

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// ADL-aware swap that respects custom swap overloads
/// Implemented as a function object (not a function) so it cannot be found by ADL
/// Usage:
///   al::swap(a, b);  // finds custom swap via ADL if available, otherwise uses move-based swap
[[maybe_unused]] constexpr impl::swap_fn swap;

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    AL_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given boundary
/// Usage:
///   isize val = al::align_up(300, 16);             // = 304 (next multiple of 16)
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    AL_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    auto const mask = alignment - 1;
    return (T)(((isize)value + mask) & ~mask);
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    AL_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Raw storage
// =========================================================================================================

struct placement_new_tag
{
};

/// Tag selecting the non-allocating operator new declared below
/// Usage:
///   new (al::placement_new, ptr) T(args...);
constexpr placement_new_tag placement_new{};

namespace impl
{
template <class T, bool = std::is_trivially_destructible_v<T>>
union storage_for_impl
{
    T value;
    constexpr storage_for_impl() {}
};

template <class T>
union storage_for_impl<T, false>
{
    T value;
    constexpr storage_for_impl() {}
    ~storage_for_impl() {}
};
} // namespace impl

/// Uninitialized storage for a single T
/// The owner decides when `value` is alive; no constructor or destructor of T is run implicitly.
/// Stays trivially destructible (and trivially copyable) when T is.
template <class T>
using storage_for = impl::storage_for_impl<T>;

/// Byte copy; only valid for trivially copyable payloads
AL_FORCE_INLINE void memcpy(void* dest, void const* src, std::size_t bytes) noexcept
{
    std::memcpy(dest, src, bytes);
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   al::function_ptr<int(float, double)>          -> int (*)(float, double)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Scope utilities
// =========================================================================================================

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(static_cast<F&&>(f));
}
} // namespace impl

/// Execute code at scope-exit (RAII-style cleanup)
/// Captures by reference - be careful with lifetime
/// Usage:
///   begin();
///   AL_DEFER { end(); };
#define AL_DEFER auto const AL_MACRO_JOIN(_al_deferred_, __COUNTER__) = ::al::impl::deferred_tag{} + [&]

} // namespace al

/// Non-allocating placement new selected by al::placement_new
/// Avoids including <new> in every header
inline void* operator new(std::size_t, al::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, al::placement_new_tag, void*) noexcept {}

// =========================================================================================================
// Implementation
// =========================================================================================================

// must be done outside of the al namespace so al::swap cannot be found anymore
namespace _no_al_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_al_namespace

template <class T>
constexpr void al::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_al_namespace::do_swap_impl(a, b);
}
