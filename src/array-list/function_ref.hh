#pragma once

#include <array-list/assert.hh>
#include <array-list/fwd.hh>
#include <array-list/utility.hh>

#include <type_traits>

/// Non-owning reference to a callable with signature R(Args...)
///
/// The callback type of array_list (sort comparators, each/any/all/find_index/select predicates).
/// Trivially copyable: one payload pointer plus one thunk, no heap allocations.
///
/// IMPORTANT LIFETIME RULE:
///   function_ref never owns. The referenced callable must outlive the function_ref.
///   Passing a lambda directly as a function argument is always fine:
///
///   list.each([&](al::isize i, int const& v) { sum += i * v; });
///
/// Accepts function pointers, lambdas and functors.
/// A default-constructed function_ref is invalid and must not be called.
template <class R, class... Args>
struct al::function_ref<R(Args...)>
{
    // internal storage
private:
    void* _payload = nullptr;
    al::function_ptr<R(void*, Args...)> _thunk = nullptr;

    // construction
public:
    function_ref() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>)
    function_ref(F&& f) : _payload((void*)&f)
    {
        static_assert(std::is_invocable_r_v<R, F&, Args...>, "F must be callable with Args... and return R");

        using Fn = std::remove_reference_t<F>;
        // NOLINTBEGIN
        _thunk = [](void* p, Args... args) -> R { return (*static_cast<Fn*>(p))(al::forward<Args>(args)...); };
        // NOLINTEND
    }

    /// Plain functions decay to a function pointer, which is stored in the payload slot itself.
    function_ref(R (*fn)(Args...)) : _payload((void*)fn)
    {
        AL_ASSERT(fn != nullptr, "cannot reference a null function pointer");
        // NOLINTBEGIN
        _thunk = [](void* p, Args... args) -> R { return (reinterpret_cast<R (*)(Args...)>(p))(al::forward<Args>(args)...); };
        // NOLINTEND
    }

    function_ref(function_ref const&) = default;
    function_ref(function_ref&&) = default;
    function_ref& operator=(function_ref const&) = default;
    function_ref& operator=(function_ref&&) = default;
    ~function_ref() = default;

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    /// Precondition: is_valid().
    R operator()(Args... args) const
    {
        AL_ASSERT(_thunk != nullptr, "calling an invalid function_ref");
        return _thunk(_payload, al::forward<Args>(args)...);
    }
};
