#pragma once

#include <array-list/impl/allocating_container.hh>

#include <initializer_list>

/// Dynamically allocated array of T elements with value semantics.
/// Fixed size after creation (no add/insert/remove); owns its memory through al::allocation<T>.
/// This is the independent snapshot that array_list::values() hands out:
/// mutating it never affects the list it was copied from.
template <class T>
struct al::array : private al::impl::allocating_container<T, array<T>>
{
    using base = al::impl::allocating_container<T, array<T>>;

    // element access
public:
    using base::operator[];
    using base::back;
    using base::data;
    using base::front;

    // iterators
public:
    using base::begin;
    using base::end;

    // queries
public:
    using base::empty;
    using base::size;

    // factories
public:
    using base::create_copy_of;         // create deep copy from span
    using base::create_from_allocation; // adopt the live objects of an allocation

    // array has deep-copy value semantics
public:
    array() = default;
    ~array() = default;
    array(array&&) = default;
    array& operator=(array&&) = default;
    array(array const&) = default;
    array& operator=(array const&) = default;

    array(std::initializer_list<T> values)
    {
        this->_data = al::allocation<T>::create_copy_of(al::span<T const>(values.begin(), isize(values.size())), nullptr);
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(array const& lhs, array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs[i] == rhs[i]))
                return false;
        return true;
    }

    friend base;
};
