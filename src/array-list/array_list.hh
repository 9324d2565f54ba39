#pragma once

#include <array-list/array.hh>
#include <array-list/comparator.hh>
#include <array-list/function_ref.hh>
#include <array-list/impl/allocating_container.hh>
#include <array-list/optional.hh>
#include <array-list/span.hh>
#include <array-list/to_debug_string.hh>

#include <algorithm>
#include <initializer_list>
#include <string>
#include <type_traits>

/// Capacity tuning of a single array_list.
struct al::growth_policy
{
    /// When an append would bring size() to or past capacity(), the buffer grows to
    /// growth_factor * (capacity() + number of added elements).
    f32 growth_factor = 2.0f;

    /// After a removal, the buffer shrinks to exactly size() once size() <= shrink_factor * capacity().
    /// 0 disables shrinking.
    f32 shrink_factor = 0.25f;

    [[nodiscard]] bool is_valid() const
    {
        return growth_factor >= 1.0f && shrink_factor >= 0.0f && shrink_factor <= 1.0f;
    }

    bool operator==(growth_policy const&) const = default;
};

/// Ordered, index-addressable sequence backed by one contiguous, resizable buffer.
///
/// The checked API never faults on bad indices:
///   - get(i) returns an empty optional outside [0, size())
///   - set/insert/remove/swap return false and leave the list untouched when an index is rejected
///   - set(size(), v) and insert(size(), v...) append
/// The unchecked API (operator[], front, back) asserts its preconditions.
///
/// Capacity follows the per-instance growth_policy:
///   grow   (before an append of n):  if size() + n >= capacity(), capacity becomes growth_factor * (capacity() + n)
///   shrink (after a removal):        if size() <= shrink_factor * capacity(), capacity becomes size()
///   clear():                          buffer released, capacity 0
///
/// Values passed to add/insert/set may reference elements of the same list.
/// Multi-element add/insert is all-or-nothing: if constructing any element throws, the list is unchanged.
/// Allocation failure throws al::allocation_failure (for the default resource) and leaves the list unchanged.
///
/// Not synchronized; concurrent mutation is undefined behavior.
///
/// Usage:
///   auto list = al::array_list<int>{1, 2, 3};
///   list.insert(1, 10, 20);          // [1, 10, 20, 2, 3]
///   list.remove(0);                  // [10, 20, 2, 3]
///   list.set(list.size(), 99);       // [10, 20, 2, 3, 99]
///   list.sort();                     // [2, 3, 10, 20, 99]
template <class T>
struct al::array_list : private al::impl::allocating_container<T, array_list<T>>
{
    using base = al::impl::allocating_container<T, array_list<T>>;
    using value_type = T;

    // element access
public:
    using base::operator[]; // unchecked, asserts 0 <= i < size()
    using base::back;
    using base::data;
    using base::front;

    // iterators
public:
    using base::begin;
    using base::end;

    // queries
public:
    using base::capacity;
    using base::empty;
    using base::size;

    // construction
public:
    array_list() = default;

    explicit array_list(growth_policy policy, al::memory_resource const* resource = nullptr)
      : base(resource), _policy(policy)
    {
        AL_ASSERT_ALWAYS(policy.is_valid(), "growth_factor must be >= 1 and shrink_factor within [0, 1]");
    }

    /// Same as an empty list followed by add(values...).
    array_list(std::initializer_list<T> values) { add_range(al::span<T const>(values.begin(), isize(values.size()))); }

    /// Same as an empty list with the given policy and resource followed by add_range(values).
    [[nodiscard]] static array_list create_copy_of(al::span<T const> values,
                                                   growth_policy policy = {},
                                                   al::memory_resource const* resource = nullptr)
    {
        auto list = array_list(policy, resource);
        list.add_range(values);
        return list;
    }

    /// Empty list with capacity() == capacity.
    [[nodiscard]] static array_list create_with_capacity(isize capacity,
                                                         growth_policy policy = {},
                                                         al::memory_resource const* resource = nullptr)
    {
        auto list = array_list(policy, resource);
        list.reserve(capacity);
        return list;
    }

    // deep copies are tight (capacity() == size()) and take the policy along
    array_list(array_list const&) = default;
    array_list(array_list&&) = default;
    array_list& operator=(array_list const&) = default;
    array_list& operator=(array_list&&) = default;
    ~array_list() = default;

    // appending
public:
    /// Appends the values at the end, in argument order.
    /// add() without values does nothing.
    template <class... Args>
        requires(std::is_constructible_v<T, Args &&> && ...)
    void add(Args&&... values)
    {
        append_with(isize(sizeof...(Args)),
                    [&](T*& obj_end)
                    {
                        ((new (al::placement_new, obj_end) T(al::forward<Args>(values)), ++obj_end), ...);
                    });
    }

    /// Appends copies of all elements of the span, in order.
    /// The span may view elements of this list.
    void add_range(al::span<T const> values)
    {
        append_with(values.size(),
                    [&](T*& obj_end) { impl::copy_create_objects_to(obj_end, values.data(), values.data() + values.size()); });
    }

    // mutation
public:
    /// Overwrites the element at index.
    /// index == size() appends instead; any other index outside [0, size()) is rejected.
    /// Returns false iff the index was rejected.
    bool set(isize index, T const& value)
    {
        if (0 <= index && index < size())
        {
            (*this)[index] = value;
            return true;
        }
        if (index == size())
        {
            add(value);
            return true;
        }
        return false;
    }
    bool set(isize index, T&& value)
    {
        if (0 <= index && index < size())
        {
            (*this)[index] = al::move(value);
            return true;
        }
        if (index == size())
        {
            add(al::move(value));
            return true;
        }
        return false;
    }

    /// Inserts the values before the element at index, shifting the tail to the right.
    /// index == size() appends; index < 0 or index > size() is rejected.
    /// Capacity is grown for the new total count before anything is shifted.
    /// Returns false iff the index was rejected.
    template <class... Args>
        requires(std::is_constructible_v<T, Args &&> && ...)
    bool insert(isize index, Args&&... values)
    {
        if (index < 0 || index > size())
            return false;

        auto const old_size = size();
        add(al::forward<Args>(values)...);
        rotate_appended_to(index, old_size);
        return true;
    }

    /// Span version of insert.
    bool insert_range(isize index, al::span<T const> values)
    {
        if (index < 0 || index > size())
            return false;

        auto const old_size = size();
        add_range(values);
        rotate_appended_to(index, old_size);
        return true;
    }

    /// Removes the element at index and closes the gap, then applies the shrink policy.
    /// Returns false (and does nothing) if index is outside [0, size()).
    bool remove(isize index)
    {
        if (index < 0 || index >= size())
            return false;

        base::remove_at(index);
        shrink_after_removal();
        return true;
    }

    /// Destroys all elements and releases the buffer: size() == 0, capacity() == 0.
    /// The memory resource and policy are kept.
    void clear()
    {
        base::destroy_objects();
        base::reallocate_exact(0);
    }

    /// Exchanges the elements at i and j.
    /// Returns false (and does nothing) if either index is outside [0, size()).
    bool swap(isize i, isize j)
    {
        if (i < 0 || i >= size() || j < 0 || j >= size())
            return false;

        if (i != j)
            al::swap((*this)[i], (*this)[j]);
        return true;
    }

    /// Sorts [0, size()) in place with a three-way comparator (negative means "a before b").
    /// Unstable: the relative order of equivalent elements is unspecified.
    void sort(al::comparator<T> compare)
    {
        if (size() < 2)
            return;

        std::sort(begin(), end(), [&](T const& a, T const& b) { return compare(a, b) < 0; });
    }

    /// Sorts ascending by operator<, unstable.
    void sort()
        requires requires(T const& a) { bool(a < a); }
    {
        if (size() < 2)
            return;

        std::sort(begin(), end(), [](T const& a, T const& b) { return a < b; });
    }

    // lookup
public:
    /// A copy of the element at index, or nullopt if index is outside [0, size()).
    [[nodiscard]] al::optional<T> get(isize index) const
    {
        if (index < 0 || index >= size())
            return al::nullopt;
        return al::optional<T>((*this)[index]);
    }

    /// First index holding an element equal to value, or -1.
    [[nodiscard]] isize index_of(T const& value) const
    {
        for (isize i = 0; i < size(); ++i)
            if ((*this)[i] == value)
                return i;
        return -1;
    }

    /// True iff every argument is equal to some element. contains() is true.
    template <class... Us>
        requires(std::is_convertible_v<Us const&, T const&> && ...)
    [[nodiscard]] bool contains(Us const&... values) const
    {
        return ((index_of(values) >= 0) && ...);
    }

    /// Independent copy of [0, size()); later changes to either side are not shared.
    [[nodiscard]] al::array<T> values() const
    {
        return al::array<T>::create_copy_of(al::span<T const>(data(), size()), base::custom_resource());
    }

    // enumeration
public:
    /// Calls fn(index, element) for every element in order.
    void each(al::function_ref<void(isize, T const&)> fn) const
    {
        for (isize i = 0; i < size(); ++i)
            fn(i, (*this)[i]);
    }

    /// True iff pred holds for at least one element (false for an empty list).
    [[nodiscard]] bool any(al::function_ref<bool(T const&)> pred) const { return find_index(pred) >= 0; }

    /// True iff pred holds for every element (true for an empty list).
    [[nodiscard]] bool all(al::function_ref<bool(T const&)> pred) const
    {
        for (auto const& v : *this)
            if (!pred(v))
                return false;
        return true;
    }

    /// Index of the first element satisfying pred, or -1.
    [[nodiscard]] isize find_index(al::function_ref<bool(T const&)> pred) const
    {
        for (isize i = 0; i < size(); ++i)
            if (pred((*this)[i]))
                return i;
        return -1;
    }

    /// New list with copies of the elements satisfying pred, in order.
    /// Uses the same policy and memory resource.
    [[nodiscard]] array_list select(al::function_ref<bool(T const&)> pred) const
    {
        auto result = array_list(_policy, base::custom_resource());
        for (auto const& v : *this)
            if (pred(v))
                result.add(v);
        return result;
    }

    // capacity
public:
    [[nodiscard]] growth_policy const& policy() const { return _policy; }

    /// The resource backing all allocations, nullptr for al::default_memory_resource.
    [[nodiscard]] al::memory_resource const* memory_resource() const { return base::custom_resource(); }

    /// Ensures capacity() >= new_capacity, allocating exactly new_capacity slots if it has to grow.
    void reserve(isize new_capacity)
    {
        AL_ASSERT(new_capacity >= 0, "capacity must be non-negative");
        if (new_capacity > capacity())
            base::reallocate_exact(new_capacity);
    }

    /// Like reserve, but reports allocation failure by returning false instead of throwing.
    [[nodiscard]] bool try_reserve(isize new_capacity)
    {
        AL_ASSERT(new_capacity >= 0, "capacity must be non-negative");
        if (new_capacity <= capacity())
            return true;
        return base::try_reallocate_exact(new_capacity);
    }

    /// Reallocates so that capacity() == size().
    void shrink_to_fit() { base::reallocate_exact(size()); }

    // rendering
public:
    /// "array_list\n" followed by the comma-separated debug strings of the elements.
    /// Diagnostics only, not a serialization format.
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string("array_list\n");
        for (isize i = 0; i < size(); ++i)
        {
            if (i > 0)
                s += ", ";
            s += al::to_debug_string((*this)[i]);
        }
        return s;
    }

    // comparison
public:
    /// Element-wise equality; capacity, policy and resource do not participate.
    [[nodiscard]] friend bool operator==(array_list const& lhs, array_list const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs[i] == rhs[i]))
                return false;
        return true;
    }

    // helper
private:
    // capacity for appending count elements, never below what is actually needed
    [[nodiscard]] isize grown_capacity_for(isize count) const
    {
        auto const grown = isize(_policy.growth_factor * f32(capacity() + count));
        return al::max(grown, size() + count);
    }

    // constructs count elements at the end via construct(obj_end), growing first if the policy says so
    // a throwing construct destroys the already constructed part and leaves the list unchanged
    template <class ConstructF>
    void append_with(isize count, ConstructF&& construct)
    {
        if (count == 0)
            return;

        al::allocation<T> new_allocation;
        auto p_obj_end = &this->_data.obj_end;

        if (size() + count >= capacity()) [[unlikely]]
            p_obj_end = base::ensure_capacity_back_begin(new_allocation, grown_capacity_for(count));

        T* const first_new = *p_obj_end;
        bool constructed = false;
        AL_DEFER
        {
            if (!constructed)
            {
                impl::destroy_objects_in_reverse(first_new, *p_obj_end);
                *p_obj_end = first_new;
            }
        };

        construct(*p_obj_end);
        constructed = true;

        if (new_allocation.is_valid()) [[unlikely]]
            base::ensure_capacity_back_finalize(new_allocation);
    }

    // the elements [old_size, size()) were just appended and belong in front of index
    void rotate_appended_to(isize index, isize old_size)
    {
        if (index < old_size && old_size < size())
            std::rotate(begin() + index, begin() + old_size, end());
    }

    void shrink_after_removal()
    {
        if (_policy.shrink_factor == 0.0f)
            return;

        if (size() <= isize(f32(capacity()) * _policy.shrink_factor))
        {
            // best-effort: if the resource cannot provide the smaller block, the current buffer stays
            auto const shrunk = base::try_reallocate_exact(size());
            AL_UNUSED(shrunk);
        }
    }

    friend base;

    growth_policy _policy;
};
