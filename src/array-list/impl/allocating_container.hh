#pragma once

#include <array-list/allocation.hh>

#include <type_traits>

namespace al::impl
{
template <class T, class ContainerT>
struct allocating_container;
}

/// Mixin implementing the common "contiguous container over al::allocation<T>" surface area.
///
/// CRTP-style helper: concrete containers privately inherit it as
/// `al::impl::allocating_container<T, Derived>`, then selectively re-expose members via `using`
/// (al::array re-exposes access and factories, al::array_list adds the growth policy on top).
///
/// Storage is always anchored at the start of the allocation (obj_start == alloc_start), so
/// capacity() is the number of T slots in the allocation. Allocations are sized in whole elements
/// with alignof(T), so a requested capacity is exactly the capacity that is observed afterwards.
///
///
/// === Exception & reference guarantees ===
///
/// Allocation failures leave the container unchanged.
/// Element construction failures leave size and live range unchanged (the derived container
/// rolls back partially constructed elements of a multi-element append).
///
/// Reallocation always uses move construction (no copy fallback).
/// If a move throws during reallocation, the container remains structurally valid
/// (size, bounds, iteration correct), but some elements may be in moved-from state.
///
/// The old allocation remains valid until the new elements are constructed, so appending values
/// that live inside the container itself (e.g. `list.add(list[0])`) is safe during growth.
///
/// Any reallocation invalidates pointers, references, and iterators.
template <class T, class ContainerT>
struct al::impl::allocating_container
{
    using container_t = ContainerT;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        auto const p_obj = _data.obj_start + i;
        AL_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        auto const p_obj = _data.obj_start + i;
        AL_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        AL_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        AL_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        AL_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        AL_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *(_data.obj_end - 1);
    }

    /// May be nullptr if the container has never allocated or released its buffer.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Number of elements the current buffer can hold (live + free slots).
    [[nodiscard]] constexpr isize capacity() const { return _data.capacity(); }

    /// The memory resource used for all (re)allocations, nullptr for al::default_memory_resource.
    [[nodiscard]] constexpr al::memory_resource const* custom_resource() const { return _data.custom_resource; }

    // resizing
public:
    /// Destroys the live object range, so that obj_start == obj_end afterwards.
    /// The buffer is kept.
    constexpr void destroy_objects()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    /// Moves the live objects into a buffer of exactly new_capacity elements.
    /// new_capacity == 0 releases the buffer, the memory resource is kept.
    /// Throws if the resource cannot provide the memory; the container is unchanged in that case.
    void reallocate_exact(isize new_capacity)
    {
        AL_ASSERT(new_capacity >= size(), "cannot reallocate below the live object range");

        if (new_capacity == capacity())
            return;

        auto const new_bytes = new_capacity * isize(sizeof(T));
        _data.resize_alloc(new_bytes, new_bytes, alignof(T));
    }

    /// Fallible variant of reallocate_exact.
    /// Returns false if the resource could not provide the memory (container unchanged).
    [[nodiscard]] bool try_reallocate_exact(isize new_capacity)
    {
        AL_ASSERT(new_capacity >= size(), "cannot reallocate below the live object range");

        if (new_capacity == capacity())
            return true;

        if (new_capacity == 0)
        {
            _data.resize_alloc(0, 0, alignof(T));
            return true;
        }

        auto new_alloc = allocation<T>::try_create_empty(new_capacity, _data.custom_resource);
        if (!new_alloc.has_value())
            return false;

        impl::move_create_objects_to(new_alloc.value().obj_end, _data.obj_start, _data.obj_end);
        _data = al::move(new_alloc.value());
        return true;
    }

    // appends
public:
    /// Prepares room for appending elements when the current buffer must be replaced.
    /// Returns a pointer to the obj_end that the caller constructs into and increments.
    ///
    /// Usage pattern (begin/finalize sandwich):
    ///   allocation<T> new_allocation;
    ///   auto p_obj_end = &_data.obj_end;
    ///
    ///   if (needs_growth) [[unlikely]]
    ///       p_obj_end = ensure_capacity_back_begin(new_allocation, new_capacity);
    ///
    ///   // construct BEFORE moving the old elements: the values may reference them
    ///   new (al::placement_new, *p_obj_end) T(...);
    ///   (*p_obj_end)++; // _after_ so exceptions in T(...) leave state valid
    ///
    ///   if (new_allocation.is_valid()) [[unlikely]]
    ///       ensure_capacity_back_finalize(new_allocation);
    [[nodiscard]] AL_COLD_FUNC T** ensure_capacity_back_begin(allocation<T>& new_allocation, isize new_capacity)
    {
        AL_ASSERT(new_capacity > size(), "growth must provide room for at least one element");

        auto const new_bytes = new_capacity * isize(sizeof(T));

        // custom resources might be able to extend the block
        if (_data.is_valid() && _data.try_resize_alloc_inplace(new_bytes, new_bytes))
            return &_data.obj_end;

        // The new allocation's live range tracks only the newly constructed elements:
        // it starts behind the slots reserved for the old elements.
        // If construction throws, new_allocation's dtor cleans up exactly those.
        new_allocation = allocation<T>::create_empty_bytes(new_bytes, new_bytes, alignof(T), _data.custom_resource, size());
        return &new_allocation.obj_end;
    }

    /// Moves the old elements in front of the newly constructed ones and adopts new_allocation.
    /// PRECONDITION: new_allocation must be valid (a full reallocation happened).
    AL_COLD_FUNC void ensure_capacity_back_finalize(allocation<T>& new_allocation)
    {
        AL_ASSERT(new_allocation.is_valid(), "only call this when we have a temporary alloc");

        // reverse order keeps new_allocation's live range contiguous if a move throws
        impl::move_create_objects_to_reverse(new_allocation.obj_start, _data.obj_start, _data.obj_end);

        // destroys the moved-from old elements and releases the old buffer
        _data = al::move(new_allocation);
    }

    // removals
public:
    /// Removes the element at the given index, closing the gap.
    /// Precondition: 0 <= idx < size().
    /// O(n) complexity due to element compaction.
    constexpr void remove_at(isize idx)
    {
        auto const p_obj = _data.obj_start + idx;
        AL_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");

        if (p_obj + 1 != _data.obj_end)
            impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        // the last element is now in moved-from state (or the removed one itself)
        _data.obj_end--;
        _data.obj_end->~T();
    }

    // factories
public:
    /// Adopts the live objects of an existing allocation.
    [[nodiscard]] static container_t create_from_allocation(al::allocation<T> data)
    {
        AL_ASSERT((al::byte*)data.obj_start == data.alloc_start, "live range must start at the allocation start");
        container_t c;
        c._data = al::move(data);
        return c;
    }

    /// Deep copy of the span into a tight allocation (capacity() == source.size()).
    [[nodiscard]] static container_t create_copy_of(al::span<T const> source, al::memory_resource const* resource = nullptr)
    {
        return container_t::create_from_allocation(al::allocation<T>::create_copy_of(source, resource));
    }

    /// No live objects, capacity() == capacity.
    [[nodiscard]] static container_t create_with_capacity(isize capacity, al::memory_resource const* resource = nullptr)
    {
        AL_ASSERT(capacity >= 0, "capacity must be non-negative");
        return container_t::create_from_allocation(al::allocation<T>::create_empty(capacity, resource));
    }

    allocating_container() = default;
    ~allocating_container() = default;

    /// Empty, but all future allocations go through resource.
    explicit allocating_container(al::memory_resource const* resource) { _data.custom_resource = resource; }

    // move semantics are already fine via al::allocation
    allocating_container(allocating_container&&) = default;
    allocating_container& operator=(allocating_container&&) = default;

    // deep copy semantics, tight allocation
    allocating_container(allocating_container const& rhs)
    {
        _data = al::allocation<T>::create_empty(rhs.size(), rhs._data.custom_resource);
        impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
    }
    allocating_container& operator=(allocating_container const& rhs)
    {
        if (this != &rhs)
        {
            auto new_data = al::allocation<T>::create_empty(rhs.size(), _data.custom_resource); // keep lhs resource
            impl::copy_create_objects_to(new_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
            _data = al::move(new_data);
        }
        return *this;
    }

protected:
    al::allocation<T> _data;
};
