#pragma once

#include <array-list/fwd.hh>
#include <array-list/impl/object_lifetime_util.hh>
#include <array-list/optional.hh>
#include <array-list/span.hh>
#include <array-list/utility.hh>

#include <new>

// al::allocation<T> is the owning "storage + liveness" handle underneath al::array<T> and al::array_list<T>.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from an al::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// The containers differ only in *policy* (when the buffer grows or shrinks and by how much).
// The sharp mechanics (allocation ownership, resizing, alignment, object lifetime) are centralized here.
//
// Memory is obtained from a polymorphic al::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*, not as a template argument. A null resource
// means "use al::default_memory_resource".
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - obj_start and obj_end are always aligned to alignof(T), even when empty.
// - custom_resource == nullptr implies use of al::default_memory_resource.

namespace al
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// A system allocator stored in the data segment, valid even during static initialization.
/// allocate_bytes throws al::allocation_failure when the system is out of memory.
extern al::memory_resource const* const default_memory_resource;
} // namespace al

/// Raised when a memory resource cannot provide the requested bytes.
/// This is the only error condition of the growth path: the container that asked for memory is unchanged.
/// Derives from std::bad_alloc so generic out-of-memory handlers still catch it.
struct al::allocation_failure : std::bad_alloc
{
    isize requested_bytes = 0;
    isize alignment = 0;

    allocation_failure(isize bytes, isize align) : requested_bytes(bytes), alignment(align) {}

    [[nodiscard]] char const* what() const noexcept override
    {
        return "al::allocation_failure: memory resource could not provide the requested bytes";
    }
};

/// Polymorphic memory resource interface powering al::allocation<T>.
/// Custom allocators implement this interface to provide pluggable allocation strategies.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct al::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure throws (al::allocation_failure for the default).
    al::function_ptr<isize(al::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Attempt to allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size on success, or -1 on failure (and sets *out_ptr to nullptr).
    /// This is the escape hatch for callers that must handle allocation failure without exceptions
    /// (array_list::try_reserve, the shrink step after array_list::remove).
    al::function_ptr<isize(al::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> try_allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    al::function_ptr<void(al::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing allocation in place without moving or freeing it.
    /// Returns the new size in [min_bytes, max_bytes] on success, -1 on failure (allocation unchanged).
    /// Preconditions: `1 <= min_bytes <= max_bytes`, `p` was allocated with `old_bytes` and `alignment`.
    /// May be nullptr, which means "never resizes in place".
    al::function_ptr<isize(al::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed "live window" inside it.
///
/// Capacity is implicit: the number of whole T slots between obj_start and alloc_end.
/// Move-only; containers that want deep copies construct a new allocation explicitly.
///
/// Invariants:
/// - [obj_start, obj_end) is the live object range; obj_end is exclusive.
/// - [alloc_start, alloc_end) is the owned byte allocation; alloc_end is exclusive.
/// - alloc_start <= obj_start <= obj_end <= alloc_end (even for empty ranges or empty allocations).
/// - custom_resource == nullptr means the global default memory resource is used.
template <class T>
struct al::allocation
{
    /// Pointer to the first live object.
    T* obj_start = nullptr;

    /// Pointer one past the last live object (exclusive end).
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    al::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    al::byte* alloc_end = nullptr;

    /// Alignment that was used when allocating [alloc_start, alloc_end); needed for deallocation.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    /// Sticky: survives reallocation, so growth keeps using the same resource.
    al::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] al::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this is a valid non-defaulted allocation (byte size > 0)
    /// The object range might still be empty
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    [[nodiscard]] al::span<T> obj_span() const { return al::span<T>(obj_start, obj_end); }

    /// Number of live objects
    [[nodiscard]] isize obj_count() const { return obj_end - obj_start; }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Number of T slots from obj_start to the end of the allocation (live + free)
    [[nodiscard]] isize capacity() const
    {
        // Note: nullptr - nullptr == 0 is well-defined, so the empty state yields 0
        auto const bytes = alloc_end - (al::byte const*)obj_start;
        return bytes / isize(sizeof(T));
    }

    /// Attempt to resize the allocation in place to a size between min_bytes and max_bytes.
    /// Returns true if the resize succeeded, false otherwise (allocation unchanged).
    /// IMPORTANT: Cannot resize below the size needed by live objects (obj_end).
    [[nodiscard]] bool try_resize_alloc_inplace(isize min_bytes, isize max_bytes)
    {
        AL_ASSERT(min_bytes >= 1 && max_bytes >= min_bytes, "try_resize_alloc_inplace: invalid size range");

        isize const obj_end_bytes = (byte const*)obj_end - alloc_start;
        AL_ASSERT(min_bytes >= obj_end_bytes, "try_resize_alloc_inplace: cannot resize below live object range");

        if (alloc_start == nullptr)
            return false;

        auto const& res = resource();
        if (res.try_resize_bytes_in_place == nullptr)
            return false;

        auto const old_bytes = alloc_end - alloc_start;
        isize const new_bytes
            = res.try_resize_bytes_in_place(alloc_start, old_bytes, min_bytes, max_bytes, alignment, res.userdata);

        if (new_bytes == -1)
            return false;

        alloc_end = alloc_start + new_bytes;
        return true;
    }

    /// Resize the allocation to a size between min_bytes and max_bytes with a new alignment.
    /// Always tries to resize in place first. If that fails, allocates a new buffer,
    /// moves the live objects over, and replaces the current allocation.
    /// min_bytes == 0 releases the buffer (requires no live objects) but keeps the resource.
    /// If the new buffer cannot be allocated, the exception propagates and *this is unchanged.
    /// IMPORTANT: Cannot resize below the size needed by live objects (obj_end).
    void resize_alloc(isize min_bytes, isize max_bytes, isize new_alignment)
    {
        AL_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "resize_alloc: invalid size range");
        AL_ASSERT(new_alignment >= isize(alignof(T)), "new_alignment must be at least alignof(T)");

        isize const obj_end_bytes = (byte const*)obj_end - alloc_start;
        AL_ASSERT(min_bytes >= obj_end_bytes, "resize_alloc: cannot resize below live object range");

        if (min_bytes == 0)
        {
            auto const res = custom_resource;
            *this = allocation();
            custom_resource = res;
            return;
        }

        if (al::is_aligned(alloc_start, new_alignment) && try_resize_alloc_inplace(min_bytes, max_bytes))
        {
            alignment = new_alignment;
            return;
        }

        auto new_alloc = allocation::create_empty_bytes(min_bytes, max_bytes, new_alignment, custom_resource);
        impl::move_create_objects_to(new_alloc.obj_end, obj_start, obj_end);
        *this = al::move(new_alloc);
    }

    // factories
public:
    /// Creates an empty allocation with reserved capacity but no live objects.
    /// Allocates between min_bytes and max_bytes with the specified alignment.
    /// The result has obj_start == obj_end == alloc_start + obj_offset.
    /// min_bytes == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes,
                                                       isize max_bytes, // NOLINT
                                                       isize alignment, // NOLINT
                                                       memory_resource const* resource,
                                                       isize obj_offset = 0)
    {
        AL_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        AL_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");
        AL_ASSERT(obj_offset * isize(sizeof(T)) <= min_bytes, "obj_offset would result in invalid allocation");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        auto const& res = resource ? *resource : *default_memory_resource;

        auto const actual_byte_size
            = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, result.alignment, res.userdata);
        result.alloc_end = result.alloc_start + actual_byte_size;

        result.obj_start = (T*)result.alloc_start + obj_offset;
        result.obj_end = result.obj_start;

        return result;
    }

    /// Creates an empty allocation for exactly 'size' objects (no spare capacity), alignment alignof(T).
    /// size == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty(isize size, memory_resource const* resource)
    {
        auto const byte_size = size * isize(sizeof(T));
        return create_empty_bytes(byte_size, byte_size, alignof(T), resource);
    }

    /// Fallible variant of create_empty using memory_resource::try_allocate_bytes.
    /// Returns nullopt if the resource could not provide the memory; never throws for exhaustion.
    [[nodiscard]] static al::optional<allocation> try_create_empty(isize size, memory_resource const* resource)
    {
        AL_ASSERT(size >= 0, "size must be non-negative");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignof(T);

        if (size > 0)
        {
            auto const& res = resource ? *resource : *default_memory_resource;
            AL_ASSERT(res.try_allocate_bytes != nullptr, "memory resource must provide try_allocate_bytes");

            auto const byte_size = size * isize(sizeof(T));
            auto const actual_byte_size
                = res.try_allocate_bytes(&result.alloc_start, byte_size, byte_size, result.alignment, res.userdata);
            if (actual_byte_size < 0 || result.alloc_start == nullptr)
                return al::nullopt;

            result.alloc_end = result.alloc_start + actual_byte_size;
            result.obj_start = (T*)result.alloc_start;
            result.obj_end = result.obj_start;
        }

        return al::optional<allocation>(al::move(result));
    }

    /// Creates a deep copy of a span of objects with a tight allocation (no spare capacity).
    /// Empty spans result in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_copy_of(span<T const> source, memory_resource const* resource)
    {
        auto result = allocation::create_empty(source.size(), resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    // downstream containers need to handle this explicitly!
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(al::exchange(rhs.obj_start, nullptr)),
        obj_end(al::exchange(rhs.obj_end, nullptr)),
        alloc_start(al::exchange(rhs.alloc_start, nullptr)),
        alloc_end(al::exchange(rhs.alloc_end, nullptr)),
        alignment(al::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Move assignment, safe even when rhs is nested inside one of the objects owned by *this:
    /// rhs is first moved into a temporary, then our objects are destroyed, then ownership is transferred.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = al::move(rhs);

            impl::destroy_objects_in_reverse(obj_start, obj_end);
            if (alloc_start != nullptr)
            {
                auto const& res = resource();
                res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
            }

            obj_start = al::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = al::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = al::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = al::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = al::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource; // rhs resource stays
        }

        return *this;
    }

    ~allocation()
    {
        // end life and call dtor of live objects
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        // return allocation
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
