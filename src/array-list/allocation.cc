#include "allocation.hh"

#include <array-list/macros.hh>
#include <array-list/utility.hh>

#include <cstdlib>

namespace
{
// The system allocator is stateless, userdata is ignored everywhere.

// Returns nullptr on failure. bytes > 0.
al::byte* system_aligned_alloc(al::isize bytes, al::isize alignment)
{
#ifdef AL_OS_WINDOWS
    return static_cast<al::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc),
    // but it needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    al::isize const effective_alignment = alignment < al::isize(sizeof(void*)) ? al::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    return result == 0 ? static_cast<al::byte*>(raw_ptr) : nullptr;
#endif
}

al::isize system_allocate_bytes(al::byte** out_ptr, al::isize min_bytes, al::isize max_bytes, al::isize alignment, void* userdata)
{
    AL_UNUSED(userdata);
    AL_UNUSED(max_bytes);

    AL_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    AL_ASSERT(alignment > 0 && al::is_power_of_two(alignment), "alignment must be a power of 2");
    AL_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    auto const p = system_aligned_alloc(min_bytes, alignment);
    if (p == nullptr)
        throw al::allocation_failure(min_bytes, alignment);

    *out_ptr = p;
    return min_bytes;
}

al::isize system_try_allocate_bytes(al::byte** out_ptr, al::isize min_bytes, al::isize max_bytes, al::isize alignment, void* userdata)
{
    AL_UNUSED(userdata);
    AL_UNUSED(max_bytes);

    AL_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    AL_ASSERT(alignment > 0 && al::is_power_of_two(alignment), "alignment must be a power of 2");
    AL_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    *out_ptr = nullptr;
    if (min_bytes == 0)
        return 0;

    auto const p = system_aligned_alloc(min_bytes, alignment);
    if (p == nullptr)
        return -1;

    *out_ptr = p;
    return min_bytes;
}

void system_deallocate_bytes(al::byte* p, al::isize bytes, al::isize alignment, void* userdata)
{
    AL_UNUSED(bytes);
    AL_UNUSED(alignment);
    AL_UNUSED(userdata);

    // must match the allocation function:
    // _aligned_malloc pairs with _aligned_free, posix_memalign with std::free
#ifdef AL_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

al::isize system_try_resize_bytes_in_place(al::byte* p,
                                           al::isize old_bytes,
                                           al::isize min_bytes,
                                           al::isize max_bytes,
                                           al::isize alignment,
                                           void* userdata)
{
    AL_UNUSED(userdata);

    AL_ASSERT(p != nullptr, "cannot resize null pointer");
    AL_ASSERT(alignment > 0 && al::is_power_of_two(alignment), "alignment must be a power of 2");
    AL_ASSERT(old_bytes > 0, "old_bytes must be positive");
    AL_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    AL_UNUSED(p);

    // the block already has an acceptable size
    if (min_bytes <= old_bytes && old_bytes <= max_bytes)
        return old_bytes;

    // malloc/posix_memalign cannot grow or shrink in place, and realloc might move,
    // which would invalidate pointers into the block (list.add(list[0]))
    return -1;
}

/// Lives in the data segment, so al::default_memory_resource is usable during static initialization.
constinit al::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit al::memory_resource const* const al::default_memory_resource = &system_memory_resource;
