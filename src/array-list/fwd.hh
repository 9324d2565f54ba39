#pragma once

#include <cstddef>
#include <cstdint>


namespace al
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and indices are signed so that "size - 1" on an empty list is -1 and not a huge number,
// and so that -1 can serve as the "not found" index returned by lookups.
// Every index-taking operation accepts negative values and treats them as out of range.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;
struct allocation_failure;

//
// Views
//

template <class T>
struct span;

//
// Callables
//

template <class Signature>
struct function_ref;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct array;

struct growth_policy;
template <class T>
struct array_list;

} // namespace al
