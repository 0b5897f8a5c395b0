#pragma once

#include <cstddef>
#include <cstdint>


namespace lk
{

//
// Primitives
//

// Explicitly-sized primitive types
// Sizes and indices are signed (isize) throughout the library:
// "size - 1" on an empty list must be -1, not a huge positive number,
// which keeps the backwards Fisher-Yates loop and the compaction indices trivially correct.

using i32 = int32_t;
using i64 = int64_t;

using u32 = uint32_t;
using u64 = uint64_t;

using byte = std::byte;

// signed size type
using isize = i64;

using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

template <class Signature>
struct function_ref;

//
// Randomness
//

struct fast_rng;
struct secure_rng;

//
// Errors
//

class argument_error;

} // namespace lk
