#pragma once

#include <cstddef>
#include <cstdint>


namespace fl
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters, "int" is fine for small counts.

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

// signed size type
// Sizes and indices are signed: "size - 1" must not wrap around for empty inputs.
using isize = i64;

//
// Errors
//

struct any_error;
struct option_error;
struct result_error;

//
// Sum types
//

struct none_t;
template <class T>
struct option;

template <class T, class E = any_error>
struct result;

template <class T>
struct ok_t;
template <class E>
struct err_t;

/// Value of a computation that produces nothing, e.g. attempt() of a void function.
struct unit;

//
// Short-circuit sequences
//

template <class T, class E, bool Async>
struct basic_try_steps;
template <class T, bool Async>
struct basic_maybe_steps;

template <class T, class E = any_error>
using try_steps = basic_try_steps<T, E, false>;
template <class T, class E = any_error>
using async_try_steps = basic_try_steps<T, E, true>;

template <class T>
using maybe_steps = basic_maybe_steps<T, false>;
template <class T>
using async_maybe_steps = basic_maybe_steps<T, true>;

} // namespace fl
