#pragma once

#include <cstddef>
#include <cstdint>


namespace duty
{

//
// Primitives
//

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
// Sizes and counts are signed so that "size - 1" and mixed arithmetic behave like integers.
// std:: containers used as backing storage are converted at the boundary.
using isize = i64;

//
// Vocabulary types
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class U>
struct pair;

template <class T>
struct lazy;

template <class T>
struct function_ref;
template <class T>
struct unique_function;

//
// Maps
//

struct key_not_found;

template <class K, class V>
struct map;
template <class K, class V, class MapT = map<K, V>>
struct defaulting_map;

} // namespace duty
