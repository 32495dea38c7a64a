#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "Range.hpp"
#include "Error.hpp"

#include "Exrange_export.h"

namespace ex
{

// Half-open [begin, end) index pair, the convention every sequence is sliced with
using IndexPair = std::pair<size_t, size_t>;

// Translate an exclusive range into the half-open pair. Throws IndexError when an exclusive
// start (or an inclusive end) is the maximum size_t and can't be moved by one.
// Bounds against the sequence length are checked later, by the slicing primitive.
IndexPair EXRANGE_EXPORT toSliceRange(const RangeFromExclusive<size_t>& r, size_t length);
IndexPair EXRANGE_EXPORT toSliceRange(const RangeFromExclusiveToInclusive<size_t>& r, size_t length);
IndexPair EXRANGE_EXPORT toSliceRange(const RangeFromExclusiveToExclusive<size_t>& r, size_t length);

// Checks [begin, end) against a sequence of the given length
void EXRANGE_EXPORT checkSliceRange(size_t begin, size_t end, size_t length);

// Substring of UTF-8 text. Both ends have to be in bounds and on a char boundary
std::string_view EXRANGE_EXPORT strSlice(std::string_view str, size_t begin, size_t end);

// Null-terminated strings. Only RangeFromExclusive is supported as the result has to keep the terminator
const char* EXRANGE_EXPORT sliceCStr(const char* str, const RangeFromExclusive<size_t>& r);
char* EXRANGE_EXPORT sliceCStr(char* str, const RangeFromExclusive<size_t>& r);

template <typename R>
struct is_index_range : std::bool_constant<std::is_same_v<R, RangeFromExclusive<size_t>>
	|| std::is_same_v<R, RangeFromExclusiveToInclusive<size_t>>
	|| std::is_same_v<R, RangeFromExclusiveToExclusive<size_t>>> {};

template <typename R>
constexpr bool is_index_range_v = is_index_range<std::decay_t<R>>::value;

}
