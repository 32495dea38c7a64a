#include "Index.hpp"

#include <cstring>
#include <limits>

using namespace ex;

static constexpr size_t g_max_index = std::numeric_limits<size_t>::max();

static void checkExclusiveStart(size_t start)
{
	if(start == g_max_index)
		throw IndexError("attempted to index slice exclusively from maximum size_t");
}

static void checkInclusiveEnd(size_t end)
{
	if(end == g_max_index)
		throw IndexError("attempted to index slice inclusively to maximum size_t");
}

// UTF-8 continuation bytes look like 0b10xxxxxx
static bool isCharBoundary(std::string_view str, size_t idx)
{
	if(idx == 0 || idx == str.size())
		return true;
	return (static_cast<unsigned char>(str[idx]) & 0xC0) != 0x80;
}

IndexPair ex::toSliceRange(const RangeFromExclusive<size_t>& r, size_t length)
{
	checkExclusiveStart(r.start);
	return {r.start + 1, length};
}

IndexPair ex::toSliceRange(const RangeFromExclusiveToInclusive<size_t>& r, size_t)
{
	checkExclusiveStart(r.start);
	checkInclusiveEnd(r.end);
	return {r.start + 1, r.end + 1};
}

IndexPair ex::toSliceRange(const RangeFromExclusiveToExclusive<size_t>& r, size_t)
{
	checkExclusiveStart(r.start);
	return {r.start + 1, r.end};
}

void ex::checkSliceRange(size_t begin, size_t end, size_t length)
{
	if(begin > end)
		throw IndexError("slice index starts at " + std::to_string(begin) + " but ends at " + std::to_string(end));
	if(end > length)
		throw IndexError("range end index " + std::to_string(end) + " out of range for slice of length " + std::to_string(length));
}

std::string_view ex::strSlice(std::string_view str, size_t begin, size_t end)
{
	for(size_t idx : {begin, end}) {
		if(idx > str.size())
			throw IndexError("byte index " + std::to_string(idx) + " is out of bounds of string of length " + std::to_string(str.size()));
	}
	if(begin > end)
		throw IndexError("begin <= end (" + std::to_string(begin) + " <= " + std::to_string(end) + ") when slicing string");
	for(size_t idx : {begin, end}) {
		if(isCharBoundary(str, idx) == false)
			throw IndexError("byte index " + std::to_string(idx) + " is not a char boundary");
	}
	return str.substr(begin, end - begin);
}

const char* ex::sliceCStr(const char* str, const RangeFromExclusive<size_t>& r)
{
	checkExclusiveStart(r.start);
	size_t len_with_nul = std::strlen(str) + 1;
	// Starting at or past the terminator would give a string that doesn't end in a null
	if(r.start + 1 < len_with_nul)
		return str + r.start + 1;
	throw IndexError("index out of bounds: the len is " + std::to_string(len_with_nul)
		+ " but the index is " + std::to_string(r.start));
}

char* ex::sliceCStr(char* str, const RangeFromExclusive<size_t>& r)
{
	const char* res = sliceCStr(static_cast<const char*>(str), r);
	return str + (res - str);
}
