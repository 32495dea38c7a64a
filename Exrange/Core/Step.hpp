#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <string>
#include <cassert>

#include "Error.hpp"
#include "TypeHelpers.hpp"

namespace ex
{

// Step<T> is what makes T an ordinal type. Specialize it to iterate over your own types.
// A specialization provides:
//   static constexpr bool exact_size               - every stepsBetween() result fits in size_t
//   stepsBetween(a, b) -> std::optional<size_t>    - steps from a to b. nullopt if a > b or the count overflows size_t
//   forwardChecked(v, n)/backwardChecked(v, n)     - nullopt on overflow
//   forward(v, n)/backward(v, n)                   - throws ExError on overflow
//   forwardUnchecked(v, n)/backwardUnchecked(v, n) - caller guarantees no overflow
template <typename T, typename Enable = void>
struct Step;

template <typename T>
struct is_step_integer : std::bool_constant<std::is_integral_v<T>
	&& std::is_same_v<T, bool> == false
	&& std::is_same_v<T, char32_t> == false> {};

template <typename T>
constexpr bool is_step_integer_v = is_step_integer<T>::value;

namespace detail
{

[[noreturn]] inline void stepOverflow(const std::string& type, const char* direction, size_t n)
{
	throw ExError("Overflow when stepping a value of type " + type + " " + direction
		+ " by " + std::to_string(n) + " steps");
}

}

template <typename T>
struct Step<T, std::enable_if_t<is_step_integer_v<T>>>
{
	using Unsigned = std::make_unsigned_t<T>;
	// Wide enough for both the distance type and size_t
	using Wide = std::common_type_t<Unsigned, size_t>;

	static constexpr bool exact_size = sizeof(T) <= sizeof(size_t);

	static std::optional<size_t> stepsBetween(const T& start, const T& end)
	{
		if(end < start)
			return std::nullopt;
		Unsigned diff = Unsigned(Unsigned(end) - Unsigned(start));
		if(Wide(diff) > Wide(std::numeric_limits<size_t>::max()))
			return std::nullopt;
		return size_t(diff);
	}

	static std::optional<T> forwardChecked(const T& start, size_t n)
	{
		Unsigned room = Unsigned(Unsigned(std::numeric_limits<T>::max()) - Unsigned(start));
		if(Wide(n) > Wide(room))
			return std::nullopt;
		return T(Unsigned(Unsigned(start) + Unsigned(n)));
	}

	static std::optional<T> backwardChecked(const T& start, size_t n)
	{
		Unsigned room = Unsigned(Unsigned(start) - Unsigned(std::numeric_limits<T>::min()));
		if(Wide(n) > Wide(room))
			return std::nullopt;
		return T(Unsigned(Unsigned(start) - Unsigned(n)));
	}

	static T forward(const T& start, size_t n)
	{
		if(auto res = forwardChecked(start, n))
			return *res;
		detail::stepOverflow(typeName<T>(), "forward", n);
	}

	static T backward(const T& start, size_t n)
	{
		if(auto res = backwardChecked(start, n))
			return *res;
		detail::stepOverflow(typeName<T>(), "backward", n);
	}

	static T forwardUnchecked(const T& start, size_t n)
	{
		assert(forwardChecked(start, n).has_value());
		return T(Unsigned(Unsigned(start) + Unsigned(n)));
	}

	static T backwardUnchecked(const T& start, size_t n)
	{
		assert(backwardChecked(start, n).has_value());
		return T(Unsigned(Unsigned(start) - Unsigned(n)));
	}
};

// Unicode scalar values. The surrogate block U+D800..U+DFFF is skipped over, so stepping
// forward from U+D7FF gives U+E000. Values are assumed to be valid scalar values.
template <>
struct Step<char32_t>
{
	static constexpr uint32_t surrogate_begin = 0xD800;
	static constexpr uint32_t surrogate_end = 0xE000;
	static constexpr uint32_t surrogate_size = surrogate_end - surrogate_begin;
	static constexpr uint32_t max_scalar = 0x10FFFF;

	static constexpr bool exact_size = true;

	static std::optional<size_t> stepsBetween(char32_t start, char32_t end)
	{
		uint32_t s = start;
		uint32_t e = end;
		if(e < s)
			return std::nullopt;
		uint32_t count = e - s;
		if(s < surrogate_begin && e >= surrogate_end)
			count -= surrogate_size;
		return size_t(count);
	}

	static std::optional<char32_t> forwardChecked(char32_t start, size_t n)
	{
		if(n > max_scalar)
			return std::nullopt;
		uint64_t s = uint32_t(start);
		uint64_t res = s + n;
		if(s < surrogate_begin && res >= surrogate_begin)
			res += surrogate_size;
		if(res > max_scalar)
			return std::nullopt;
		return char32_t(res);
	}

	static std::optional<char32_t> backwardChecked(char32_t start, size_t n)
	{
		uint32_t s = start;
		if(n > s)
			return std::nullopt;
		uint32_t res = s - uint32_t(n);
		if(s >= surrogate_end && res < surrogate_end) {
			if(res < surrogate_size)
				return std::nullopt;
			res -= surrogate_size;
		}
		return char32_t(res);
	}

	static char32_t forward(char32_t start, size_t n)
	{
		if(auto res = forwardChecked(start, n))
			return *res;
		detail::stepOverflow("char32_t", "forward", n);
	}

	static char32_t backward(char32_t start, size_t n)
	{
		if(auto res = backwardChecked(start, n))
			return *res;
		detail::stepOverflow("char32_t", "backward", n);
	}

	static char32_t forwardUnchecked(char32_t start, size_t n)
	{
		auto res = forwardChecked(start, n);
		assert(res.has_value());
		return *res;
	}

	static char32_t backwardUnchecked(char32_t start, size_t n)
	{
		auto res = backwardChecked(start, n);
		assert(res.has_value());
		return *res;
	}
};

}
