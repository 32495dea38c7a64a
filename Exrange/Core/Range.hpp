#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "Bound.hpp"
#include "Error.hpp"
#include "Step.hpp"
#include "TypeHelpers.hpp"

namespace ex
{

// Lower and (if known) upper estimate of the remaining number of elements
struct SizeHint
{
	size_t lower = 0;
	std::optional<size_t> upper;

	bool operator== (const SizeHint& other) const { return lower == other.lower && upper == other.upper; }
	bool operator!= (const SizeHint& other) const { return !(*this == other); }
};

inline std::ostream& operator<< (std::ostream& os, const SizeHint& h)
{
	os << "(" << h.lower << ", ";
	if(h.upper.has_value())
		os << h.upper.value();
	else
		os << "None";
	os << ")";
	return os;
}

// Input iterator over a range that is also its own cursor. Every increment calls next()
// (or nextBack() when Reverse) on the range, so iterating consumes the range.
template <typename R, bool Reverse = false>
class Cursor
{
public:
	// Iterator properties
	using iterator_category = std::input_iterator_tag;
	using value_type = typename R::value_type;
	using difference_type = std::ptrdiff_t;
	using pointer = const value_type*;
	using reference = const value_type&;

	Cursor() = default;
	explicit Cursor(R* range) : range_(range) { advance(); }

	reference operator*() const
	{
		ex_assert(current_.has_value(), "Dereferencing an exhausted Cursor");
		return *current_;
	}
	pointer operator->() const { return &operator*(); }
	Cursor& operator++() { advance(); return *this; }
	Cursor operator++(int) { Cursor retval = *this; advance(); return retval; }

	// All exhausted cursors compare equal to each other (and to the end cursor)
	bool operator==(const Cursor& rhs) const
	{
		if(current_.has_value() != rhs.current_.has_value())
			return false;
		return current_.has_value() == false || range_ == rhs.range_;
	}
	bool operator!=(const Cursor& rhs) const { return !(*this == rhs); }

protected:
	void advance()
	{
		if(range_ == nullptr)
			return;
		if constexpr(Reverse)
			current_ = range_->nextBack();
		else
			current_ = range_->next();
	}

	R* range_ = nullptr;
	std::optional<value_type> current_;
};

// A range only bounded exclusively below. Contains all values with x > start.
// Iterating steps start forward with Step<Idx>::forward(), which throws ExError once
// the type's maximum would be exceeded. That happens in the call after the one yielding
// the maximum value.
template <typename Idx>
struct RangeFromExclusive
{
	using value_type = Idx;
	using bound_type = std::remove_cv_t<unwrap_reference_t<Idx>>;

	// The lower bound of the range (exclusive)
	Idx start;

	Bound<bound_type> startBound() const { return Bound<bound_type>::excluded(unwrapRef(start)); }
	Bound<bound_type> endBound() const { return Bound<bound_type>::unbounded(); }

	template <typename U>
	bool contains(const U& item) const { return ex::contains(*this, item); }

	// Iteration. Never runs out of values
	std::optional<Idx> next()
	{
		start = Step<Idx>::forward(start, 1);
		return start;
	}

	SizeHint sizeHint() const { return {std::numeric_limits<size_t>::max(), std::nullopt}; }

	std::optional<Idx> nth(size_t n)
	{
		// Two jumps so n+1 can't overflow size_t
		start = Step<Idx>::forward(Step<Idx>::forward(start, n), 1);
		return start;
	}

	// The sequence is increasing, the first value is the smallest
	std::optional<Idx> min() const
	{
		RangeFromExclusive r = *this;
		return r.next();
	}

	using iterator = Cursor<RangeFromExclusive>;
};

// A range bounded exclusively below and inclusively above. Contains all values with
// start < x <= end. It is empty unless start < end.
template <typename Idx>
struct RangeFromExclusiveToInclusive
{
	using value_type = Idx;
	using bound_type = std::remove_cv_t<unwrap_reference_t<Idx>>;

	// The lower bound of the range (exclusive)
	Idx start;
	// The upper bound of the range (inclusive)
	Idx end;

	Bound<bound_type> startBound() const { return Bound<bound_type>::excluded(unwrapRef(start)); }
	Bound<bound_type> endBound() const { return Bound<bound_type>::included(unwrapRef(end)); }

	template <typename U>
	bool contains(const U& item) const { return ex::contains(*this, item); }

	bool isEmpty() const { return !(start < end); }

	std::optional<Idx> next()
	{
		if(start < end) {
			// start < end, so stepping forward by one can't overflow
			start = Step<Idx>::forwardUnchecked(start, 1);
			return start;
		}
		return std::nullopt;
	}

	std::optional<Idx> nextBack()
	{
		if(start < end) {
			Idx n = Step<Idx>::backwardUnchecked(end, 1);
			return std::exchange(end, n);
		}
		return std::nullopt;
	}

	SizeHint sizeHint() const
	{
		if(start < end) {
			auto hint = Step<Idx>::stepsBetween(start, end);
			return {hint.value_or(std::numeric_limits<size_t>::max()), hint};
		}
		return {0, 0};
	}

	std::optional<Idx> nth(size_t n)
	{
		// Also covers start > end. Such a range is left as is rather than clamped to start = end
		if(isEmpty())
			return std::nullopt;

		auto plus_n = Step<Idx>::forwardChecked(start, n);
		if(plus_n.has_value() && plus_n.value() < end) {
			start = Step<Idx>::forwardUnchecked(plus_n.value(), 1);
			return start;
		}

		// Overshot. Leave the range exhausted instead of past the end
		start = end;
		return std::nullopt;
	}

	std::optional<Idx> nthBack(size_t n)
	{
		if(isEmpty())
			return std::nullopt;

		auto minus_n = Step<Idx>::backwardChecked(end, n);
		if(minus_n.has_value() && start < minus_n.value()) {
			end = Step<Idx>::backwardUnchecked(minus_n.value(), 1);
			return minus_n;
		}

		end = start;
		return std::nullopt;
	}

	std::optional<Idx> last() const { RangeFromExclusiveToInclusive r = *this; return r.nextBack(); }
	std::optional<Idx> min() const { RangeFromExclusiveToInclusive r = *this; return r.next(); }
	std::optional<Idx> max() const { RangeFromExclusiveToInclusive r = *this; return r.nextBack(); }

	size_t len() const
	{
		static_assert(Step<Idx>::exact_size, "len() needs a type whose step count always fits in size_t");
		if(start < end)
			return Step<Idx>::stepsBetween(start, end).value();
		return 0;
	}

	using iterator = Cursor<RangeFromExclusiveToInclusive>;
	using reverse_iterator = Cursor<RangeFromExclusiveToInclusive, true>;
	reverse_iterator rbegin() { return reverse_iterator(this); }
	reverse_iterator rend() { return reverse_iterator(); }
};

// A range bounded exclusively below and above. Contains all values with start < x < end.
// It is empty unless at least two steps separate start and end.
template <typename Idx>
struct RangeFromExclusiveToExclusive
{
	using value_type = Idx;
	using bound_type = std::remove_cv_t<unwrap_reference_t<Idx>>;

	// The lower bound of the range (exclusive)
	Idx start;
	// The upper bound of the range (exclusive)
	Idx end;

	Bound<bound_type> startBound() const { return Bound<bound_type>::excluded(unwrapRef(start)); }
	Bound<bound_type> endBound() const { return Bound<bound_type>::excluded(unwrapRef(end)); }

	template <typename U>
	bool contains(const U& item) const { return ex::contains(*this, item); }

	bool isEmpty() const { return !hasInterior(start, end); }

	std::optional<Idx> next()
	{
		if(hasInterior(start, end)) {
			start = Step<Idx>::forwardUnchecked(start, 1);
			return start;
		}
		return std::nullopt;
	}

	std::optional<Idx> nextBack()
	{
		if(hasInterior(start, end)) {
			end = Step<Idx>::backwardUnchecked(end, 1);
			return end;
		}
		return std::nullopt;
	}

	SizeHint sizeHint() const
	{
		if(auto hint = Step<Idx>::stepsBetween(start, end)) {
			if(hint.value() > 1)
				return {hint.value() - 1, hint.value() - 1};
			return {0, 0};
		}
		if(!(start < end))
			return {0, 0};
		return {std::numeric_limits<size_t>::max(), std::nullopt};
	}

	std::optional<Idx> nth(size_t n)
	{
		if(isEmpty())
			return std::nullopt;

		auto plus_n = Step<Idx>::forwardChecked(start, n);
		if(plus_n.has_value() && hasInterior(plus_n.value(), end)) {
			start = Step<Idx>::forwardUnchecked(plus_n.value(), 1);
			return start;
		}

		// Overshot. At least two steps separated start and end, so end can step back
		start = Step<Idx>::backwardUnchecked(end, 1);
		return std::nullopt;
	}

	std::optional<Idx> nthBack(size_t n)
	{
		if(isEmpty())
			return std::nullopt;

		auto minus_n = Step<Idx>::backwardChecked(end, n);
		if(minus_n.has_value() && hasInterior(start, minus_n.value())) {
			end = Step<Idx>::backwardUnchecked(minus_n.value(), 1);
			return end;
		}

		end = Step<Idx>::forwardUnchecked(start, 1);
		return std::nullopt;
	}

	std::optional<Idx> last() const { RangeFromExclusiveToExclusive r = *this; return r.nextBack(); }
	std::optional<Idx> min() const { RangeFromExclusiveToExclusive r = *this; return r.next(); }
	std::optional<Idx> max() const { RangeFromExclusiveToExclusive r = *this; return r.nextBack(); }

	size_t len() const
	{
		static_assert(Step<Idx>::exact_size, "len() needs a type whose step count always fits in size_t");
		if(start < end)
			return Step<Idx>::stepsBetween(start, end).value() - 1;
		return 0;
	}

	using iterator = Cursor<RangeFromExclusiveToExclusive>;
	using reverse_iterator = Cursor<RangeFromExclusiveToExclusive, true>;
	reverse_iterator rbegin() { return reverse_iterator(this); }
	reverse_iterator rend() { return reverse_iterator(); }

protected:
	// True if some value lies strictly between a and b. A step count too large for
	// size_t still counts as more than one step
	static bool hasInterior(const Idx& a, const Idx& b)
	{
		if(auto steps = Step<Idx>::stepsBetween(a, b))
			return steps.value() > 1;
		return a < b;
	}
};

template <typename T> RangeFromExclusive(T) -> RangeFromExclusive<T>;
template <typename T> RangeFromExclusiveToInclusive(T, T) -> RangeFromExclusiveToInclusive<T>;
template <typename T> RangeFromExclusiveToExclusive(T, T) -> RangeFromExclusiveToExclusive<T>;

template <typename R>
struct is_exclusive_range : std::bool_constant<is_specialization_v<R, RangeFromExclusive>
	|| is_specialization_v<R, RangeFromExclusiveToInclusive>
	|| is_specialization_v<R, RangeFromExclusiveToExclusive>> {};

template <typename R>
constexpr bool is_exclusive_range_v = is_exclusive_range<std::decay_t<R>>::value;

template <typename T>
inline RangeFromExclusive<T> fromExclusive(T start)
{
	return {start};
}

template <typename T>
inline RangeFromExclusiveToInclusive<T> fromExclusiveToInclusive(T start, T end)
{
	return {start, end};
}

template <typename T>
inline RangeFromExclusiveToExclusive<T> fromExclusiveToExclusive(T start, T end)
{
	return {start, end};
}

// Range-for support. These are free functions because the bounded ranges have a data member
// named end. Iterating consumes the range
template <typename R, typename = std::enable_if_t<is_exclusive_range_v<R> && !std::is_const_v<R>>>
inline typename R::iterator begin(R& r) { return typename R::iterator(&r); }

template <typename R, typename = std::enable_if_t<is_exclusive_range_v<R> && !std::is_const_v<R>>>
inline typename R::iterator end(R&) { return typename R::iterator(); }

// Comparsion
template <typename T>
inline bool operator== (const RangeFromExclusive<T>& a, const RangeFromExclusive<T>& b) { return a.start == b.start; }
template <typename T>
inline bool operator!= (const RangeFromExclusive<T>& a, const RangeFromExclusive<T>& b) { return !(a == b); }
template <typename T>
inline bool operator< (const RangeFromExclusive<T>& a, const RangeFromExclusive<T>& b) { return a.start < b.start; }

template <typename T>
inline bool operator== (const RangeFromExclusiveToInclusive<T>& a, const RangeFromExclusiveToInclusive<T>& b)
{
	return a.start == b.start && a.end == b.end;
}
template <typename T>
inline bool operator!= (const RangeFromExclusiveToInclusive<T>& a, const RangeFromExclusiveToInclusive<T>& b) { return !(a == b); }
template <typename T>
inline bool operator< (const RangeFromExclusiveToInclusive<T>& a, const RangeFromExclusiveToInclusive<T>& b)
{
	if(a.start < b.start)
		return true;
	if(b.start < a.start)
		return false;
	return a.end < b.end;
}

template <typename T>
inline bool operator== (const RangeFromExclusiveToExclusive<T>& a, const RangeFromExclusiveToExclusive<T>& b)
{
	return a.start == b.start && a.end == b.end;
}
template <typename T>
inline bool operator!= (const RangeFromExclusiveToExclusive<T>& a, const RangeFromExclusiveToExclusive<T>& b) { return !(a == b); }
template <typename T>
inline bool operator< (const RangeFromExclusiveToExclusive<T>& a, const RangeFromExclusiveToExclusive<T>& b)
{
	if(a.start < b.start)
		return true;
	if(b.start < a.start)
		return false;
	return a.end < b.end;
}

// Printing. (1, ...) (1, 3] and (1, 3)
template <typename T>
inline std::ostream& operator<< (std::ostream& os, const RangeFromExclusive<T>& r)
{
	os << "(" << unwrapRef(r.start) << ", ...)";
	return os;
}

template <typename T>
inline std::ostream& operator<< (std::ostream& os, const RangeFromExclusiveToInclusive<T>& r)
{
	os << "(" << unwrapRef(r.start) << ", " << unwrapRef(r.end) << "]";
	return os;
}

template <typename T>
inline std::ostream& operator<< (std::ostream& os, const RangeFromExclusiveToExclusive<T>& r)
{
	os << "(" << unwrapRef(r.start) << ", " << unwrapRef(r.end) << ")";
	return os;
}

template <typename R, typename = std::enable_if_t<is_exclusive_range_v<R>>>
inline std::string to_string(const R& r)
{
	std::stringstream ss;
	ss << r;
	return ss.str();
}

namespace detail
{

inline size_t hashCombine(size_t seed, size_t v)
{
	return seed ^ (v + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

}

}

namespace std
{

template <typename T>
struct hash<ex::RangeFromExclusive<T>>
{
	size_t operator()(const ex::RangeFromExclusive<T>& r) const
	{
		return hash<T>()(r.start);
	}
};

template <typename T>
struct hash<ex::RangeFromExclusiveToInclusive<T>>
{
	size_t operator()(const ex::RangeFromExclusiveToInclusive<T>& r) const
	{
		return ex::detail::hashCombine(hash<T>()(r.start), hash<T>()(r.end));
	}
};

template <typename T>
struct hash<ex::RangeFromExclusiveToExclusive<T>>
{
	size_t operator()(const ex::RangeFromExclusiveToExclusive<T>& r) const
	{
		return ex::detail::hashCombine(hash<T>()(r.start), hash<T>()(r.end));
	}
};

}
