#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "Error.hpp"

namespace ex
{

enum class BoundKind
{
	Included,
	Excluded,
	Unbounded
};

inline std::string to_string(BoundKind kind)
{
	if(kind == BoundKind::Included)
		return "Included";
	else if(kind == BoundKind::Excluded)
		return "Excluded";
	return "Unbounded";
}

// One end of a range. Bounds refer to the endpoint stored in the range, they do not copy it.
// So a Bound is only valid as long as the range it came from.
template <typename T>
class Bound
{
public:
	Bound() = default;

	static Bound included(const T& value) { return Bound(BoundKind::Included, &value); }
	static Bound excluded(const T& value) { return Bound(BoundKind::Excluded, &value); }
	static Bound unbounded() { return Bound(); }

	BoundKind kind() const { return kind_; }
	bool isIncluded() const { return kind_ == BoundKind::Included; }
	bool isExcluded() const { return kind_ == BoundKind::Excluded; }
	bool isUnbounded() const { return kind_ == BoundKind::Unbounded; }

	const T& value() const
	{
		ex_check(value_ != nullptr, "Cannot get the value of an unbounded Bound");
		return *value_;
	}

	bool operator== (const Bound& other) const
	{
		if(kind_ != other.kind_)
			return false;
		if(kind_ == BoundKind::Unbounded)
			return true;
		return *value_ == *other.value_;
	}

	bool operator!= (const Bound& other) const { return !(*this == other); }

protected:
	Bound(BoundKind kind, const T* value) : kind_(kind), value_(value) {}

	BoundKind kind_ = BoundKind::Unbounded;
	const T* value_ = nullptr;
};

template <typename T>
inline std::ostream& operator<< (std::ostream& os, const Bound<T>& b)
{
	os << to_string(b.kind());
	if(b.isUnbounded() == false)
		os << "(" << b.value() << ")";
	return os;
}

template <typename T>
inline std::string to_string(const Bound<T>& b)
{
	std::stringstream ss;
	ss << b;
	return ss.str();
}

// Anything with startBound() and endBound() can be used by the bound-generic algorithms below
template <typename R, typename = void>
struct is_range_bounds : std::false_type {};

template <typename R>
struct is_range_bounds<R
	, std::void_t<decltype(std::declval<const R&>().startBound())
		, decltype(std::declval<const R&>().endBound())>> : std::true_type {};

template <typename R>
constexpr bool is_range_bounds_v = is_range_bounds<R>::value;

// Checks whether item lies within the range, using nothing but its bounds
template <typename R, typename U>
inline bool contains(const R& range, const U& item)
{
	static_assert(is_range_bounds_v<R>, "contains() requires startBound() and endBound()");
	const auto start = range.startBound();
	const auto end = range.endBound();

	bool after_start = true;
	if(start.isIncluded())
		after_start = !(item < start.value());
	else if(start.isExcluded())
		after_start = start.value() < item;

	bool before_end = true;
	if(end.isIncluded())
		before_end = !(end.value() < item);
	else if(end.isExcluded())
		before_end = item < end.value();

	return after_start && before_end;
}

}
