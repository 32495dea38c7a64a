#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "Index.hpp"
#include "Error.hpp"
#include "TypeHelpers.hpp"

namespace ex
{

// Borrowed view over contiguous elements. Slice<const T> for read-only access.
// A Slice never owns its elements; it's only valid while the viewed sequence lives
template <typename T>
class Slice
{
public:
	using element_type = T;
	using value_type = std::remove_cv_t<T>;
	using size_type = size_t;
	using iterator = T*;
	using reference = T&;

	Slice() = default;
	Slice(T* data, size_t size) : data_(data), size_(size) {}

	template <size_t N>
	Slice(T (&arr)[N]) : data_(arr), size_(N) {}

	// Any contiguous container with data() and size(): std::vector, std::array, std::string ...
	template <typename Container, typename = std::enable_if_t<is_container_v<Container&>
		&& !is_specialization_v<std::remove_cv_t<Container>, ex::Slice>
		&& std::is_convertible_v<decltype(std::declval<Container&>().data()), T*>>>
	Slice(Container& c) : data_(c.data()), size_(c.size()) {}

	// Slice<T> -> Slice<const T>
	template <typename U, typename = std::enable_if_t<std::is_same_v<const U, T> && !std::is_same_v<U, T>>>
	Slice(const Slice<U>& other) : data_(other.data()), size_(other.size()) {}

	T* data() const { return data_; }
	size_t size() const { return size_; }
	bool empty() const { return size_ == 0; }

	iterator begin() const { return data_; }
	iterator end() const { return data_ + size_; }

	T& operator[] (size_t idx) const
	{
		if(idx >= size_)
			throw IndexError("index out of bounds: the len is " + std::to_string(size_) + " but the index is " + std::to_string(idx));
		return data_[idx];
	}

	// The exclusive ranges. (1, ...) on {0,1,2,3,4} gives {2,3,4}, (1, 3] gives {2,3} and (1, 3) gives {2}
	template <typename R, typename = std::enable_if_t<is_index_range_v<R>>>
	Slice operator[] (const R& r) const
	{
		auto [from, to] = toSliceRange(r, size_);
		return subslice(from, to);
	}

	// Elements in [begin, end)
	Slice subslice(size_t begin, size_t end) const
	{
		checkSliceRange(begin, end, size_);
		return Slice(data_ + begin, end - begin);
	}

	std::vector<value_type> toVector() const
	{
		return std::vector<value_type>(begin(), end());
	}

	template <typename U>
	bool operator== (const Slice<U>& other) const
	{
		if(size() != other.size())
			return false;
		for(size_t i=0;i<size();i++) {
			if(data_[i] != other.data()[i])
				return false;
		}
		return true;
	}

	template <typename U>
	bool operator!= (const Slice<U>& other) const { return !(*this == other); }

protected:
	T* data_ = nullptr;
	size_t size_ = 0;
};

template <typename T, size_t N> Slice(T (&)[N]) -> Slice<T>;

template <typename T>
inline std::ostream& operator<< (std::ostream& os, const Slice<T>& s)
{
	os << "{";
	for(size_t i=0;i<s.size();i++)
		os << s.data()[i] << (i == s.size()-1 ? "" : ", ");
	os << "}";
	return os;
}

// Indexing every kind of sequence with an exclusive range. Owned sequences
// give a view into themselves; they delegate to the Slice and string_view versions
template <typename T, typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<T> slice(Slice<T> s, const R& r) { return s[r]; }

template <typename T, size_t N, typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<T> slice(T (&arr)[N], const R& r) { return Slice<T>(arr)[r]; }

template <typename T, size_t N, typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<T> slice(std::array<T, N>& arr, const R& r) { return Slice<T>(arr.data(), N)[r]; }

template <typename T, size_t N, typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<const T> slice(const std::array<T, N>& arr, const R& r) { return Slice<const T>(arr.data(), N)[r]; }

template <typename T, typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<T> slice(std::vector<T>& vec, const R& r) { return Slice<T>(vec.data(), vec.size())[r]; }

template <typename T, typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<const T> slice(const std::vector<T>& vec, const R& r) { return Slice<const T>(vec.data(), vec.size())[r]; }

template <typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline std::string_view slice(std::string_view str, const R& r)
{
	auto [from, to] = toSliceRange(r, str.size());
	return strSlice(str, from, to);
}

template <typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline std::string_view slice(const std::string& str, const R& r) { return slice(std::string_view(str), r); }

// A view into a temporary would dangle once the full expression ends
template <typename T, size_t N, typename R>
Slice<const T> slice(const std::array<T, N>&&, const R&) = delete;

template <typename T, typename R>
Slice<const T> slice(const std::vector<T>&&, const R&) = delete;

template <typename R>
std::string_view slice(const std::string&&, const R&) = delete;

template <typename R, typename = std::enable_if_t<is_index_range_v<R>>>
inline Slice<char> slice(std::string& str, const R& r)
{
	std::string_view sub = slice(std::string_view(str), r);
	return Slice<char>(str.data() + (sub.data() - str.data()), sub.size());
}

}
