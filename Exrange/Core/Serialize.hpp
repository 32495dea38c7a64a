#pragma once

#include <array>
#include <cstring>
#include <fstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/archives/portable_binary.hpp>

#include "Range.hpp"
#include "Error.hpp"

#include "Exrange_export.h"

namespace ex
{

namespace detail
{

// Error messages for malformed records
std::string EXRANGE_EXPORT missingField(const std::string& field);
std::string EXRANGE_EXPORT duplicateField(const std::string& field);
std::string EXRANGE_EXPORT unknownField(const std::string& field, const std::vector<std::string>& expected);
std::string EXRANGE_EXPORT invalidLength(size_t length, const std::string& expected);

// true if the path ends in .json (case insensitive)
bool EXRANGE_EXPORT isJsonPath(const std::string& path);

template <typename R>
struct RecordTraits;

template <typename Idx>
struct RecordTraits<RangeFromExclusive<Idx>>
{
	static constexpr const char* name = "RangeFromExclusive";
	static constexpr std::array<const char*, 1> fields = {"start"};
	static auto tie(RangeFromExclusive<Idx>& r) { return std::tie(r.start); }
};

template <typename Idx>
struct RecordTraits<RangeFromExclusiveToInclusive<Idx>>
{
	static constexpr const char* name = "RangeFromExclusiveToInclusive";
	static constexpr std::array<const char*, 2> fields = {"start", "end"};
	static auto tie(RangeFromExclusiveToInclusive<Idx>& r) { return std::tie(r.start, r.end); }
};

template <typename Idx>
struct RecordTraits<RangeFromExclusiveToExclusive<Idx>>
{
	static constexpr const char* name = "RangeFromExclusiveToExclusive";
	static constexpr std::array<const char*, 2> fields = {"start", "end"};
	static auto tie(RangeFromExclusiveToExclusive<Idx>& r) { return std::tie(r.start, r.end); }
};

template <typename Archive, typename Tuple, size_t... I>
void loadField(Archive& archive, Tuple& fields, size_t idx, std::index_sequence<I...>)
{
	((idx == I ? (void)archive(std::get<I>(fields)) : (void)0), ...);
}

// JSON accepts the object form {"start": 1, "end": 3} with keys in any order, as well as
// the array form [1, 3]. Both are checked field by field and reported as DecodeError
template <typename R>
void loadRecord(cereal::JSONInputArchive& archive, R& r)
{
	using Traits = RecordTraits<R>;
	constexpr size_t num_fields = Traits::fields.size();
	auto fields = Traits::tie(r);

	if(archive.getNodeName() == nullptr) {
		cereal::size_type size = 0;
		try {
			archive(cereal::make_size_tag(size));
		}
		catch(const cereal::RapidJSONException&) {
			// Not an array. An object without members
			throw DecodeError(missingField(Traits::fields[0]));
		}

		if(size < num_fields)
			throw DecodeError(invalidLength(size, "struct " + std::string(Traits::name)));
		if(size > num_fields)
			throw DecodeError(invalidLength(size, "fewer elements in array"));
		std::apply([&archive](auto&... f) { archive(f...); }, fields);
		return;
	}

	std::array<bool, num_fields> seen = {};
	while(const char* key = archive.getNodeName()) {
		size_t idx = num_fields;
		for(size_t i=0;i<num_fields;i++) {
			if(std::strcmp(key, Traits::fields[i]) == 0)
				idx = i;
		}

		if(idx == num_fields)
			throw DecodeError(unknownField(key, std::vector<std::string>(Traits::fields.begin(), Traits::fields.end())));
		if(seen[idx])
			throw DecodeError(duplicateField(Traits::fields[idx]));
		seen[idx] = true;
		loadField(archive, fields, idx, std::make_index_sequence<num_fields>{});
	}

	for(size_t i=0;i<num_fields;i++) {
		if(seen[i] == false)
			throw DecodeError(missingField(Traits::fields[i]));
	}
}

}

// Saves to a file, as JSON if the path ends in .json and portable binary otherwise
template <typename R, typename = std::enable_if_t<is_exclusive_range_v<R>>>
void save(const R& r, const std::string& path)
{
	std::ofstream out(path, std::ios::binary);
	if(out.is_open() == false)
		throw ExError("Cannot open " + path + " for writing");

	if(detail::isJsonPath(path)) {
		cereal::JSONOutputArchive ar(out);
		ar(r);
	}
	else {
		cereal::PortableBinaryOutputArchive ar(out);
		ar(r);
	}
}

template <typename R, typename = std::enable_if_t<is_exclusive_range_v<R>>>
R load(const std::string& path)
{
	std::ifstream in(path, std::ios::binary);
	if(in.is_open() == false)
		throw ExError("Cannot open " + path + " for reading");

	R r{};
	if(detail::isJsonPath(path)) {
		cereal::JSONInputArchive ar(in);
		ar(r);
	}
	else {
		cereal::PortableBinaryInputArchive ar(in);
		ar(r);
	}
	return r;
}

}

namespace cereal
{

template <class Archive, typename Idx>
void save(Archive& archive, const ex::RangeFromExclusive<Idx>& r)
{
	archive(make_nvp("start", r.start));
}

template <class Archive, typename Idx>
void load(Archive& archive, ex::RangeFromExclusive<Idx>& r)
{
	if constexpr(std::is_same_v<Archive, JSONInputArchive>)
		ex::detail::loadRecord(archive, r);
	else
		archive(make_nvp("start", r.start));
}

template <class Archive, typename Idx>
void save(Archive& archive, const ex::RangeFromExclusiveToInclusive<Idx>& r)
{
	archive(make_nvp("start", r.start));
	archive(make_nvp("end", r.end));
}

template <class Archive, typename Idx>
void load(Archive& archive, ex::RangeFromExclusiveToInclusive<Idx>& r)
{
	if constexpr(std::is_same_v<Archive, JSONInputArchive>)
		ex::detail::loadRecord(archive, r);
	else {
		archive(make_nvp("start", r.start));
		archive(make_nvp("end", r.end));
	}
}

template <class Archive, typename Idx>
void save(Archive& archive, const ex::RangeFromExclusiveToExclusive<Idx>& r)
{
	archive(make_nvp("start", r.start));
	archive(make_nvp("end", r.end));
}

template <class Archive, typename Idx>
void load(Archive& archive, ex::RangeFromExclusiveToExclusive<Idx>& r)
{
	if constexpr(std::is_same_v<Archive, JSONInputArchive>)
		ex::detail::loadRecord(archive, r);
	else {
		archive(make_nvp("start", r.start));
		archive(make_nvp("end", r.end));
	}
}

}
