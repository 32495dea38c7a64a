#include <catch2/catch.hpp>

#include <Exrange/Exrange.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <unordered_set>
#include <vector>

using namespace ex;

template <typename R>
static std::vector<typename R::value_type> collect(R r)
{
	std::vector<typename R::value_type> res;
	for(auto v : r)
		res.push_back(v);
	return res;
}

template <typename R>
static std::vector<typename R::value_type> collectBack(R r)
{
	return std::vector<typename R::value_type>(r.rbegin(), r.rend());
}

TEST_CASE("Range construction", "[Range]")
{
	SECTION("Aggregate and deduction") {
		RangeFromExclusive a{1};
		RangeFromExclusiveToInclusive b{1, 3};
		RangeFromExclusiveToExclusive c{1, 3};

		STATIC_REQUIRE(std::is_same_v<decltype(a), RangeFromExclusive<int>>);
		STATIC_REQUIRE(std::is_same_v<decltype(b), RangeFromExclusiveToInclusive<int>>);
		STATIC_REQUIRE(std::is_same_v<decltype(c), RangeFromExclusiveToExclusive<int>>);
		CHECK(a.start == 1);
		CHECK(b.start == 1);
		CHECK(b.end == 3);
		CHECK(c.end == 3);
	}

	SECTION("Factories") {
		CHECK(fromExclusive(5) == RangeFromExclusive<int>{5});
		CHECK(fromExclusiveToInclusive(1, 3) == RangeFromExclusiveToInclusive<int>{1, 3});
		CHECK(fromExclusiveToExclusive(uint8_t(1), uint8_t(3)) == RangeFromExclusiveToExclusive<uint8_t>{1, 3});
	}

	SECTION("Traits") {
		STATIC_REQUIRE(is_exclusive_range_v<RangeFromExclusive<int>>);
		STATIC_REQUIRE(is_exclusive_range_v<const RangeFromExclusiveToExclusive<char32_t>&>);
		STATIC_REQUIRE(is_exclusive_range_v<int> == false);
		STATIC_REQUIRE(is_range_bounds_v<RangeFromExclusiveToInclusive<int>>);
		STATIC_REQUIRE(is_range_bounds_v<std::vector<int>> == false);
	}
}

TEST_CASE("Range comparsion and hashing", "[Range]")
{
	SECTION("Equality") {
		CHECK(RangeFromExclusive<int>{1} == RangeFromExclusive<int>{1});
		CHECK(RangeFromExclusive<int>{1} != RangeFromExclusive<int>{2});
		CHECK(RangeFromExclusiveToInclusive<int>{1, 3} == RangeFromExclusiveToInclusive<int>{1, 3});
		CHECK(RangeFromExclusiveToInclusive<int>{1, 3} != RangeFromExclusiveToInclusive<int>{1, 4});
		CHECK(RangeFromExclusiveToExclusive<int>{1, 3} != RangeFromExclusiveToExclusive<int>{0, 3});
	}

	SECTION("Ordering is lexicographic over (start, end)") {
		CHECK(RangeFromExclusive<int>{1} < RangeFromExclusive<int>{2});
		CHECK(RangeFromExclusiveToInclusive<int>{1, 9} < RangeFromExclusiveToInclusive<int>{2, 0});
		CHECK(RangeFromExclusiveToInclusive<int>{1, 3} < RangeFromExclusiveToInclusive<int>{1, 4});
		CHECK_FALSE(RangeFromExclusiveToExclusive<int>{1, 3} < RangeFromExclusiveToExclusive<int>{1, 3});
	}

	SECTION("Hash") {
		std::unordered_set<RangeFromExclusiveToExclusive<int>> set;
		set.insert({1, 3});
		set.insert({1, 3});
		set.insert({3, 1});
		CHECK(set.size() == 2);
		CHECK(set.count({3, 1}) == 1);

		std::hash<RangeFromExclusive<int>> h;
		CHECK(h(RangeFromExclusive<int>{7}) == h(RangeFromExclusive<int>{7}));
	}

	SECTION("Printing") {
		CHECK(ex::to_string(RangeFromExclusive<int>{1}) == "(1, ...)");
		CHECK(ex::to_string(RangeFromExclusiveToInclusive<int>{1, 3}) == "(1, 3]");
		CHECK(ex::to_string(RangeFromExclusiveToExclusive<int>{-1, 3}) == "(-1, 3)");
	}
}

TEST_CASE("Bounds", "[Bound]")
{
	int one = 1;
	int three = 3;

	SECTION("RangeFromExclusive") {
		RangeFromExclusive<int> r{1};
		CHECK(r.startBound() == Bound<int>::excluded(one));
		CHECK(r.endBound() == Bound<int>::unbounded());
		CHECK(r.startBound().kind() == BoundKind::Excluded);
		CHECK(r.endBound().isUnbounded());
		CHECK_THROWS_AS(r.endBound().value(), ExError);
		CHECK_THROWS_WITH(r.endBound().value(), "Cannot get the value of an unbounded Bound");
	}

	SECTION("RangeFromExclusiveToInclusive") {
		RangeFromExclusiveToInclusive<int> r{1, 3};
		CHECK(r.startBound() == Bound<int>::excluded(one));
		CHECK(r.endBound() == Bound<int>::included(three));
		CHECK(r.endBound() != Bound<int>::excluded(three));
		CHECK(r.endBound().value() == 3);
	}

	SECTION("RangeFromExclusiveToExclusive") {
		RangeFromExclusiveToExclusive<int> r{1, 3};
		CHECK(r.startBound().isExcluded());
		CHECK(r.endBound().isExcluded());
		CHECK(r.endBound().value() == 3);
	}

	SECTION("Bounds refer to the stored endpoints") {
		RangeFromExclusiveToInclusive<int> r{1, 3};
		CHECK(&r.startBound().value() == &r.start);
		CHECK(&r.endBound().value() == &r.end);
	}

	SECTION("Borrowed endpoints") {
		RangeFromExclusiveToInclusive<std::reference_wrapper<int>> r{std::ref(one), std::ref(three)};
		STATIC_REQUIRE(std::is_same_v<decltype(r)::bound_type, int>);
		CHECK(&r.startBound().value() == &one);
		CHECK(&r.endBound().value() == &three);
		CHECK(r.contains(2));

		RangeFromExclusive<std::reference_wrapper<const int>> q{std::cref(one)};
		STATIC_REQUIRE(std::is_same_v<decltype(q)::bound_type, int>);
		CHECK(q.startBound().value() == 1);
	}

	SECTION("Printing") {
		RangeFromExclusiveToInclusive<int> r{1, 3};
		CHECK(ex::to_string(r.startBound()) == "Excluded(1)");
		CHECK(ex::to_string(r.endBound()) == "Included(3)");
		CHECK(ex::to_string(RangeFromExclusive<int>{1}.endBound()) == "Unbounded");
		CHECK(ex::to_string(BoundKind::Included) == "Included");
	}
}

TEST_CASE("Membership", "[Bound]")
{
	SECTION("RangeFromExclusive") {
		RangeFromExclusive<int> r{1};
		CHECK(r.contains(1) == false);
		CHECK(r.contains(2));
		CHECK(r.contains(std::numeric_limits<int>::max()));
		CHECK(r.contains(1.5));
	}

	SECTION("RangeFromExclusiveToInclusive") {
		RangeFromExclusiveToInclusive<int> r{1, 3};
		CHECK(r.contains(1) == false);
		CHECK(r.contains(2));
		CHECK(r.contains(3));
		CHECK(r.contains(4) == false);
		CHECK(RangeFromExclusiveToInclusive<int>{3, 1}.contains(2) == false);
	}

	SECTION("RangeFromExclusiveToExclusive") {
		RangeFromExclusiveToExclusive<int> r{1, 3};
		CHECK(r.contains(1) == false);
		CHECK(r.contains(2));
		CHECK(r.contains(3) == false);
		CHECK(ex::contains(r, 2));
	}
}

TEST_CASE("RangeFromExclusive iteration", "[Iteration]")
{
	SECTION("next") {
		RangeFromExclusive<int> r{1};
		CHECK(r.next() == 2);
		CHECK(r.next() == 3);
		CHECK(r.start == 3);
	}

	SECTION("nth") {
		RangeFromExclusive<int> r{1};
		CHECK(r.nth(0) == 2);
		CHECK(r.nth(3) == 6);
		CHECK(r.start == 6);
	}

	SECTION("sizeHint and min") {
		RangeFromExclusive<int> r{1};
		CHECK(r.sizeHint() == SizeHint{std::numeric_limits<size_t>::max(), std::nullopt});
		CHECK(r.min() == 2);
		CHECK(r.start == 1);
	}

	SECTION("Overflow") {
		RangeFromExclusive<uint8_t> r{254};
		CHECK(r.next() == uint8_t(255));
		CHECK_THROWS_AS(r.next(), ExError);
		CHECK_THROWS_WITH(r.next(), Catch::Contains("Overflow"));

		RangeFromExclusive<int8_t> q{0};
		CHECK_THROWS_AS(q.nth(200), ExError);
	}

	SECTION("Cursor") {
		RangeFromExclusive<int> r{0};
		auto it = std::find_if(begin(r), end(r), [](int v) { return v*v > 50; });
		REQUIRE(it != end(r));
		CHECK(*it == 8);

		RangeFromExclusive<int> q{10};
		auto c = begin(q);
		CHECK(*c == 11);
		++c;
		CHECK(*c == 12);
		c++;
		CHECK(*c == 13);
	}
}

TEST_CASE("RangeFromExclusiveToInclusive iteration", "[Iteration]")
{
	using Range = RangeFromExclusiveToInclusive<int>;

	SECTION("Forward and backward") {
		CHECK(collect(Range{1, 3}) == std::vector<int>{2, 3});
		CHECK(collectBack(Range{1, 3}) == std::vector<int>{3, 2});
		CHECK(collect(Range{3, 3}).empty());
		CHECK(collect(Range{5, 3}).empty());
	}

	SECTION("next exhausts at end") {
		Range r{1, 3};
		CHECK(r.next() == 2);
		CHECK(r.next() == 3);
		CHECK(r.next() == std::nullopt);
		CHECK(r.isEmpty());
		CHECK(r.start == r.end);
	}

	SECTION("Mixing both ends") {
		Range r{0, 5};
		CHECK(r.next() == 1);
		CHECK(r.nextBack() == 5);
		CHECK(r.next() == 2);
		CHECK(r.nextBack() == 4);
		CHECK(r.next() == 3);
		CHECK(r.nextBack() == std::nullopt);
		CHECK(r.next() == std::nullopt);
	}

	SECTION("nth") {
		Range r{0, 10};
		CHECK(r.nth(2) == 3);
		CHECK(r.start == 3);
		CHECK(r.nth(100) == std::nullopt);
		CHECK(r.start == 10);
		CHECK(r.end == 10);

		Range q{0, 3};
		CHECK(q.nth(2) == 3);
		CHECK(q.next() == std::nullopt);

		RangeFromExclusiveToInclusive<uint8_t> full{0, 255};
		CHECK(full.nth(300) == std::nullopt);
		CHECK(full.start == 255);
	}

	SECTION("nth on a reversed range leaves it untouched") {
		Range r{5, 3};
		CHECK(r.nth(1) == std::nullopt);
		CHECK(r.start == 5);
		CHECK(r.end == 3);
		CHECK(r.nthBack(0) == std::nullopt);
		CHECK(r.end == 3);
	}

	SECTION("nthBack") {
		Range r{0, 10};
		CHECK(r.nthBack(2) == 8);
		CHECK(r.end == 7);
		CHECK(r.nthBack(100) == std::nullopt);
		CHECK(r.end == 0);
		CHECK(r.start == 0);
	}

	SECTION("sizeHint and len") {
		CHECK(Range{1, 3}.sizeHint() == SizeHint{2, 2});
		CHECK(Range{3, 1}.sizeHint() == SizeHint{0, 0});
		CHECK(Range{1, 3}.len() == 2);
		CHECK(Range{3, 3}.len() == 0);
		CHECK(Range{3, 1}.len() == 0);
	}

	SECTION("min, max and last") {
		Range r{1, 3};
		CHECK(r.min() == 2);
		CHECK(r.max() == 3);
		CHECK(r.last() == 3);
		CHECK(r == Range{1, 3});
		CHECK(Range{3, 3}.min() == std::nullopt);
		CHECK(Range{3, 3}.last() == std::nullopt);
	}

	SECTION("Every small range") {
		for(int start=-3;start<=3;start++) {
			for(int end=-3;end<=3;end++) {
				std::vector<int> expected;
				for(int i=start+1;i<=end;i++)
					expected.push_back(i);
				Range r{start, end};
				CHECK(collect(r) == expected);
				CHECK(r.len() == expected.size());
				CHECK(r.isEmpty() == expected.empty());
			}
		}
	}
}

TEST_CASE("RangeFromExclusiveToExclusive iteration", "[Iteration]")
{
	using Range = RangeFromExclusiveToExclusive<int>;

	SECTION("Forward and backward") {
		CHECK(collect(Range{1, 4}) == std::vector<int>{2, 3});
		CHECK(collectBack(Range{1, 4}) == std::vector<int>{3, 2});
		CHECK(collect(Range{1, 2}).empty());
		CHECK(collect(Range{1, 1}).empty());
		CHECK(collect(Range{4, 1}).empty());
	}

	SECTION("Emptiness") {
		CHECK(Range{1, 2}.isEmpty());
		CHECK(Range{0, 2}.isEmpty() == false);
		CHECK(Range{1, 2}.len() == 0);
		CHECK(Range{0, 2}.len() == 1);
	}

	SECTION("Mixing both ends") {
		Range r{0, 5};
		CHECK(r.next() == 1);
		CHECK(r.nextBack() == 4);
		CHECK(r.next() == 2);
		CHECK(r.nextBack() == 3);
		CHECK(r.next() == std::nullopt);
		CHECK(r.nextBack() == std::nullopt);
	}

	SECTION("nth") {
		Range r{0, 10};
		CHECK(r.nth(2) == 3);
		CHECK(r.nth(100) == std::nullopt);
		CHECK(r.start == 9);
		CHECK(r.end == 10);
		CHECK(r.isEmpty());

		Range q{0, 4};
		CHECK(q.nth(2) == 3);
		CHECK(q.next() == std::nullopt);
	}

	SECTION("nthBack") {
		Range r{0, 10};
		CHECK(r.nthBack(2) == 7);
		CHECK(r.end == 7);
		CHECK(r.nthBack(100) == std::nullopt);
		CHECK(r.start == 0);
		CHECK(r.end == 1);
	}

	SECTION("sizeHint") {
		CHECK(Range{1, 4}.sizeHint() == SizeHint{2, 2});
		CHECK(Range{1, 2}.sizeHint() == SizeHint{0, 0});
		CHECK(Range{4, 1}.sizeHint() == SizeHint{0, 0});
	}

	SECTION("Every small range") {
		for(int start=-3;start<=3;start++) {
			for(int end=-3;end<=3;end++) {
				std::vector<int> expected;
				for(int i=start+1;i<end;i++)
					expected.push_back(i);
				Range r{start, end};
				CHECK(collect(r) == expected);
				std::reverse(expected.begin(), expected.end());
				CHECK(collectBack(r) == expected);
				CHECK(r.len() == expected.size());
				CHECK(r.sizeHint() == SizeHint{expected.size(), expected.size()});
				CHECK(r.isEmpty() == (end - start < 2));
			}
		}
	}
}

TEST_CASE("Exact lengths over full integer ranges", "[Step]")
{
	SECTION("Inclusive") {
		CHECK(RangeFromExclusiveToInclusive<int8_t>{INT8_MIN, INT8_MAX}.len() == 255);
		CHECK(RangeFromExclusiveToInclusive<uint8_t>{0, UINT8_MAX}.len() == 255);
		CHECK(RangeFromExclusiveToInclusive<int16_t>{INT16_MIN, INT16_MAX}.len() == 65535);
		CHECK(RangeFromExclusiveToInclusive<uint16_t>{0, UINT16_MAX}.len() == 65535);
		CHECK(RangeFromExclusiveToInclusive<int32_t>{INT32_MIN, INT32_MAX}.len() == 4294967295ull);
		CHECK(RangeFromExclusiveToInclusive<uint32_t>{0, UINT32_MAX}.len() == 4294967295ull);
		CHECK(RangeFromExclusiveToInclusive<int64_t>{INT64_MIN, INT64_MAX}.len() == std::numeric_limits<size_t>::max());
		CHECK(RangeFromExclusiveToInclusive<uint64_t>{0, UINT64_MAX}.len() == std::numeric_limits<size_t>::max());
	}

	SECTION("Exclusive") {
		CHECK(RangeFromExclusiveToExclusive<int8_t>{INT8_MIN, INT8_MAX}.len() == 254);
		CHECK(RangeFromExclusiveToExclusive<uint16_t>{0, UINT16_MAX}.len() == 65534);
		CHECK(RangeFromExclusiveToExclusive<int64_t>{INT64_MIN, INT64_MAX}.len() == std::numeric_limits<size_t>::max() - 1);
	}

	SECTION("Iterating up to the maximum") {
		RangeFromExclusiveToInclusive<uint8_t> r{250, 255};
		CHECK(collect(r) == std::vector<uint8_t>{251, 252, 253, 254, 255});
		RangeFromExclusiveToInclusive<int8_t> q{-128, -126};
		CHECK(collectBack(q) == std::vector<int8_t>{-126, -127});
	}

#ifdef __SIZEOF_INT128__
	SECTION("Step counts wider than size_t") {
		__int128 huge = __int128(1) << 70;
		RangeFromExclusiveToInclusive<__int128> r{0, huge};
		CHECK(r.sizeHint() == SizeHint{std::numeric_limits<size_t>::max(), std::nullopt});

		RangeFromExclusiveToExclusive<__int128> q{0, huge};
		CHECK(q.sizeHint() == SizeHint{std::numeric_limits<size_t>::max(), std::nullopt});
		CHECK(q.isEmpty() == false);
		auto v = q.next();
		REQUIRE(v.has_value());
		CHECK((v.value() == 1));
		auto b = q.nextBack();
		REQUIRE(b.has_value());
		CHECK((b.value() == huge - 1));

		CHECK(RangeFromExclusiveToInclusive<__int128>{0, 5}.sizeHint() == SizeHint{5, 5});
	}
#endif
}

TEST_CASE("Stepping", "[Step]")
{
	SECTION("Integers") {
		CHECK(Step<int>::stepsBetween(1, 3) == size_t(2));
		CHECK(Step<int>::stepsBetween(3, 1) == std::nullopt);
		CHECK(Step<int>::forwardChecked(std::numeric_limits<int>::max(), 1) == std::nullopt);
		CHECK(Step<int>::backwardChecked(std::numeric_limits<int>::min(), 1) == std::nullopt);
		CHECK(Step<int8_t>::forwardChecked(-128, 255) == int8_t(127));
		CHECK(Step<int8_t>::backwardChecked(127, 255) == int8_t(-128));
		CHECK(Step<int>::forward(1, 2) == 3);
		CHECK(Step<int>::backward(1, 2) == -1);
		CHECK_THROWS_AS(Step<uint8_t>::forward(200, 100), ExError);
		CHECK_THROWS_AS(Step<uint8_t>::backward(0, 1), ExError);
	}

	SECTION("Unicode scalar values skip surrogates") {
		CHECK(Step<char32_t>::forwardChecked(0xD7FF, 1) == char32_t(0xE000));
		CHECK(Step<char32_t>::backwardChecked(0xE000, 1) == char32_t(0xD7FF));
		CHECK(Step<char32_t>::stepsBetween(0xD7FF, 0xE000) == size_t(1));
		CHECK(Step<char32_t>::forwardChecked(0x10FFFF, 1) == std::nullopt);
		CHECK(Step<char32_t>::backwardChecked(0, 1) == std::nullopt);
		CHECK(Step<char32_t>::stepsBetween(0xE000, 0xD7FF) == std::nullopt);
	}

	SECTION("Unicode ranges") {
		CHECK(RangeFromExclusiveToInclusive<char32_t>{0, 0x10FFFF}.len() == 0x10FFFF - 0x800);
		CHECK(RangeFromExclusiveToInclusive<char32_t>{0xD7FE, 0xE000}.len() == 2);
		CHECK(collect(RangeFromExclusiveToInclusive<char32_t>{0xD7FE, 0xE000})
			== std::vector<char32_t>{0xD7FF, 0xE000});
		CHECK(collectBack(RangeFromExclusiveToInclusive<char32_t>{0xD7FE, 0xE000})
			== std::vector<char32_t>{0xE000, 0xD7FF});
		CHECK(collect(RangeFromExclusiveToExclusive<char32_t>{'a', 'e'})
			== std::vector<char32_t>{'b', 'c', 'd'});

		RangeFromExclusive<char32_t> r{0x10FFFE};
		CHECK(r.next() == char32_t(0x10FFFF));
		CHECK_THROWS_AS(r.next(), ExError);
	}
}

TEST_CASE("Exceptions", "[Error]")
{
	SECTION("Hierarchy") {
		CHECK_THROWS_AS(throw IndexError("x"), ExError);
		CHECK_THROWS_AS(throw DecodeError("x"), ExError);
		CHECK_THROWS_WITH(throw IndexError("index message"), "index message");
	}

	SECTION("Stack traces are kept apart from the message") {
		bool enabled = getEnableTraceOnException();
		enableTraceOnException(false);
		CHECK(getEnableTraceOnException() == false);
		ExError e("message");
		CHECK(e.stacktrace().empty());
		CHECK(std::string(e.what()) == "message");

		enableTraceOnException(true);
		ExError t("traced");
		CHECK(std::string(t.what()) == "traced");
		enableTraceOnException(enabled);
	}

	SECTION("ex_check") {
		CHECK_THROWS_AS([]() { ex_check(1 == 2, "checked"); }(), ExError);
		CHECK_THROWS_WITH([]() { ex_check(1 == 2, "checked"); }(), "checked");
		CHECK_NOTHROW([]() { ex_check(1 == 1); }());
	}
}
