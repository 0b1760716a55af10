#include <catch2/catch_test_macros.hpp>

#include "perfshift/utils/random_source.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

using perfshift::utils::MersenneTwisterSource;

namespace {

std::vector<double> iota(std::size_t count) {
	std::vector<double> values(count);
	std::iota(values.begin(), values.end(), 0.0);
	return values;
}

} // namespace

TEST_CASE("MersenneTwisterSource shuffles reproducibly", "[utils][random]") {
	MersenneTwisterSource source;
	auto first = iota(10);
	source.shuffle(first);
	REQUIRE(first == std::vector<double>{0, 3, 4, 7, 9, 8, 5, 6, 1, 2});

	auto second = iota(10);
	source.shuffle(second);
	REQUIRE(second == std::vector<double>{1, 3, 7, 6, 8, 4, 2, 0, 9, 5});
}

TEST_CASE("MersenneTwisterSource produces permutations", "[utils][random]") {
	MersenneTwisterSource source(99);
	auto values = iota(37);
	source.shuffle(values);
	REQUIRE(values != iota(37));

	std::sort(values.begin(), values.end());
	REQUIRE(values == iota(37));

	SECTION("tiny inputs are left alone") {
		std::vector<double> empty;
		source.shuffle(empty);
		REQUIRE(empty.empty());

		std::vector<double> single{4.0};
		source.shuffle(single);
		REQUIRE(single == std::vector<double>{4.0});
	}
}

TEST_CASE("Derived seeds", "[utils][random]") {
	REQUIRE(MersenneTwisterSource::deriveSeed(0, 0) == 16294208416658607535ULL);
	REQUIRE(MersenneTwisterSource::deriveSeed(1234, 0) == 13478418381427711195ULL);
	REQUIRE(MersenneTwisterSource::deriveSeed(1234, 1) == 10936887474700444964ULL);

	MersenneTwisterSource derived(MersenneTwisterSource::deriveSeed(1234, 0));
	auto values = iota(10);
	derived.shuffle(values);
	REQUIRE(values == std::vector<double>{4, 9, 6, 3, 0, 1, 8, 5, 2, 7});
}

TEST_CASE("Entropy seeded sources still permute", "[utils][random]") {
	auto source = MersenneTwisterSource::fromEntropy();
	auto values = iota(20);
	source.shuffle(values);
	std::sort(values.begin(), values.end());
	REQUIRE(values == iota(20));
}
