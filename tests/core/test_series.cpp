#include <catch2/catch_test_macros.hpp>

#include "perfshift/core/series.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using perfshift::core::PerformanceSeries;
using perfshift::core::SeriesIdentifier;

TEST_CASE("SeriesIdentifier renders its non-empty fields", "[core][series]") {
	const SeriesIdentifier full{"sys-perf", "linux-1-node", "industry_benchmarks", "ycsb_load", "32"};
	REQUIRE(full.toString() == "sys-perf linux-1-node industry_benchmarks ycsb_load 32");

	const SeriesIdentifier partial{"sys-perf", "", "", "ycsb_load", ""};
	REQUIRE(partial.toString() == "sys-perf ycsb_load");

	REQUIRE(SeriesIdentifier{}.toString().empty());
	REQUIRE(full == full);
	REQUIRE_FALSE(full == partial);
}

TEST_CASE("PerformanceSeries keeps values and revisions aligned", "[core][series]") {
	const PerformanceSeries series({"p", "v", "t", "test", "1"}, {1.0, 2.0, 3.0}, {"a1", "b2", "c3"});

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.isEmpty());
	REQUIRE(series.hasRevisions());
	REQUIRE(series.revisionAt(1) == std::optional<std::string>("b2"));
	REQUIRE_THROWS_AS(series.revisionAt(3), std::out_of_range);

	SECTION("mismatched revisions are rejected") {
		REQUIRE_THROWS_AS(PerformanceSeries({}, {1.0, 2.0}, {"a1"}), std::invalid_argument);
	}

	SECTION("series without revisions") {
		const PerformanceSeries bare({}, {1.0, 2.0});
		REQUIRE_FALSE(bare.hasRevisions());
		REQUIRE_FALSE(bare.revisionAt(0).has_value());
	}
}

TEST_CASE("PerformanceSeries slicing", "[core][series]") {
	const PerformanceSeries series({"p", "", "", "t", ""}, {1.0, 2.0, 3.0, 4.0}, {"r1", "r2", "r3", "r4"});

	const auto middle = series.slice(1, 3);
	REQUIRE(middle.values() == std::vector<double>{2.0, 3.0});
	REQUIRE(middle.revisions() == std::vector<std::string>{"r2", "r3"});
	REQUIRE(middle.identifier() == series.identifier());

	REQUIRE(series.slice(2, 2).isEmpty());
	REQUIRE_THROWS_AS(series.slice(3, 2), std::out_of_range);
	REQUIRE_THROWS_AS(series.slice(0, 5), std::out_of_range);
}
