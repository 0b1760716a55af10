#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "perfshift/changepoint/description.hpp"
#include "common/perf_fixtures.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using perfshift::changepoint::calculateMagnitude;
using perfshift::changepoint::ChangeCategory;
using perfshift::changepoint::ChangePoint;
using perfshift::changepoint::describeChangePoints;
using perfshift::changepoint::RangeFinderOptions;
using perfshift::changepoint::SearchDirection;
using perfshift::utils::Description;

namespace {

std::optional<Description> withMean(double mean) {
	Description description;
	description.nobs = 3;
	description.mean = mean;
	return description;
}

} // namespace

TEST_CASE("Magnitude of throughput changes", "[changepoint][description]") {
	SECTION("doubling is a major improvement") {
		const auto magnitude = calculateMagnitude(withMean(100.0), withMean(200.0));
		REQUIRE(magnitude.value);
		REQUIRE(*magnitude.value == Catch::Approx(std::log(2.0)));
		REQUIRE(magnitude.category == ChangeCategory::MajorImprovement);
	}
	SECTION("halving is a major regression") {
		const auto magnitude = calculateMagnitude(withMean(200.0), withMean(100.0));
		REQUIRE(*magnitude.value == Catch::Approx(-std::log(2.0)));
		REQUIRE(magnitude.category == ChangeCategory::MajorRegression);
	}
	SECTION("category thresholds") {
		REQUIRE(calculateMagnitude(withMean(100.0), withMean(75.0)).category == ChangeCategory::ModerateRegression);
		REQUIRE(calculateMagnitude(withMean(100.0), withMean(95.0)).category == ChangeCategory::MinorRegression);
		REQUIRE(calculateMagnitude(withMean(100.0), withMean(105.0)).category == ChangeCategory::MinorImprovement);
		REQUIRE(calculateMagnitude(withMean(100.0), withMean(130.0)).category ==
		        ChangeCategory::ModerateImprovement);
		REQUIRE(calculateMagnitude(withMean(100.0), withMean(100.0)).category == ChangeCategory::MinorImprovement);
	}
}

TEST_CASE("Magnitude edge cases", "[changepoint][description][edge]") {
	REQUIRE(*calculateMagnitude(withMean(0.0), withMean(0.0)).value == 0.0);
	REQUIRE(*calculateMagnitude(withMean(0.0), withMean(5.0)).value == std::numeric_limits<double>::infinity());
	REQUIRE(*calculateMagnitude(withMean(5.0), withMean(0.0)).value == -std::numeric_limits<double>::infinity());
	REQUIRE(calculateMagnitude(withMean(0.0), withMean(5.0)).category == ChangeCategory::MajorImprovement);

	SECTION("negative means compare the other way round") {
		const auto magnitude = calculateMagnitude(withMean(-10.0), withMean(-20.0));
		REQUIRE(*magnitude.value == Catch::Approx(-std::log(2.0)));
		REQUIRE(magnitude.category == ChangeCategory::MajorRegression);
	}
	SECTION("opposite signs and missing ranges are uncategorized") {
		const auto mixed = calculateMagnitude(withMean(-1.0), withMean(1.0));
		REQUIRE_FALSE(mixed.value);
		REQUIRE(mixed.category == ChangeCategory::Uncategorized);

		const auto missing = calculateMagnitude(std::nullopt, withMean(1.0));
		REQUIRE_FALSE(missing.value);
		REQUIRE(missing.category == ChangeCategory::Uncategorized);
	}
}

TEST_CASE("Category names", "[changepoint][description]") {
	REQUIRE(perfshift::changepoint::toString(ChangeCategory::MajorRegression) == "Major Regression");
	REQUIRE(perfshift::changepoint::toString(ChangeCategory::ModerateImprovement) == "Moderate Improvement");
	REQUIRE(perfshift::changepoint::toString(ChangeCategory::Uncategorized) == "Uncategorized");
}

TEST_CASE("Describing change points links neighbouring ranges", "[changepoint][description]") {
	const std::vector<double> series{1, 1, 1, 4, 4, 4, 4, 2, 2, 2};
	const std::vector<ChangePoint> points{{7, 3.0, 0.01}, {3, 5.0, 0.0}};

	const auto descriptions = describeChangePoints(series, points);
	REQUIRE(descriptions.size() == 2);

	const auto &first = descriptions[0];
	REQUIRE(first.change_point.index == 3);
	REQUIRE(first.range.start == 2);
	REQUIRE(first.range.end == 3);
	REQUIRE(first.range.location == SearchDirection::Behind);
	REQUIRE(first.previous == 0);
	REQUIRE(first.next == 6);
	REQUIRE(first.before->nobs == 2);
	REQUIRE(first.before->mean == Catch::Approx(1.0));
	REQUIRE(first.after->nobs == 3);
	REQUIRE(first.after->mean == Catch::Approx(4.0));
	REQUIRE(first.after->variance == Catch::Approx(0.0));
	REQUIRE(*first.magnitude == Catch::Approx(std::log(4.0)));
	REQUIRE(first.category == ChangeCategory::MajorImprovement);

	const auto &second = descriptions[1];
	REQUIRE(second.range.start == 6);
	REQUIRE(second.range.end == 7);
	REQUIRE(second.previous == 3);
	REQUIRE(second.next == series.size());
	REQUIRE(second.before->nobs == 3);
	REQUIRE(second.before->mean == Catch::Approx(4.0));
	REQUIRE(second.after->nobs == 3);
	REQUIRE(second.after->mean == Catch::Approx(2.0));
	REQUIRE(second.after->min == 2.0);
	REQUIRE(second.after->max == 2.0);
	REQUIRE(second.category == ChangeCategory::MajorRegression);
}

TEST_CASE("Describing the two regime series", "[changepoint][description]") {
	const auto &series = tests::fixtures::twoRegimeSeries();
	const auto descriptions = describeChangePoints(series, {{50, 470.0, 0.0}});

	REQUIRE(descriptions.size() == 1);
	const auto &description = descriptions.front();
	REQUIRE(description.range.start == 49);
	REQUIRE(description.range.end == 50);
	REQUIRE(description.before->nobs == 49);
	REQUIRE(description.after->nobs == 50);
	REQUIRE(description.before->mean == Catch::Approx(10.0).margin(0.2));
	REQUIRE(description.after->mean == Catch::Approx(20.0).margin(0.2));
	REQUIRE(description.before->variance > 0.0);
	REQUIRE(description.category == ChangeCategory::MajorImprovement);
}

TEST_CASE("Describing change points validates positions", "[changepoint][description][validation]") {
	const std::vector<double> series{1.0, 2.0, 3.0};
	REQUIRE_THROWS_AS(describeChangePoints(series, {{3, 1.0, 0.0}}), std::invalid_argument);
	REQUIRE(describeChangePoints(series, {}).empty());

	SECTION("a change point at the last value") {
		const auto descriptions = describeChangePoints(series, {{2, 1.0, 0.0}});
		const auto &description = descriptions.front();
		REQUIRE(description.range.start == 1);
		REQUIRE(description.range.end == 2);
		REQUIRE(description.before->nobs == 1);
		REQUIRE(std::isnan(description.before->variance));
		REQUIRE(description.after->nobs == 1);
		REQUIRE(description.after->mean == 3.0);
		REQUIRE(*description.magnitude == Catch::Approx(std::log(3.0)));
	}
	SECTION("a change point at zero") {
		const auto descriptions = describeChangePoints(series, {{0, 1.0, 0.0}});
		const auto &description = descriptions.front();
		REQUIRE(description.range.start == 1);
		REQUIRE(description.before->nobs == 1);
		REQUIRE(description.after->nobs == 1);
		REQUIRE(description.after->mean == 3.0);
	}
}

TEST_CASE("Describing change points with a wider search window", "[changepoint][description]") {
	std::vector<double> series(7, 1.0);
	series.insert(series.end(), 5, 9.0);

	RangeFinderOptions options;
	options.bounds = 3;
	const auto descriptions = describeChangePoints(series, {{8, 1.0, 0.0}}, options);
	const auto &description = descriptions.front();
	REQUIRE(description.range.start == 7);
	REQUIRE(description.range.end == 8);
	REQUIRE(description.before->nobs == 7);
	REQUIRE(description.before->mean == 1.0);
	REQUIRE(description.after->mean == 9.0);
}
