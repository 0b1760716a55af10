#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "perfshift/changepoint/qhat.hpp"
#include "common/perf_fixtures.hpp"

#include <cmath>
#include <vector>

using perfshift::changepoint::QHat;

namespace {

// Q(m) straight from its definition, without the incremental updates.
double directQ(const std::vector<double> &x, std::size_t m) {
	const std::size_t n = x.size();
	double cross = 0.0;
	double left = 0.0;
	double right = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		for (std::size_t j = i + 1; j < n; ++j) {
			const double d = std::abs(x[i] - x[j]);
			if (j < m) {
				left += d;
			} else if (i >= m) {
				right += d;
			} else {
				cross += d;
			}
		}
	}
	return QHat::statistic(cross, left, right, m, n);
}

} // namespace

TEST_CASE("QHat sweep of a clean step", "[changepoint][qhat]") {
	const std::vector<double> step{0, 0, 0, 0, 0, 10, 10, 10, 10, 10};
	const auto q = QHat::values(step);

	REQUIRE(q.size() == step.size());
	REQUIRE(q[5] == Catch::Approx(50.0));
	REQUIRE(q[4] == Catch::Approx(32.0));
	REQUIRE(q[6] == Catch::Approx(32.0));
	REQUIRE(q[2] == Catch::Approx(80.0 / 7.0));

	SECTION("positions outside [2, n-2] stay zero") {
		REQUIRE(q[0] == 0.0);
		REQUIRE(q[1] == 0.0);
		REQUIRE(q[9] == 0.0);
	}

	const auto candidate = QHat::best(q);
	REQUIRE(candidate.index == 5);
	REQUIRE(candidate.statistic == Catch::Approx(50.0));
}

TEST_CASE("QHat incremental sweep matches the direct definition", "[changepoint][qhat]") {
	const auto &series = tests::fixtures::threeRegimeSeries();
	const auto q = QHat::values(series);

	for (std::size_t m = 2; m + 2 <= series.size(); ++m) {
		REQUIRE(q[m] == Catch::Approx(directQ(series, m)).epsilon(1e-9).margin(1e-9));
	}
}

TEST_CASE("QHat statistic may be negative", "[changepoint][qhat]") {
	const auto q = QHat::values({1.0, 5.0, 2.0, 8.0, 3.0});
	REQUIRE(q[2] == Catch::Approx(-2.4));
	REQUIRE(q[3] == Catch::Approx(-0.8));
	REQUIRE(QHat::best(q).index == 3);
}

TEST_CASE("QHat ties resolve to the smallest index", "[changepoint][qhat]") {
	const std::vector<double> q{0.0, 0.0, 1.0, 3.0, 2.0, 3.0, 0.0, 0.0};
	const auto candidate = QHat::best(q);
	REQUIRE(candidate.index == 3);
	REQUIRE(candidate.statistic == 3.0);
}

TEST_CASE("QHat short input", "[changepoint][qhat][edge]") {
	const auto q = QHat::values({1.0, 2.0, 3.0, 4.0});
	REQUIRE(q == std::vector<double>(4, 0.0));

	const auto candidate = QHat::best(q);
	REQUIRE(candidate.index == 0);
	REQUIRE(candidate.statistic == 0.0);

	REQUIRE(QHat::values({}).empty());
}
