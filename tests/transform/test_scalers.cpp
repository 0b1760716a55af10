#include <catch2/catch_test_macros.hpp>

#include "perfshift/transform/scalers.hpp"
#include "perfshift/utils/statistics.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace perfshift::transform;

namespace {

bool approxEqual(double lhs, double rhs, double eps = 1e-6) {
	return std::fabs(lhs - rhs) <= eps;
}

void expectSeriesEqual(const std::vector<double> &lhs, const std::vector<double> &rhs, double eps = 1e-6) {
	REQUIRE(lhs.size() == rhs.size());
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		REQUIRE(approxEqual(lhs[i], rhs[i], eps));
	}
}

} // namespace

TEST_CASE("MinMaxScaler scales to the unit range") {
	std::vector<double> data{2.0, 4.0, 6.0};
	MinMaxScaler scaler;
	scaler.fitTransform(data);
	expectSeriesEqual(data, {0.0, 0.5, 1.0});

	scaler.inverseTransform(data);
	expectSeriesEqual(data, {2.0, 4.0, 6.0});
}

TEST_CASE("MinMaxScaler with custom range") {
	std::vector<double> data{10.0, 20.0};
	MinMaxScaler scaler;
	scaler.withScaledRange(-1.0, 1.0).withDataRange(0.0, 20.0);
	scaler.transform(data);
	expectSeriesEqual(data, {0.0, 1.0});

	REQUIRE_THROWS_AS(scaler.withScaledRange(1.0, 1.0), std::invalid_argument);
}

TEST_CASE("MinMaxScaler maps constant data to the lower bound") {
	std::vector<double> data{3.0, 3.0, 3.0};
	MinMaxScaler scaler;
	scaler.fitTransform(data);
	expectSeriesEqual(data, {0.0, 0.0, 0.0});
}

TEST_CASE("Scalers require fitting") {
	std::vector<double> data{1.0};
	REQUIRE_THROWS_AS(MinMaxScaler().transform(data), std::runtime_error);
	REQUIRE_THROWS_AS(StandardScaler().transform(data), std::runtime_error);
	REQUIRE_THROWS_AS(StandardScaler().inverseTransform(data), std::runtime_error);
}

TEST_CASE("StandardScaler with classical centering") {
	std::vector<double> data{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
	const auto original = data;
	StandardScaler scaler;
	scaler.fitTransform(data);

	REQUIRE(scaler.parameters().has_value());
	REQUIRE(approxEqual(scaler.parameters()->center, 5.0));
	REQUIRE(approxEqual(perfshift::utils::mean(data), 0.0));
	REQUIRE(approxEqual(perfshift::utils::sampleStdDev(data), 1.0));

	scaler.inverseTransform(data);
	expectSeriesEqual(data, original);
}

TEST_CASE("StandardScaler with robust centering ignores the extreme value") {
	std::vector<double> data{1.0, 2.0, 3.0, 4.0, 100.0};
	StandardScaler scaler(Centering::Robust);
	scaler.fitTransform(data);

	REQUIRE(approxEqual(scaler.parameters()->center, 3.0));
	REQUIRE(approxEqual(scaler.parameters()->spread, perfshift::utils::kMadConsistency));
	expectSeriesEqual(data, {-2.0 / 1.4826, -1.0 / 1.4826, 0.0, 1.0 / 1.4826, 97.0 / 1.4826});
}

TEST_CASE("StandardScaler zeroes constant data") {
	std::vector<double> data{7.0, 7.0, 7.0};
	StandardScaler scaler;
	scaler.fitTransform(data);
	expectSeriesEqual(data, {0.0, 0.0, 0.0});
	REQUIRE(scaler.parameters()->spread == 0.0);
}

TEST_CASE("StandardScaler with explicit parameters through the Transformer interface") {
	std::unique_ptr<Transformer> transformer =
	    std::make_unique<StandardScaler>(StandardScaler().withParameters({10.0, 2.0}));
	std::vector<double> data{8.0, 10.0, 14.0};
	transformer->transform(data);
	expectSeriesEqual(data, {-1.0, 0.0, 2.0});
}
