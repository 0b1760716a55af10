#pragma once

#include "perfshift/batch/batch_runner.hpp"
#include "perfshift/changepoint/description.hpp"
#include "perfshift/changepoint/e_divisive.hpp"
#include "perfshift/core/series.hpp"
#include "perfshift/outlier/gesd.hpp"
#include "perfshift/outlier/mask.hpp"
#include "perfshift/utils/random_source.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace perfshift::quick {

/**
 * @brief Run E-Divisive over a whole series.
 * @return Change points sorted by index.
 * @throws InvalidInputError for empty or non-finite input, significance outside (0, 1) or zero permutations.
 */
inline std::vector<changepoint::ChangePoint>
detectChangePoints(const std::vector<double> &series, double significance = 0.05, std::size_t permutations = 100,
                   std::uint64_t seed = utils::MersenneTwisterSource::kDefaultSeed) {
	const auto detector =
	    changepoint::EDivisive::builder().significance(significance).permutations(permutations).build();
	return detector.detect(series, seed);
}

/**
 * @brief Run the generalized ESD test.
 *
 * Without an explicit max_outliers the budget is computeMaxOutliers(n, 0).
 */
inline outlier::OutlierResult detectOutliers(const std::vector<double> &series, double significance = 0.05,
                                             std::optional<std::size_t> max_outliers = std::nullopt,
                                             bool use_mad = false) {
	outlier::GesdDetectorBuilder builder;
	builder.withSignificance(significance).useMad(use_mad);
	if (max_outliers) {
		builder.withMaxOutliers(*max_outliers);
	} else {
		builder.withMaxOutliersFraction(0.0);
	}
	return builder.build()->detect(series);
}

/// Change points with before/after statistics and magnitude.
inline std::vector<changepoint::ChangePointDescription>
describeChangePoints(const std::vector<double> &series, double significance = 0.05, std::size_t permutations = 100,
                     std::uint64_t seed = utils::MersenneTwisterSource::kDefaultSeed) {
	return changepoint::describeChangePoints(series, detectChangePoints(series, significance, permutations, seed));
}

/**
 * @brief Analyse a batch of series in parallel.
 * @return One report per series, in input order.
 */
inline std::vector<batch::SeriesReport> analyseBatch(const std::vector<core::PerformanceSeries> &series,
                                                     const batch::BatchOptions &options = {}) {
	batch::BatchRunner runner(options);
	return runner.run(series);
}

} // namespace perfshift::quick
