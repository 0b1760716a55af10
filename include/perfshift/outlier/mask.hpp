#pragma once

#include "perfshift/outlier/ioutlier_detector.hpp"

#include <cstddef>
#include <vector>

namespace perfshift::outlier {

/**
 * @struct MaskedSeries
 * @brief A series with confirmed outliers removed.
 *
 * `positions[k]` is the original position of `values[k]`.
 */
struct MaskedSeries {
	std::vector<double> values;
	std::vector<std::size_t> positions;

	/**
	 * @brief Translate a position in the masked series back to the original series.
	 * @throws std::out_of_range for a position past the end of the masked series.
	 */
	std::size_t toOriginalIndex(std::size_t masked_index) const;
};

/**
 * @brief Drop the confirmed outliers of `result` from `series`, keeping order.
 * @throws std::invalid_argument if a confirmed position lies outside the series.
 */
MaskedSeries maskOutliers(const std::vector<double> &series, const OutlierResult &result);

} // namespace perfshift::outlier
