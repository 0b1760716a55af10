#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace perfshift::outlier {

/**
 * @struct OutlierResult
 * @brief Holds the results of an outlier detection operation.
 *
 * `order` lists candidate positions in the order they were peeled off the
 * series, most extreme first. Only the first `confirmed_count` of them are
 * asserted to be outliers; the rest are kept for inspection.
 */
struct OutlierResult {
	/// Positions in the original series, most extreme first.
	std::vector<std::size_t> order;
	/// Number of leading entries of `order` that are confirmed outliers.
	std::size_t confirmed_count = 0;
	/// Test statistic of each iteration; +inf when the spread of the remaining values is zero.
	std::vector<double> statistics;
	/// Critical value matching each statistic.
	std::vector<double> critical_values;

	/// The confirmed outliers, i.e. order[0, confirmed_count).
	std::vector<std::size_t> confirmed() const {
		return std::vector<std::size_t>(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(confirmed_count));
	}
};

/**
 * @class IOutlierDetector
 * @brief An interface for all outlier detection algorithms.
 */
class IOutlierDetector {
public:
	virtual ~IOutlierDetector() = default;

	/**
	 * @brief Detects outliers in the given series.
	 * @param series The values to analyze, in chronological order.
	 * @return An OutlierResult describing the candidates and how many were confirmed.
	 */
	virtual OutlierResult detect(const std::vector<double> &series) const = 0;

	/**
	 * @brief Gets the name of the outlier detector.
	 */
	virtual std::string getName() const = 0;
};

} // namespace perfshift::outlier
