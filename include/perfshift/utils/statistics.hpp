#pragma once

#include <cstddef>
#include <vector>

namespace perfshift::utils {

/// Scales a median absolute deviation into a consistent estimator of the
/// standard deviation for normally distributed data.
inline constexpr double kMadConsistency = 1.4826;

/**
 * @struct Description
 * @brief Descriptive statistics of a contiguous range of a series.
 */
struct Description {
	std::size_t nobs = 0;
	double min = 0.0;
	double max = 0.0;
	double mean = 0.0;
	/// Sample variance (n - 1 denominator); NaN for a single observation.
	double variance = 0.0;
	/// Biased sample skewness; 0 when all values are equal.
	double skewness = 0.0;
	/// Biased excess (Fisher) kurtosis; -3 when all values are equal.
	double kurtosis = 0.0;
};

double mean(const std::vector<double> &data);

/// Sample standard deviation (n - 1 denominator). Returns 0 for fewer than two values.
double sampleStdDev(const std::vector<double> &data, double mean);
double sampleStdDev(const std::vector<double> &data);

/// Median of the values. The argument is taken by value because it is partially reordered.
double median(std::vector<double> data);

/// Unscaled median absolute deviation around the given center.
double medianAbsoluteDeviation(const std::vector<double> &data, double center);

/**
 * @brief Describe values[begin, end).
 * @throws std::invalid_argument if the range is empty or out of bounds.
 */
Description describe(const std::vector<double> &values, std::size_t begin, std::size_t end);

} // namespace perfshift::utils
