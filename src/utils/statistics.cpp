#include "perfshift/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace perfshift::utils {

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double sampleStdDev(const std::vector<double> &data, double mean) {
	if (data.size() < 2) {
		return 0.0;
	}
	double variance = 0.0;
	for (double value : data) {
		const double diff = value - mean;
		variance += diff * diff;
	}
	return std::sqrt(variance / static_cast<double>(data.size() - 1));
}

double sampleStdDev(const std::vector<double> &data) {
	return sampleStdDev(data, mean(data));
}

double median(std::vector<double> data) {
	if (data.empty()) {
		return 0.0;
	}
	const std::size_t n = data.size();
	const std::size_t mid = n / 2;
	std::nth_element(data.begin(), data.begin() + mid, data.end());
	const double upper = data[mid];
	if (n % 2 == 0) {
		// The lower middle is the largest value of the left partition.
		const double lower = *std::max_element(data.begin(), data.begin() + mid);
		return (lower + upper) / 2.0;
	}
	return upper;
}

double medianAbsoluteDeviation(const std::vector<double> &data, double center) {
	std::vector<double> deviations;
	deviations.reserve(data.size());
	for (double value : data) {
		deviations.push_back(std::abs(value - center));
	}
	return median(std::move(deviations));
}

Description describe(const std::vector<double> &values, std::size_t begin, std::size_t end) {
	if (begin >= end || end > values.size()) {
		throw std::invalid_argument("describe requires a non-empty range within the series.");
	}

	Description description;
	description.nobs = end - begin;
	const auto first = values.begin() + static_cast<std::ptrdiff_t>(begin);
	const auto last = values.begin() + static_cast<std::ptrdiff_t>(end);
	const auto [min_it, max_it] = std::minmax_element(first, last);
	description.min = *min_it;
	description.max = *max_it;
	description.mean = std::accumulate(first, last, 0.0) / static_cast<double>(description.nobs);

	double m2 = 0.0;
	double m3 = 0.0;
	double m4 = 0.0;
	for (auto it = first; it != last; ++it) {
		const double diff = *it - description.mean;
		const double sq = diff * diff;
		m2 += sq;
		m3 += sq * diff;
		m4 += sq * sq;
	}
	const auto n = static_cast<double>(description.nobs);
	description.variance =
	    description.nobs > 1 ? m2 / (n - 1.0) : std::numeric_limits<double>::quiet_NaN();

	m2 /= n;
	m3 /= n;
	m4 /= n;
	if (m2 > 0.0) {
		description.skewness = m3 / std::pow(m2, 1.5);
		description.kurtosis = m4 / (m2 * m2) - 3.0;
	} else {
		description.skewness = 0.0;
		description.kurtosis = -3.0;
	}
	return description;
}

} // namespace perfshift::utils
