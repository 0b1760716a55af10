#include "perfshift/outlier/mask.hpp"

#include <stdexcept>

namespace perfshift::outlier {

std::size_t MaskedSeries::toOriginalIndex(std::size_t masked_index) const {
	if (masked_index < positions.size()) {
		return positions[masked_index];
	}
	throw std::out_of_range("masked index is outside the masked series");
}

MaskedSeries maskOutliers(const std::vector<double> &series, const OutlierResult &result) {
	std::vector<bool> excluded(series.size(), false);
	for (std::size_t i = 0; i < result.confirmed_count; ++i) {
		const std::size_t index = result.order.at(i);
		if (index >= series.size()) {
			throw std::invalid_argument("outlier position lies outside the series");
		}
		excluded[index] = true;
	}

	MaskedSeries masked;
	masked.values.reserve(series.size());
	masked.positions.reserve(series.size());
	for (std::size_t i = 0; i < series.size(); ++i) {
		if (!excluded[i]) {
			masked.values.push_back(series[i]);
			masked.positions.push_back(i);
		}
	}
	return masked;
}

} // namespace perfshift::outlier
