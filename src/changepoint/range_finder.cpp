#include "perfshift/changepoint/range_finder.hpp"

#include "perfshift/utils/errors.hpp"
#include "perfshift/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <optional>
#include <sstream>

namespace perfshift::changepoint {
namespace {

std::optional<double> rangeMean(const std::vector<double> &series, std::size_t begin, std::size_t end) {
	if (begin >= end) {
		return std::nullopt;
	}
	const auto first = series.begin() + static_cast<std::ptrdiff_t>(begin);
	const auto last = series.begin() + static_cast<std::ptrdiff_t>(end);
	return std::accumulate(first, last, 0.0) / static_cast<double>(end - begin);
}

void validateOptions(const RangeFinderOptions &options) {
	if (options.bounds == 0) {
		throw InvalidInputError("RangeFinder: bounds must be at least 1.");
	}
	if (!(options.weighting > 0.0 && options.weighting < 1.0)) {
		throw InvalidInputError("RangeFinder: weighting must lie strictly between 0 and 1.");
	}
}

} // namespace

std::string toString(SearchDirection direction) {
	return direction == SearchDirection::Behind ? "behind" : "ahead";
}

std::vector<double> exponentialWeights(std::size_t size, double weighting) {
	if (!(weighting > 0.0 && weighting < 1.0)) {
		std::ostringstream message;
		message << "exponentialWeights: weighting " << weighting << " must lie strictly between 0 and 1.";
		throw InvalidInputError(message.str());
	}
	std::vector<double> weights(size, 1.0);
	if (size < 2) {
		return weights;
	}
	const double last = -std::log(weighting);
	const double step = (last - 1.0) / static_cast<double>(size - 1);
	for (std::size_t i = 1; i < size; ++i) {
		weights[i] = std::exp(-step * static_cast<double>(i));
	}
	return weights;
}

ChangeRange selectChangeRange(const std::vector<double> &series, std::size_t previous, std::size_t index,
                              std::size_t next, const RangeFinderOptions &options) {
	validateOptions(options);
	if (index >= series.size() || next > series.size() || previous > next) {
		throw InvalidInputError("RangeFinder: change point positions lie outside the series.");
	}

	ChangeRange range;
	range.index = index;
	if (next == previous) {
		range.start = range.end = next;
		return range;
	}

	const double value = series[index];
	std::optional<double> behind_mean;
	if (index >= 1) {
		behind_mean = rangeMean(series, previous, index - 1);
	}
	auto ahead_mean = rangeMean(series, index + 1, next);

	if (behind_mean && ahead_mean && *behind_mean == *ahead_mean) {
		range.start = range.end = index;
		return range;
	}

	if (!ahead_mean) {
		ahead_mean = value;
		range.location = SearchDirection::Behind;
	} else if (!behind_mean) {
		behind_mean = value;
		range.location = SearchDirection::Ahead;
	} else {
		range.location = std::abs(*ahead_mean - value) > std::abs(*behind_mean - value) ? SearchDirection::Ahead
		                                                                                 : SearchDirection::Behind;
	}

	std::size_t begin;
	std::size_t end;
	if (range.location == SearchDirection::Behind) {
		begin = index + 1 >= options.bounds ? std::max(index + 1 - options.bounds, previous) : previous;
		end = index + 1;
	} else {
		begin = index;
		end = std::min(index + options.bounds, next);
	}
	if (end <= begin) {
		range.start = range.end = index;
		return range;
	}

	// Weights fall off with the distance from the flagged point.
	auto weights = exponentialWeights(end - begin, options.weighting);
	if (range.location == SearchDirection::Behind) {
		std::reverse(weights.begin(), weights.end());
	}
	const double reference = range.location == SearchDirection::Ahead ? *ahead_mean : *behind_mean;

	std::size_t best = 0;
	double best_score = -1.0;
	for (std::size_t k = 0; k < weights.size(); ++k) {
		const double delta = (series[begin + k] - reference) * weights[k];
		const double score = delta * delta;
		if (score > best_score) {
			best_score = score;
			best = k;
		}
	}

	// The bracket is [start, start + 1], so the last window position steps back one.
	auto start = static_cast<std::int64_t>(begin) + static_cast<std::int64_t>(best);
	if (best + 1 == weights.size()) {
		--start;
	}
	if (start < static_cast<std::int64_t>(previous)) {
		start = static_cast<std::int64_t>(previous) + 1;
	}
	if (start > static_cast<std::int64_t>(next)) {
		start = static_cast<std::int64_t>(next) - 1;
	}

	range.start = static_cast<std::size_t>(start);
	range.end = range.start + 1;
	PERFSHIFT_TRACE("RangeFinder index={} start={} end={} location={}", index, range.start, range.end,
	                toString(range.location));
	return range;
}

std::vector<ChangeRange> findChangeRanges(const std::vector<double> &series,
                                          const std::vector<std::size_t> &sorted_indexes,
                                          const RangeFinderOptions &options) {
	std::vector<ChangeRange> ranges;
	ranges.reserve(sorted_indexes.size());

	std::size_t previous = 0;
	for (std::size_t k = 0; k < sorted_indexes.size(); ++k) {
		const std::size_t next = k + 1 < sorted_indexes.size() ? sorted_indexes[k + 1] : series.size();
		auto range = selectChangeRange(series, previous, sorted_indexes[k], next, options);
		previous = range.end;
		ranges.push_back(range);
	}
	return ranges;
}

} // namespace perfshift::changepoint
