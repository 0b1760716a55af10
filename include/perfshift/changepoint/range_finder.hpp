#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace perfshift::changepoint {

/// Weighting passed to exponentialWeights() when none is configured.
inline constexpr double kDefaultWeighting = 0.001;

/**
 * @brief Direction, relative to the flagged point, in which the true change is expected.
 */
enum class SearchDirection {
	Behind,
	Ahead
};

std::string toString(SearchDirection direction);

/**
 * @struct ChangeRange
 * @brief Pair of neighbouring positions that bracket a change point.
 *
 * E-Divisive only tells which run the new regime starts at; runs are not
 * taken on every revision, so the change itself lies somewhere between
 * `start` and `end`. `start == end` means no bracket could be narrowed.
 */
struct ChangeRange {
	std::size_t index = 0;
	std::size_t start = 0;
	std::size_t end = 0;
	SearchDirection location = SearchDirection::Ahead;

	bool operator==(const ChangeRange &other) const {
		return index == other.index && start == other.start && end == other.end && location == other.location;
	}
};

struct RangeFinderOptions {
	/// Number of points considered on the chosen side of the flagged point.
	std::size_t bounds = 1;
	/// Decay of the preference for points close to the flagged one, in (0, 1).
	double weighting = kDefaultWeighting;
};

/**
 * @brief Weights decaying from 1 along an exponential density.
 *
 * The i-th weight is exp(-(x_i - 1)) for `size` evenly spaced x from 1 to
 * -log(weighting): a small weighting decays fast, a weighting above 1/e grows.
 * @throws InvalidInputError if the weighting is outside (0, 1).
 */
std::vector<double> exponentialWeights(std::size_t size, double weighting);

/**
 * @brief Bracket one change point between its neighbours.
 *
 * Compares the flagged value with the mean behind it (over [previous, index - 1))
 * and the mean ahead of it (over (index, next)) to decide which side to search,
 * then picks the point within `bounds` of the flagged one that deviates most
 * from that side's mean, weighted towards the flagged point.
 * @param previous End of the previous bracket, or 0.
 * @param next Index of the next change point, or the series length.
 * @throws InvalidInputError for positions outside the series or inconsistent options.
 */
ChangeRange selectChangeRange(const std::vector<double> &series, std::size_t previous, std::size_t index,
                              std::size_t next, const RangeFinderOptions &options = {});

/**
 * @brief Bracket every change point of a sorted list, chaining each bracket's end
 * into the next search as its lower limit.
 */
std::vector<ChangeRange> findChangeRanges(const std::vector<double> &series,
                                          const std::vector<std::size_t> &sorted_indexes,
                                          const RangeFinderOptions &options = {});

} // namespace perfshift::changepoint
