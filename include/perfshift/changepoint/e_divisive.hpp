#pragma once

#include "perfshift/utils/random_source.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace perfshift::changepoint {

/**
 * @struct ChangePoint
 * @brief A split accepted by the permutation test.
 */
struct ChangePoint {
	/// Position in the caller's series; the new regime starts here.
	std::size_t index = 0;
	/// Q statistic of the split within the segment it was found in.
	double statistic = 0.0;
	/// Permutation-test p-value; never above the detector's significance.
	double probability = 0.0;

	bool operator==(const ChangePoint &other) const {
		return index == other.index && statistic == other.statistic && probability == other.probability;
	}
	bool operator!=(const ChangePoint &other) const {
		return !(*this == other);
	}
};

/**
 * @class EDivisive
 * @brief Hierarchical E-Divisive change-point detection.
 *
 * Each segment is split at its maximal Q statistic. The split is kept only if
 * fewer than a `significance` fraction of random reorderings of the same
 * values reach an equally large maximum; accepted splits are searched again
 * on both sides. Segments shorter than five points are never split.
 *
 * The detector holds configuration only, so one instance can serve many
 * threads as long as each call gets its own RandomSource.
 */
class EDivisive {
public:
	class Builder {
	public:
		Builder &significance(double value) {
			significance_ = value;
			return *this;
		}

		Builder &permutations(std::size_t value) {
			permutations_ = value;
			return *this;
		}

		Builder &enableTracing(bool value) {
			trace_enabled_ = value;
			return *this;
		}

		/**
		 * @throws InvalidInputError if significance is outside (0, 1) or permutations is zero.
		 */
		EDivisive build() const;

	private:
		double significance_ = 0.05;
		std::size_t permutations_ = 100;
		bool trace_enabled_ = false;
	};

	static Builder builder();

	/**
	 * @brief Detect change points, drawing permutations from the given source.
	 * @return The accepted change points sorted by index.
	 * @throws InvalidInputError for an empty series or non-finite values.
	 */
	std::vector<ChangePoint> detect(const std::vector<double> &series, utils::RandomSource &random) const;

	/// Same as above with a MersenneTwisterSource seeded with `seed`.
	std::vector<ChangePoint> detect(const std::vector<double> &series,
	                                std::uint64_t seed = utils::MersenneTwisterSource::kDefaultSeed) const;

	double significance() const noexcept {
		return significance_;
	}

	std::size_t permutations() const noexcept {
		return permutations_;
	}

private:
	EDivisive(double significance, std::size_t permutations, bool trace_enabled);

	double permutationProbability(const std::vector<double> &segment, double observed,
	                              utils::RandomSource &random) const;

	double significance_;
	std::size_t permutations_;
	bool trace_enabled_;
};

} // namespace perfshift::changepoint
