#pragma once

#include "perfshift/core/distance_matrix.hpp"

#include <cstddef>
#include <vector>

namespace perfshift::changepoint {

/**
 * @struct DistanceContext
 * @brief Everything the Q sweep needs for one segment: its length and its
 * pairwise absolute-difference matrix.
 *
 * Built fresh for every segment; a child segment never reuses its parent's context.
 */
struct DistanceContext {
	std::size_t length = 0;
	core::DistanceMatrix differences;
};

/**
 * @struct SplitCandidate
 * @brief The best split of a segment: position m and its Q statistic.
 */
struct SplitCandidate {
	std::size_t index = 0;
	double statistic = 0.0;
};

/**
 * @class QHat
 * @brief The E-Divisive divergence statistic Q(m) for every split of a series.
 *
 * For a split m (left = [0, m), right = [m, n)) Q combines the mean distance
 * between the two sides with the mean distance within each side, scaled by
 * m (n - m) / n. The sweep maintains the three pairwise sums incrementally as
 * the split moves right, so after the O(n^2) matrix build each step only sums
 * the one row that changes sides.
 */
class QHat {
public:
	/// Shortest series that has a valid split (2 points each side, one interior candidate).
	static constexpr std::size_t kMinimumLength = 5;

	/**
	 * @brief Build the difference structure for a series.
	 */
	static DistanceContext build(const std::vector<double> &series);

	/**
	 * @brief Compute Q(m) for every split position.
	 * @return A vector of length n; entries for m in [2, n - 2] hold Q(m), all
	 *         others are zero. For n < kMinimumLength every entry is zero.
	 */
	static std::vector<double> sweep(const DistanceContext &context);

	/// build() followed by sweep().
	static std::vector<double> values(const std::vector<double> &series);

	/**
	 * @brief The largest Q over [2, n - 2], ties going to the smallest index.
	 *
	 * Returns {0, 0.0} when the vector has no valid split.
	 */
	static SplitCandidate best(const std::vector<double> &q_values);

	/**
	 * @brief Normalise the three pairwise sums into Q(m).
	 * @param cross Sum of D[i][j] for i < m <= j.
	 * @param left Sum of D[i][k] for i < k < m.
	 * @param right Sum of D[j][k] for m <= j < k.
	 */
	static double statistic(double cross, double left, double right, std::size_t m, std::size_t n);
};

} // namespace perfshift::changepoint
