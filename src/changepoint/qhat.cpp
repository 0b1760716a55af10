#include "perfshift/changepoint/qhat.hpp"

namespace perfshift::changepoint {
namespace {

inline double pairs(std::size_t count) {
	return count < 2 ? 0.0 : static_cast<double>(count) * static_cast<double>(count - 1) / 2.0;
}

} // namespace

DistanceContext QHat::build(const std::vector<double> &series) {
	DistanceContext context;
	context.length = series.size();
	context.differences = core::DistanceMatrix::absoluteDifferences(series);
	return context;
}

double QHat::statistic(double cross, double left, double right, std::size_t m, std::size_t n) {
	const double left_size = static_cast<double>(m);
	const double right_size = static_cast<double>(n - m);
	const double between = 2.0 * cross / (left_size * right_size);
	const double left_pairs = pairs(m);
	const double right_pairs = pairs(n - m);
	const double within_left = left_pairs > 0.0 ? left / left_pairs : 0.0;
	const double within_right = right_pairs > 0.0 ? right / right_pairs : 0.0;
	return (left_size * right_size / static_cast<double>(n)) * (between - within_left - within_right);
}

std::vector<double> QHat::sweep(const DistanceContext &context) {
	const std::size_t n = context.length;
	std::vector<double> q_values(n, 0.0);
	if (n < kMinimumLength) {
		return q_values;
	}

	const auto &d = context.differences;

	std::size_t m = 2;
	double cross = d.blockSum(0, m, m, n);
	double left = d(0, 1);
	double right = d.blockSum(m, n, m, n) / 2.0;
	q_values[m] = statistic(cross, left, right, m, n);

	for (m = 3; m + 2 <= n; ++m) {
		// Point m - 1 moves from the right side to the left side.
		const std::size_t moved = m - 1;
		const double column_delta = d.rowSum(moved, 0, moved);
		const double row_delta = d.columnSum(moved, m, n);

		cross = cross - column_delta + row_delta;
		left += column_delta;
		right -= row_delta;

		q_values[m] = statistic(cross, left, right, m, n);
	}

	return q_values;
}

std::vector<double> QHat::values(const std::vector<double> &series) {
	return sweep(build(series));
}

SplitCandidate QHat::best(const std::vector<double> &q_values) {
	SplitCandidate candidate;
	const std::size_t n = q_values.size();
	if (n < kMinimumLength) {
		return candidate;
	}
	candidate.index = 2;
	candidate.statistic = q_values[2];
	for (std::size_t m = 3; m + 2 <= n; ++m) {
		if (q_values[m] > candidate.statistic) {
			candidate.index = m;
			candidate.statistic = q_values[m];
		}
	}
	return candidate;
}

} // namespace perfshift::changepoint
