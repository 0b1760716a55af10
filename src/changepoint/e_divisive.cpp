#include "perfshift/changepoint/e_divisive.hpp"

#include "perfshift/changepoint/qhat.hpp"
#include "perfshift/utils/errors.hpp"
#include "perfshift/utils/logging.hpp"

#include <algorithm>
#include <utility>

namespace perfshift::changepoint {
namespace {

struct Segment {
	std::size_t begin;
	std::size_t end;
};

} // namespace

EDivisive::Builder EDivisive::builder() {
	return {};
}

EDivisive::EDivisive(double significance, std::size_t permutations, bool trace_enabled)
    : significance_(significance), permutations_(permutations), trace_enabled_(trace_enabled) {}

EDivisive EDivisive::Builder::build() const {
	utils::requireSignificance(significance_, "EDivisive");
	if (permutations_ == 0) {
		throw InvalidInputError("EDivisive: permutations must be at least 1.");
	}
	PERFSHIFT_DEBUG("Building EDivisive with significance {} and {} permutations.", significance_, permutations_);
	return EDivisive(significance_, permutations_, trace_enabled_);
}

double EDivisive::permutationProbability(const std::vector<double> &segment, double observed,
                                         utils::RandomSource &random) const {
	std::size_t above = 0;
	std::vector<double> permuted;
	for (std::size_t trial = 0; trial < permutations_; ++trial) {
		permuted = segment;
		random.shuffle(permuted);
		const auto candidate = QHat::best(QHat::values(permuted));
		if (candidate.statistic >= observed) {
			++above;
		}
	}
	return static_cast<double>(above) / static_cast<double>(permutations_ + 1);
}

std::vector<ChangePoint> EDivisive::detect(const std::vector<double> &series, utils::RandomSource &random) const {
	utils::requireFiniteSeries(series, "EDivisive");

	std::vector<ChangePoint> change_points;

	// Depth-first, left half before right half: the right half is pushed first.
	std::vector<Segment> pending{{0, series.size()}};
	std::vector<double> segment;

	while (!pending.empty()) {
		const Segment current = pending.back();
		pending.pop_back();

		const std::size_t length = current.end - current.begin;
		if (length < QHat::kMinimumLength) {
			continue;
		}

		segment.assign(series.begin() + static_cast<std::ptrdiff_t>(current.begin),
		               series.begin() + static_cast<std::ptrdiff_t>(current.end));
		const auto candidate = QHat::best(QHat::values(segment));
		const double probability = permutationProbability(segment, candidate.statistic, random);

		if (trace_enabled_) {
			PERFSHIFT_TRACE("EDivisive segment=[{}, {}) split={} q={} probability={}", current.begin, current.end,
			                current.begin + candidate.index, candidate.statistic, probability);
		}

		if (probability > significance_) {
			continue;
		}

		const std::size_t split = current.begin + candidate.index;
		change_points.push_back({split, candidate.statistic, probability});
		pending.push_back({split, current.end});
		pending.push_back({current.begin, split});
	}

	std::sort(change_points.begin(), change_points.end(),
	          [](const ChangePoint &lhs, const ChangePoint &rhs) { return lhs.index < rhs.index; });

	PERFSHIFT_INFO("EDivisive found {} change points in {} values.", change_points.size(), series.size());
	return change_points;
}

std::vector<ChangePoint> EDivisive::detect(const std::vector<double> &series, std::uint64_t seed) const {
	utils::MersenneTwisterSource random(seed);
	return detect(series, random);
}

} // namespace perfshift::changepoint
