#include "perfshift/changepoint/description.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace perfshift::changepoint {
namespace {

constexpr double kMajorRegression = -0.5;
constexpr double kModerateRegression = -0.2;
constexpr double kMinorRegression = 0.0;
constexpr double kMajorImprovement = 0.5;
constexpr double kModerateImprovement = 0.2;

std::optional<utils::Description> describeRange(const std::vector<double> &series, std::size_t begin,
                                                std::size_t end) {
	end = std::min(end, series.size());
	if (begin >= end) {
		return std::nullopt;
	}
	return utils::describe(series, begin, end);
}

ChangeCategory categorize(double magnitude) {
	if (magnitude < kMajorRegression) {
		return ChangeCategory::MajorRegression;
	}
	if (magnitude < kModerateRegression) {
		return ChangeCategory::ModerateRegression;
	}
	if (magnitude < kMinorRegression) {
		return ChangeCategory::MinorRegression;
	}
	if (magnitude > kMajorImprovement) {
		return ChangeCategory::MajorImprovement;
	}
	if (magnitude > kModerateImprovement) {
		return ChangeCategory::ModerateImprovement;
	}
	return ChangeCategory::MinorImprovement;
}

} // namespace

std::string toString(ChangeCategory category) {
	switch (category) {
	case ChangeCategory::MajorRegression:
		return "Major Regression";
	case ChangeCategory::ModerateRegression:
		return "Moderate Regression";
	case ChangeCategory::MinorRegression:
		return "Minor Regression";
	case ChangeCategory::MinorImprovement:
		return "Minor Improvement";
	case ChangeCategory::ModerateImprovement:
		return "Moderate Improvement";
	case ChangeCategory::MajorImprovement:
		return "Major Improvement";
	default:
		return "Uncategorized";
	}
}

Magnitude calculateMagnitude(const std::optional<utils::Description> &before,
                             const std::optional<utils::Description> &after) {
	Magnitude result;
	if (!before || !after) {
		return result;
	}

	const double previous_mean = before->mean;
	const double next_mean = after->mean;
	double magnitude;
	if (previous_mean == 0.0 && next_mean == 0.0) {
		magnitude = 0.0;
	} else if (previous_mean == 0.0) {
		magnitude = std::numeric_limits<double>::infinity();
	} else if (next_mean == 0.0) {
		magnitude = -std::numeric_limits<double>::infinity();
	} else if (previous_mean > 0.0 && next_mean > 0.0) {
		magnitude = std::log(next_mean / previous_mean);
	} else if (previous_mean > 0.0 || next_mean > 0.0) {
		// Means of opposite sign have no meaningful ratio.
		return result;
	} else {
		magnitude = std::log(previous_mean / next_mean);
	}

	result.value = magnitude;
	result.category = categorize(magnitude);
	return result;
}

std::vector<ChangePointDescription> describeChangePoints(const std::vector<double> &series,
                                                         std::vector<ChangePoint> change_points,
                                                         const RangeFinderOptions &options) {
	std::sort(change_points.begin(), change_points.end(),
	          [](const ChangePoint &lhs, const ChangePoint &rhs) { return lhs.index < rhs.index; });

	std::vector<std::size_t> indexes;
	indexes.reserve(change_points.size());
	for (const auto &point : change_points) {
		if (point.index >= series.size()) {
			throw std::invalid_argument("change point lies outside the series");
		}
		indexes.push_back(point.index);
	}
	const auto ranges = findChangeRanges(series, indexes, options);

	std::vector<ChangePointDescription> descriptions;
	descriptions.reserve(change_points.size());

	for (std::size_t k = 0; k < change_points.size(); ++k) {
		ChangePointDescription description;
		description.change_point = change_points[k];
		description.range = ranges[k];
		description.previous = k == 0 ? 0 : ranges[k - 1].end;
		description.next = k + 1 < ranges.size() ? ranges[k + 1].start : series.size();
		description.before = describeRange(series, description.previous, description.range.start);
		description.after = describeRange(series, description.range.end, description.next);

		const auto magnitude = calculateMagnitude(description.before, description.after);
		description.magnitude = magnitude.value;
		description.category = magnitude.category;
		descriptions.push_back(std::move(description));
	}
	return descriptions;
}

} // namespace perfshift::changepoint
