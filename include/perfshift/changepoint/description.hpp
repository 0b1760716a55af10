#pragma once

#include "perfshift/changepoint/e_divisive.hpp"
#include "perfshift/changepoint/range_finder.hpp"
#include "perfshift/utils/statistics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace perfshift::changepoint {

/**
 * @enum ChangeCategory
 * @brief How large a change is and in which direction.
 *
 * Performance values are "higher is better", so a drop of the mean is a regression.
 */
enum class ChangeCategory {
	MajorRegression,
	ModerateRegression,
	MinorRegression,
	MinorImprovement,
	ModerateImprovement,
	MajorImprovement,
	Uncategorized
};

std::string toString(ChangeCategory category);

/**
 * @struct ChangePointDescription
 * @brief A change point together with the regimes on either side of it.
 *
 * `range` brackets the change between two neighbouring positions. `before`
 * describes [previous, range.start) and `after` describes [range.end, next),
 * where previous is the end of the earlier bracket (or 0) and next is the
 * start of the later bracket (or the series length).
 */
struct ChangePointDescription {
	ChangePoint change_point;
	ChangeRange range;
	std::size_t previous = 0;
	std::size_t next = 0;
	std::optional<utils::Description> before;
	std::optional<utils::Description> after;
	/// log of the ratio of the means; +/-inf when one mean is zero.
	std::optional<double> magnitude;
	ChangeCategory category = ChangeCategory::Uncategorized;
};

struct Magnitude {
	std::optional<double> value;
	ChangeCategory category = ChangeCategory::Uncategorized;
};

/**
 * @brief Magnitude and category of the move from the `before` mean to the `after` mean.
 *
 * For non-negative means the magnitude is log(after / before). Negative means
 * are latency-like metrics where lower is better, so the ratio is inverted.
 */
Magnitude calculateMagnitude(const std::optional<utils::Description> &before,
                             const std::optional<utils::Description> &after);

/**
 * @brief Bracket every change point and describe the regimes between the brackets.
 * @param series The series the change points were detected on.
 * @param change_points Change points in any order; the result is sorted by index.
 * @param options Search window and weighting of the range finder.
 * @throws std::invalid_argument if a change point lies outside the series.
 */
std::vector<ChangePointDescription> describeChangePoints(const std::vector<double> &series,
                                                         std::vector<ChangePoint> change_points,
                                                         const RangeFinderOptions &options = {});

} // namespace perfshift::changepoint
