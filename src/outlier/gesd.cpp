#include "perfshift/outlier/gesd.hpp"

#include "perfshift/transform/scalers.hpp"
#include "perfshift/utils/errors.hpp"
#include "perfshift/utils/logging.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>
#include <sstream>

namespace perfshift::outlier {

std::size_t computeMaxOutliers(std::size_t n, double fraction) {
	if (!(fraction >= 0.0 && fraction <= 1.0)) {
		std::ostringstream message;
		message << "max outliers fraction " << fraction << " must lie within [0, 1].";
		throw InvalidInputError(message.str());
	}
	if (n == 0) {
		return 0;
	}
	if (fraction == 0.0) {
		fraction = kDefaultMaxOutliersFraction;
	}
	auto max_outliers = static_cast<std::size_t>(static_cast<double>(n) * fraction);
	if (max_outliers == 0) {
		max_outliers = 1;
	} else if (max_outliers >= n) {
		max_outliers = n - 1;
	}
	return max_outliers;
}

double gesdCriticalValue(std::size_t n, std::size_t iteration, double significance) {
	const double remaining = static_cast<double>(n - iteration + 1);
	const double degrees_of_freedom = static_cast<double>(n - iteration - 1);
	const double upper_tail = significance / (2.0 * remaining);

	const boost::math::students_t distribution(degrees_of_freedom);
	const double t = boost::math::quantile(boost::math::complement(distribution, upper_tail));

	return (remaining - 1.0) * t / std::sqrt((degrees_of_freedom + t * t) * remaining);
}

// --- Detector Implementation ---

GesdDetector::GesdDetector(double significance, std::optional<std::size_t> max_outliers,
                           std::optional<double> fraction, bool use_mad, bool trace_enabled)
    : significance_(significance), max_outliers_(max_outliers), max_outliers_fraction_(fraction), use_mad_(use_mad),
      trace_enabled_(trace_enabled) {}

std::size_t GesdDetector::maxOutliersFor(std::size_t n) const {
	if (max_outliers_fraction_) {
		return computeMaxOutliers(n, *max_outliers_fraction_);
	}
	return max_outliers_.value_or(0);
}

OutlierResult GesdDetector::detect(const std::vector<double> &series) const {
	utils::requireFiniteSeries(series, "GesdDetector");

	const std::size_t n = series.size();
	const std::size_t max_outliers = maxOutliersFor(n);
	if (max_outliers > n) {
		std::ostringstream message;
		message << "GesdDetector: max_outliers (" << max_outliers << ") must be <= length of series (" << n
		        << ").";
		throw InvalidInputError(message.str());
	}

	OutlierResult result;
	if (max_outliers == 0) {
		return result;
	}

	result.order.reserve(max_outliers);
	result.statistics.reserve(max_outliers);
	result.critical_values.reserve(max_outliers);

	// Positions not yet removed, kept in series order so ties resolve to the earliest point.
	std::vector<std::size_t> remaining(n);
	for (std::size_t i = 0; i < n; ++i) {
		remaining[i] = i;
	}
	std::vector<double> values;

	for (std::size_t iteration = 1; iteration <= max_outliers; ++iteration) {
		if (remaining.size() < 3) {
			PERFSHIFT_DEBUG("GESD stopping at iteration {}: {} values left.", iteration, remaining.size());
			break;
		}

		values.clear();
		for (std::size_t index : remaining) {
			values.push_back(series[index]);
		}

		const auto location = transform::StandardScaleParams::fromData(
		    values, use_mad_ ? transform::Centering::Robust : transform::Centering::Classical);
		std::size_t extreme = 0;
		double largest = -1.0;
		for (std::size_t k = 0; k < values.size(); ++k) {
			const double deviation = std::abs(values[k] - location.center);
			if (deviation > largest) {
				largest = deviation;
				extreme = k;
			}
		}
		if (!(largest > 0.0)) {
			PERFSHIFT_DEBUG("GESD stopping at iteration {}: remaining values all equal the center.", iteration);
			break;
		}

		// A MAD of zero with values off the median leaves those values infinitely far out.
		const double statistic =
		    location.spread > 0.0 ? largest / location.spread : std::numeric_limits<double>::infinity();
		const double critical = gesdCriticalValue(n, iteration, significance_);

		if (trace_enabled_) {
			PERFSHIFT_TRACE("GESD iteration={} index={} statistic={} critical={}", iteration, remaining[extreme],
			                statistic, critical);
		}

		result.order.push_back(remaining[extreme]);
		result.statistics.push_back(statistic);
		result.critical_values.push_back(critical);
		remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(extreme));
	}

	for (std::size_t i = result.statistics.size(); i > 0; --i) {
		if (result.statistics[i - 1] > result.critical_values[i - 1]) {
			result.confirmed_count = i;
			break;
		}
	}

	PERFSHIFT_INFO("{} confirmed {} of {} candidate outliers.", getName(), result.confirmed_count,
	               result.order.size());
	return result;
}

// --- Builder Implementation ---

GesdDetectorBuilder &GesdDetectorBuilder::withSignificance(double significance) {
	significance_ = significance;
	return *this;
}

GesdDetectorBuilder &GesdDetectorBuilder::withMaxOutliers(std::size_t max_outliers) {
	max_outliers_ = max_outliers;
	max_outliers_fraction_.reset();
	return *this;
}

GesdDetectorBuilder &GesdDetectorBuilder::withMaxOutliersFraction(double fraction) {
	if (!(fraction >= 0.0 && fraction <= 1.0)) {
		throw InvalidInputError("max outliers fraction must lie within [0, 1].");
	}
	max_outliers_fraction_ = fraction;
	max_outliers_.reset();
	return *this;
}

GesdDetectorBuilder &GesdDetectorBuilder::useMad(bool use_mad) {
	use_mad_ = use_mad;
	return *this;
}

GesdDetectorBuilder &GesdDetectorBuilder::enableTracing(bool value) {
	trace_enabled_ = value;
	return *this;
}

std::unique_ptr<GesdDetector> GesdDetectorBuilder::build() const {
	utils::requireSignificance(significance_, "GesdDetector");
	PERFSHIFT_DEBUG("Building GesdDetector with significance {} and mad={}.", significance_, use_mad_);
	return std::unique_ptr<GesdDetector>(
	    new GesdDetector(significance_, max_outliers_, max_outliers_fraction_, use_mad_, trace_enabled_));
}

} // namespace perfshift::outlier
