#include "perfshift/transform/scalers.hpp"

#include "perfshift/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace perfshift::transform {

// ============================================================================
// StandardScaleParams
// ============================================================================

StandardScaleParams StandardScaleParams::fromData(const std::vector<double> &data, Centering centering) {
	StandardScaleParams params;
	if (data.empty()) {
		return params;
	}

	if (centering == Centering::Robust) {
		params.center = utils::median(data);
		params.spread = utils::kMadConsistency * utils::medianAbsoluteDeviation(data, params.center);
	} else {
		params.center = utils::mean(data);
		params.spread = utils::sampleStdDev(data, params.center);
	}
	return params;
}

// ============================================================================
// MinMaxScaler
// ============================================================================

MinMaxScaler::MinMaxScaler()
    : output_min_(0.0), output_max_(1.0), has_params_(false), input_min_(0.0), input_max_(1.0), scale_factor_(1.0),
      offset_(0.0) {}

MinMaxScaler &MinMaxScaler::withScaledRange(double min, double max) {
	if (!(min < max)) {
		throw std::invalid_argument("MinMaxScaler output range must satisfy min < max.");
	}
	output_min_ = min;
	output_max_ = max;
	if (has_params_) {
		computeScale(input_min_, input_max_);
	}
	return *this;
}

MinMaxScaler &MinMaxScaler::withDataRange(double min, double max) {
	input_min_ = min;
	input_max_ = max;
	has_params_ = true;
	computeScale(min, max);
	return *this;
}

void MinMaxScaler::fit(const std::vector<double> &data) {
	if (data.empty()) {
		input_min_ = 0.0;
		input_max_ = 1.0;
	} else {
		const auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
		input_min_ = *min_it;
		input_max_ = *max_it;
	}
	has_params_ = true;
	computeScale(input_min_, input_max_);
}

void MinMaxScaler::transform(std::vector<double> &data) const {
	ensureParams();
	for (double &value : data) {
		value = scale_factor_ * value + offset_;
	}
}

void MinMaxScaler::inverseTransform(std::vector<double> &data) const {
	ensureParams();
	for (double &value : data) {
		value = (value - offset_) / scale_factor_;
	}
}

void MinMaxScaler::ensureParams() const {
	if (!has_params_) {
		throw std::runtime_error("MinMaxScaler must be fitted before transform");
	}
}

void MinMaxScaler::computeScale(double input_min, double input_max) {
	if (std::abs(input_max - input_min) < std::numeric_limits<double>::epsilon()) {
		// Constant data
		scale_factor_ = 1.0;
		offset_ = output_min_ - input_min;
	} else {
		scale_factor_ = (output_max_ - output_min_) / (input_max - input_min);
		offset_ = output_min_ - scale_factor_ * input_min;
	}
}

// ============================================================================
// StandardScaler
// ============================================================================

StandardScaler::StandardScaler(Centering centering) : centering_(centering), params_(std::nullopt) {}

StandardScaler &StandardScaler::withParameters(StandardScaleParams params) {
	params_ = params;
	return *this;
}

void StandardScaler::fit(const std::vector<double> &data) {
	params_ = StandardScaleParams::fromData(data, centering_);
}

void StandardScaler::transform(std::vector<double> &data) const {
	ensureParams();

	const double center = params_->center;
	const double spread = params_->spread;

	if (std::abs(spread) < std::numeric_limits<double>::epsilon()) {
		// Constant data - set to zero
		std::fill(data.begin(), data.end(), 0.0);
		return;
	}
	for (double &value : data) {
		value = (value - center) / spread;
	}
}

void StandardScaler::inverseTransform(std::vector<double> &data) const {
	ensureParams();

	const double center = params_->center;
	const double spread = params_->spread;
	for (double &value : data) {
		value = value * spread + center;
	}
}

void StandardScaler::ensureParams() const {
	if (!params_.has_value()) {
		throw std::runtime_error("StandardScaler must be fitted before transform");
	}
}

} // namespace perfshift::transform
