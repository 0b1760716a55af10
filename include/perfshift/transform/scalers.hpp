#pragma once

#include "perfshift/transform/transformer.hpp"

#include <optional>
#include <vector>

namespace perfshift::transform {

/**
 * @enum Centering
 * @brief Which location/scale pair standardization uses.
 */
enum class Centering {
	/// Mean and sample standard deviation.
	Classical,
	/// Median and median absolute deviation scaled by utils::kMadConsistency.
	Robust
};

struct StandardScaleParams {
	double center = 0.0;
	double spread = 1.0;

	/// Spread is 0 for constant data or fewer than two values.
	static StandardScaleParams fromData(const std::vector<double> &data, Centering centering = Centering::Classical);
};

class MinMaxScaler final : public Transformer {
public:
	MinMaxScaler();

	MinMaxScaler &withScaledRange(double min, double max);
	MinMaxScaler &withDataRange(double min, double max);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

private:
	void ensureParams() const;
	void computeScale(double input_min, double input_max);

	double output_min_;
	double output_max_;
	bool has_params_;
	double input_min_;
	double input_max_;
	double scale_factor_;
	double offset_;
};

/**
 * @class StandardScaler
 * @brief Maps values to (x - center) / spread; constant data maps to zero.
 */
class StandardScaler final : public Transformer {
public:
	explicit StandardScaler(Centering centering = Centering::Classical);

	StandardScaler &withParameters(StandardScaleParams params);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	const std::optional<StandardScaleParams> &parameters() const noexcept {
		return params_;
	}

private:
	void ensureParams() const;

	Centering centering_;
	std::optional<StandardScaleParams> params_;
};

} // namespace perfshift::transform
