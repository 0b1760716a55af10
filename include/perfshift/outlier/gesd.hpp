#pragma once

#include "perfshift/outlier/ioutlier_detector.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace perfshift::outlier {

/// Fraction of the series used as the outlier budget when none is given.
inline constexpr double kDefaultMaxOutliersFraction = 0.20;

/**
 * @brief Turn a fraction of the series length into a GESD outlier budget.
 *
 * A fraction of 0 selects kDefaultMaxOutliersFraction. The budget is at least
 * 1 and at most n - 1; an empty series gets 0.
 * @throws InvalidInputError if the fraction is outside [0, 1].
 */
std::size_t computeMaxOutliers(std::size_t n, double fraction);

/**
 * @brief Critical value lambda_i of the generalized ESD test.
 * @param n Length of the full series.
 * @param iteration 1-based iteration number i; requires n - i - 1 >= 1.
 * @param significance Two-sided significance level.
 */
double gesdCriticalValue(std::size_t n, std::size_t iteration, double significance);

class GesdDetectorBuilder;

/**
 * @class GesdDetector
 * @brief Generalized Extreme Studentized Deviate test (Rosner, 1983).
 *
 * Each iteration removes the value furthest from the center of the remaining
 * values, scaled by their spread, and compares that statistic with a critical
 * value that shrinks as values are removed. The number of outliers is the
 * deepest iteration whose statistic exceeds its critical value, so an early
 * iteration that fails does not mask a later one that passes.
 *
 * The center and spread are the mean and sample standard deviation, or, with
 * `useMad(true)`, the median and the consistency-scaled median absolute
 * deviation. Iteration stops once fewer than three values remain or every
 * remaining value equals the center.
 */
class GesdDetector final : public IOutlierDetector {
public:
	friend class GesdDetectorBuilder;

	/**
	 * @throws InvalidInputError for an empty or non-finite series, or when the
	 *         outlier budget exceeds the series length.
	 */
	OutlierResult detect(const std::vector<double> &series) const override;

	std::string getName() const override {
		return use_mad_ ? "GESD-MAD" : "GESD";
	}

	double significance() const noexcept {
		return significance_;
	}

	bool usesMad() const noexcept {
		return use_mad_;
	}

	/// Outlier budget applied to a series of length n.
	std::size_t maxOutliersFor(std::size_t n) const;

private:
	GesdDetector(double significance, std::optional<std::size_t> max_outliers, std::optional<double> fraction,
	             bool use_mad, bool trace_enabled);

	double significance_;
	std::optional<std::size_t> max_outliers_;
	std::optional<double> max_outliers_fraction_;
	bool use_mad_;
	bool trace_enabled_;
};

/**
 * @class GesdDetectorBuilder
 * @brief A builder for fluently configuring and creating GesdDetector instances.
 */
class GesdDetectorBuilder {
public:
	/**
	 * @brief Sets the significance level (default 0.05).
	 */
	GesdDetectorBuilder &withSignificance(double significance);

	/**
	 * @brief Sets a fixed outlier budget (default 10). Must not exceed the length of analysed series.
	 */
	GesdDetectorBuilder &withMaxOutliers(std::size_t max_outliers);

	/**
	 * @brief Sizes the outlier budget per series with computeMaxOutliers().
	 * Replaces any fixed budget.
	 */
	GesdDetectorBuilder &withMaxOutliersFraction(double fraction);

	/**
	 * @brief Use median / MAD instead of mean / standard deviation.
	 */
	GesdDetectorBuilder &useMad(bool use_mad);

	GesdDetectorBuilder &enableTracing(bool value);

	/**
	 * @brief Creates a new GesdDetector instance.
	 * @throws InvalidInputError if the significance is outside (0, 1).
	 */
	std::unique_ptr<GesdDetector> build() const;

private:
	double significance_ = 0.05;
	std::optional<std::size_t> max_outliers_ = 10;
	std::optional<double> max_outliers_fraction_;
	bool use_mad_ = false;
	bool trace_enabled_ = false;
};

} // namespace perfshift::outlier
