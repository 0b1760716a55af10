#pragma once

#include "perfshift/changepoint/description.hpp"
#include "perfshift/changepoint/e_divisive.hpp"
#include "perfshift/core/series.hpp"
#include "perfshift/outlier/gesd.hpp"
#include "perfshift/utils/random_source.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace perfshift::batch {

/// hardware_concurrency() - 1, but at least 1.
std::size_t defaultPoolSize();

/**
 * @struct BatchOptions
 * @brief Configuration shared by every series of a batch.
 */
struct BatchOptions {
	std::size_t pool_size = defaultPoolSize();
	/// Base seed; each series derives its own stream from it and its position.
	std::uint64_t seed = utils::MersenneTwisterSource::kDefaultSeed;
	double significance = 0.05;
	std::size_t permutations = 100;
	bool detect_outliers = true;
	/// Passed to outlier::computeMaxOutliers; 0 selects the default budget.
	double max_outliers_fraction = 0.0;
	bool use_mad = false;
	/// Remove confirmed outliers before change-point detection.
	bool mask_outliers = false;
	bool detect_change_points = true;
	/// Bracket search window used when describing change points.
	changepoint::RangeFinderOptions range_finder;
};

enum class TaskStatus {
	Completed,
	Failed,
	Cancelled
};

struct SeriesReport;

/// Called with the input position and report of every task that ran to the end,
/// successfully or not. Calls are serialised but may come from any worker thread.
using ReportCallback = std::function<void(std::size_t, const SeriesReport &)>;

/**
 * @struct SeriesReport
 * @brief Everything computed for one series, or why nothing was.
 *
 * A report is either Completed with full results, or Failed/Cancelled with
 * empty results; partial results are never exposed.
 */
struct SeriesReport {
	core::SeriesIdentifier identifier;
	TaskStatus status = TaskStatus::Cancelled;
	std::string error;
	std::optional<outlier::OutlierResult> outliers;
	/// Change points in the coordinates of the input series, sorted by index.
	std::vector<changepoint::ChangePoint> change_points;
	std::vector<changepoint::ChangePointDescription> descriptions;
};

/**
 * @class BatchRunner
 * @brief Analyses many independent series on a fixed pool of worker threads.
 *
 * Each series is one task. A task that throws is reported as Failed and does
 * not affect the others. Results do not depend on scheduling: every task
 * seeds its own random source from the batch seed and its position.
 */
class BatchRunner {
public:
	/**
	 * @throws InvalidInputError if the options describe an invalid detector configuration.
	 */
	explicit BatchRunner(BatchOptions options = {});

	BatchRunner(const BatchRunner &) = delete;
	BatchRunner &operator=(const BatchRunner &) = delete;

	/**
	 * @brief Analyse every series; blocks until all tasks have finished or been cancelled.
	 *
	 * The calling thread works through tasks alongside pool_size - 1 spawned
	 * threads. If the system refuses to start a thread, the batch continues on
	 * the threads already running.
	 * @param on_report Optional progress callback; it may call requestStop().
	 * @return One report per input series, in input order.
	 */
	std::vector<SeriesReport> run(const std::vector<core::PerformanceSeries> &series,
	                              const ReportCallback &on_report = {});

	/**
	 * @brief Ask a running batch to stop. Tasks not yet started are reported as
	 * Cancelled; tasks already running complete. The flag is cleared when run() starts.
	 */
	void requestStop() noexcept;

	/**
	 * @brief Analyse a single series with this runner's configuration.
	 * @throws InvalidInputError for an empty or non-finite series.
	 */
	SeriesReport analyse(const core::PerformanceSeries &series, std::uint64_t seed) const;

	const BatchOptions &options() const noexcept {
		return options_;
	}

private:
	BatchOptions options_;
	changepoint::EDivisive change_detector_;
	std::unique_ptr<outlier::GesdDetector> outlier_detector_;
	std::atomic<bool> stop_requested_{false};
};

} // namespace perfshift::batch
