#include "perfshift/batch/batch_runner.hpp"

#include "perfshift/outlier/mask.hpp"
#include "perfshift/utils/errors.hpp"
#include "perfshift/utils/logging.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace perfshift::batch {

std::size_t defaultPoolSize() {
	const unsigned int cores = std::thread::hardware_concurrency();
	return cores > 1 ? static_cast<std::size_t>(cores - 1) : 1;
}

BatchRunner::BatchRunner(BatchOptions options)
    : options_(std::move(options)),
      change_detector_(changepoint::EDivisive::builder()
                           .significance(options_.significance)
                           .permutations(options_.permutations)
                           .build()),
      outlier_detector_(outlier::GesdDetectorBuilder()
                            .withSignificance(options_.significance)
                            .withMaxOutliersFraction(options_.max_outliers_fraction)
                            .useMad(options_.use_mad)
                            .build()) {
	if (options_.pool_size == 0) {
		throw InvalidInputError("BatchRunner: pool_size must be at least 1.");
	}
}

void BatchRunner::requestStop() noexcept {
	stop_requested_.store(true);
}

SeriesReport BatchRunner::analyse(const core::PerformanceSeries &series, std::uint64_t seed) const {
	const auto &values = series.values();
	utils::requireFiniteSeries(values, series.identifier().toString().c_str());

	SeriesReport report;
	report.identifier = series.identifier();

	std::optional<outlier::MaskedSeries> masked;
	if (options_.detect_outliers) {
		report.outliers = outlier_detector_->detect(values);
		if (options_.mask_outliers && report.outliers->confirmed_count > 0) {
			masked = outlier::maskOutliers(values, *report.outliers);
		}
	}

	if (options_.detect_change_points) {
		utils::MersenneTwisterSource random(seed);
		if (masked) {
			report.change_points = change_detector_.detect(masked->values, random);
			for (auto &point : report.change_points) {
				point.index = masked->toOriginalIndex(point.index);
			}
		} else {
			report.change_points = change_detector_.detect(values, random);
		}
		report.descriptions = changepoint::describeChangePoints(values, report.change_points, options_.range_finder);
	}

	report.status = TaskStatus::Completed;
	return report;
}

std::vector<SeriesReport> BatchRunner::run(const std::vector<core::PerformanceSeries> &series,
                                           const ReportCallback &on_report) {
	stop_requested_.store(false);

	std::vector<SeriesReport> reports(series.size());
	for (std::size_t i = 0; i < series.size(); ++i) {
		reports[i].identifier = series[i].identifier();
	}
	if (series.empty()) {
		return reports;
	}

#ifndef PERFSHIFT_NO_LOGGING
	// Create the shared logger before any worker can race to do so.
	utils::Logging::getLogger();
#endif

	std::atomic<std::size_t> next_task{0};
	std::atomic<std::size_t> failures{0};
	std::mutex callback_mutex;

	auto worker = [&]() {
		for (;;) {
			const std::size_t task = next_task.fetch_add(1);
			if (task >= series.size()) {
				return;
			}
			auto &report = reports[task];
			if (stop_requested_.load()) {
				report.status = TaskStatus::Cancelled;
				continue;
			}
			try {
				report = analyse(series[task], utils::MersenneTwisterSource::deriveSeed(options_.seed, task));
			} catch (const std::exception &e) {
				report = SeriesReport{};
				report.identifier = series[task].identifier();
				report.status = TaskStatus::Failed;
				report.error = e.what();
				failures.fetch_add(1);
				PERFSHIFT_WARN("Analysis of '{}' failed: {}", report.identifier.toString(), report.error);
			}
			if (on_report) {
				std::lock_guard<std::mutex> lock(callback_mutex);
				try {
					on_report(task, report);
				} catch (const std::exception &e) {
					PERFSHIFT_ERROR("Report callback for '{}' threw: {}", report.identifier.toString(), e.what());
				}
			}
		}
	};

	const std::size_t pool_size = std::min(options_.pool_size, series.size());
	std::vector<std::thread> workers;
	workers.reserve(pool_size - 1);
	try {
		for (std::size_t i = 1; i < pool_size; ++i) {
			workers.emplace_back(worker);
		}
	} catch (const std::system_error &e) {
		PERFSHIFT_ERROR("Started {} of {} worker threads: {}", workers.size(), pool_size - 1, e.what());
	}

	// The calling thread is always one of the workers.
	worker();

	for (auto &thread : workers) {
		thread.join();
	}

	PERFSHIFT_INFO("Batch analysed {} series on {} threads, {} failed.", series.size(), workers.size() + 1,
	               failures.load());
	return reports;
}

} // namespace perfshift::batch
