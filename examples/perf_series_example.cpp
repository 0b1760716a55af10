#include "perfshift/quick.hpp"
#include "perfshift/utils/logging.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace perfshift;

namespace {

// Throughput of a nightly benchmark: a regression after commit 80, a fix at 150,
// and two noisy runs on a bad host.
std::vector<double> synthesizeThroughput(std::size_t length, unsigned int seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 60.0);

	std::vector<double> data;
	data.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		double value = 5000.0 + noise(rng);
		if (i >= 80 && i < 150) {
			value -= 900.0; // regression
		}
		if (i == 40 || i == 170) {
			value -= 2500.0; // noisy host
		}
		data.push_back(value);
	}
	return data;
}

void printIndices(const std::string &label, const std::vector<std::size_t> &indices) {
	std::cout << label;
	if (indices.empty()) {
		std::cout << " none\n";
		return;
	}
	std::cout << ' ';
	for (std::size_t i = 0; i < indices.size(); ++i) {
		std::cout << indices[i];
		if (i + 1 < indices.size()) {
			std::cout << ", ";
		}
	}
	std::cout << '\n';
}

void printReport(const batch::SeriesReport &report) {
	std::cout << "\n== " << report.identifier.toString() << " ==\n";
	if (report.status != batch::TaskStatus::Completed) {
		std::cout << "failed: " << report.error << '\n';
		return;
	}
	if (report.outliers) {
		printIndices("Confirmed outliers:", report.outliers->confirmed());
	}
	for (const auto &description : report.descriptions) {
		std::cout << "Change at " << description.change_point.index << " (p=" << std::setprecision(3)
		          << description.change_point.probability << ", between " << description.range.start << " and "
		          << description.range.end << "): ";
		if (description.before && description.after) {
			std::cout << std::fixed << std::setprecision(1) << description.before->mean << " -> "
			          << description.after->mean << ", ";
		}
		std::cout << changepoint::toString(description.category) << '\n';
		std::cout.unsetf(std::ios::fixed);
	}
}

} // namespace

int main() {
#ifndef PERFSHIFT_NO_LOGGING
	utils::Logging::init(spdlog::level::warn);
#endif

	const auto throughput = synthesizeThroughput(200, 11);

	const auto outliers = quick::detectOutliers(throughput, 0.05, std::nullopt, true);
	printIndices("GESD-MAD outliers:", outliers.confirmed());

	std::vector<std::size_t> raw_points;
	for (const auto &point : quick::detectChangePoints(throughput)) {
		raw_points.push_back(point.index);
	}
	printIndices("Change points on the raw series:", raw_points);

	std::vector<core::PerformanceSeries> batch_input{
	    core::PerformanceSeries({"sys-perf", "linux-standalone", "crud", "insert_vector", "16"}, throughput),
	    core::PerformanceSeries({"sys-perf", "linux-standalone", "crud", "update_vector", "16"},
	                            synthesizeThroughput(120, 23)),
	    core::PerformanceSeries({"sys-perf", "linux-standalone", "crud", "broken_run", "16"}, {}),
	};

	batch::BatchOptions options;
	options.use_mad = true;
	options.mask_outliers = true;
	batch::BatchRunner runner(options);
	const auto reports = runner.run(batch_input, [&](std::size_t position, const batch::SeriesReport &report) {
		std::cout << "finished " << position + 1 << '/' << batch_input.size() << ": " << report.identifier.toString()
		          << '\n';
	});
	for (const auto &report : reports) {
		printReport(report);
	}
	return 0;
}
