#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace perfshift::core {

/**
 * @struct SeriesIdentifier
 * @brief Names the test configuration a performance series belongs to.
 */
struct SeriesIdentifier {
	std::string project;
	std::string variant;
	std::string task;
	std::string test;
	std::string thread_level;

	/// "project variant task test thread_level", skipping empty fields.
	std::string toString() const;

	bool operator==(const SeriesIdentifier &other) const {
		return project == other.project && variant == other.variant && task == other.task && test == other.test &&
		       thread_level == other.thread_level;
	}
};

/**
 * @class PerformanceSeries
 * @brief One result per revision, in commit order, for one test configuration.
 *
 * The order of the values is meaningful and is never changed. Revisions are
 * optional; when present there is exactly one per value.
 */
class PerformanceSeries {
public:
	PerformanceSeries() = default;

	/**
	 * @throws std::invalid_argument if revisions are given and their count differs from the value count.
	 */
	PerformanceSeries(SeriesIdentifier identifier, std::vector<double> values,
	                  std::vector<std::string> revisions = {});

	const SeriesIdentifier &identifier() const noexcept {
		return identifier_;
	}

	const std::vector<double> &values() const noexcept {
		return values_;
	}

	const std::vector<std::string> &revisions() const noexcept {
		return revisions_;
	}

	std::size_t size() const noexcept {
		return values_.size();
	}

	bool isEmpty() const noexcept {
		return values_.empty();
	}

	bool hasRevisions() const noexcept {
		return !revisions_.empty();
	}

	/**
	 * @brief Revision of the value at `index`, if revisions are attached.
	 * @throws std::out_of_range for an index past the end.
	 */
	std::optional<std::string> revisionAt(std::size_t index) const;

	/**
	 * @brief Copy of values [begin, end) with matching revisions.
	 * @throws std::out_of_range if the range is not within the series.
	 */
	PerformanceSeries slice(std::size_t begin, std::size_t end) const;

private:
	SeriesIdentifier identifier_;
	std::vector<double> values_;
	std::vector<std::string> revisions_;
};

} // namespace perfshift::core
