#include "perfshift/core/series.hpp"

#include <stdexcept>
#include <utility>

namespace perfshift::core {

std::string SeriesIdentifier::toString() const {
	std::string result;
	for (const auto *field : {&project, &variant, &task, &test, &thread_level}) {
		if (field->empty()) {
			continue;
		}
		if (!result.empty()) {
			result += ' ';
		}
		result += *field;
	}
	return result;
}

PerformanceSeries::PerformanceSeries(SeriesIdentifier identifier, std::vector<double> values,
                                     std::vector<std::string> revisions)
    : identifier_(std::move(identifier)), values_(std::move(values)), revisions_(std::move(revisions)) {
	if (!revisions_.empty() && revisions_.size() != values_.size()) {
		throw std::invalid_argument("PerformanceSeries revisions must match the number of values.");
	}
}

std::optional<std::string> PerformanceSeries::revisionAt(std::size_t index) const {
	if (index >= values_.size()) {
		throw std::out_of_range("PerformanceSeries index out of range");
	}
	if (revisions_.empty()) {
		return std::nullopt;
	}
	return revisions_[index];
}

PerformanceSeries PerformanceSeries::slice(std::size_t begin, std::size_t end) const {
	if (begin > end || end > values_.size()) {
		throw std::out_of_range("PerformanceSeries slice is outside the series");
	}
	std::vector<double> values(values_.begin() + static_cast<std::ptrdiff_t>(begin),
	                           values_.begin() + static_cast<std::ptrdiff_t>(end));
	std::vector<std::string> revisions;
	if (!revisions_.empty()) {
		revisions.assign(revisions_.begin() + static_cast<std::ptrdiff_t>(begin),
		                 revisions_.begin() + static_cast<std::ptrdiff_t>(end));
	}
	return PerformanceSeries(identifier_, std::move(values), std::move(revisions));
}

} // namespace perfshift::core
