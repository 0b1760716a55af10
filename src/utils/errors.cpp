#include "perfshift/utils/errors.hpp"

#include <cmath>
#include <sstream>

namespace perfshift::utils {

void requireFiniteSeries(const std::vector<double> &series, const char *context) {
	if (series.empty()) {
		throw InvalidInputError(std::string(context) + ": series must not be empty.");
	}
	for (std::size_t i = 0; i < series.size(); ++i) {
		if (!std::isfinite(series[i])) {
			std::ostringstream message;
			message << context << ": series contains a non-finite value at index " << i << ".";
			throw InvalidInputError(message.str());
		}
	}
}

void requireSignificance(double significance, const char *context) {
	if (!(significance > 0.0 && significance < 1.0)) {
		std::ostringstream message;
		message << context << ": invalid significance level " << significance
		        << ", it must lie strictly between 0 and 1.";
		throw InvalidInputError(message.str());
	}
}

} // namespace perfshift::utils
