#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace perfshift {

/**
 * @class InvalidInputError
 * @brief Raised when a detector is handed input it cannot analyse.
 *
 * Covers empty series, non-finite values and out-of-range parameters. It is
 * always raised before any work is done, so no partial result exists.
 */
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &message) : std::invalid_argument(message) {}
};

namespace utils {

/**
 * @brief Throws InvalidInputError unless the series is non-empty and finite.
 * @param series The values to check.
 * @param context A short name of the caller, used in the message.
 */
void requireFiniteSeries(const std::vector<double> &series, const char *context);

/**
 * @brief Throws InvalidInputError unless 0 < significance < 1.
 */
void requireSignificance(double significance, const char *context);

} // namespace utils

} // namespace perfshift
