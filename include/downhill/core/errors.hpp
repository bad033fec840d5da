#pragma once

#include <stdexcept>
#include <string>

namespace downhill::core {

/**
 * @brief Raised when a run is configured inconsistently.
 *
 * Dimension mismatches, a zero step, a negative iteration budget and invalid
 * coefficients are all reported through this type, always before the
 * objective is evaluated for the first time.
 */
class ValidationError : public std::invalid_argument {
public:
	explicit ValidationError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief Raised when the objective returns a NaN or infinite score.
 */
class EvaluationError : public std::runtime_error {
public:
	EvaluationError(const std::string &message, double score)
	    : std::runtime_error(message), score_(score) {}

	/// The non-finite score that triggered the error.
	double score() const {
		return score_;
	}

private:
	double score_;
};

} // namespace downhill::core
