#pragma once

#include "downhill/optimization/convergence_tracker.hpp"

#include <cstddef>
#include <functional>
#include <limits>
#include <vector>

namespace downhill::optimization {

/**
 * @class NelderMeadOptimizer
 * @brief Derivative-free local minimizer driving a single simplex.
 *
 * Each iteration sorts the simplex, checks for a stalled best score, and
 * replaces the worst vertex by a reflected, expanded or contracted point, or
 * shrinks the whole simplex towards the best vertex.
 *
 * The stall counter is reset at the start of every run, so one instance may
 * serve consecutive runs. Concurrent calls on the same instance are not
 * supported.
 */
class NelderMeadOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &)>;

	struct Options {
		double alpha = 1.0; // reflection
		double gamma = 2.0; // expansion
		double rho = 0.5;   // contraction
		double sigma = 0.5; // shrink
		double convergence_threshold = 1e-14;
		int stall_limit = 12;

		/// @throws core::ValidationError on non-positive or non-finite values.
		void validate() const;
	};

	enum class Termination { Converged, Exhausted };

	struct MoveCounts {
		int reflections = 0;
		int expansions = 0;
		int contractions = 0;
		int shrinks = 0;
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		bool converged = false;
		int iterations = 0;
		int evaluations = 0;
		Termination termination = Termination::Exhausted;
		MoveCounts moves;
	};

	/// @throws core::ValidationError for a null objective or a zero dimension.
	NelderMeadOptimizer(Objective objective, std::size_t dimension);
	NelderMeadOptimizer(Objective objective, std::size_t dimension, Options options);

	/**
	 * @brief Minimizes the objective starting from @p start.
	 *
	 * With @p max_iterations == 0 no iteration runs and the result is the
	 * start point with its score. The previous-best reference is seeded from
	 * the start vertex, before the initial simplex is sorted.
	 *
	 * @throws core::ValidationError when the arguments or options are invalid.
	 * @throws core::EvaluationError when the objective returns NaN or infinity.
	 * Exceptions thrown by the objective propagate unchanged.
	 */
	Result optimize(int max_iterations, const std::vector<double> &start, double step);

	std::size_t dimension() const {
		return dimension_;
	}

	Options &options() {
		return options_;
	}

	const Options &options() const {
		return options_;
	}

	/// Convergence state as left by the most recent run.
	const ConvergenceTracker &tracker() const {
		return tracker_;
	}

private:
	double evaluate(const std::vector<double> &point, Result &result) const;

	Objective objective_;
	std::size_t dimension_;
	Options options_;
	ConvergenceTracker tracker_;
};

} // namespace downhill::optimization
