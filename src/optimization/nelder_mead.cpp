#include "downhill/optimization/nelder_mead.hpp"

#include "downhill/core/errors.hpp"
#include "downhill/core/point.hpp"
#include "downhill/core/simplex.hpp"
#include "downhill/optimization/decision.hpp"
#include "downhill/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace downhill::optimization {

namespace {

bool positiveFinite(double value) {
	return std::isfinite(value) && value > 0.0;
}

} // namespace

void NelderMeadOptimizer::Options::validate() const {
	if (!positiveFinite(alpha) || !positiveFinite(gamma) || !positiveFinite(rho) || !positiveFinite(sigma)) {
		throw core::ValidationError("Nelder-Mead coefficients must be finite and positive.");
	}
	if (!std::isfinite(convergence_threshold) || convergence_threshold < 0.0) {
		throw core::ValidationError("Convergence threshold must be finite and non-negative.");
	}
	if (stall_limit < 1) {
		throw core::ValidationError("Stall limit must be at least 1.");
	}
}

NelderMeadOptimizer::NelderMeadOptimizer(Objective objective, std::size_t dimension)
    : NelderMeadOptimizer(std::move(objective), dimension, Options()) {
}

NelderMeadOptimizer::NelderMeadOptimizer(Objective objective, std::size_t dimension, Options options)
    : objective_(std::move(objective)), dimension_(dimension), options_(options),
      tracker_(options.convergence_threshold, options.stall_limit) {
	if (!objective_) {
		throw core::ValidationError("Nelder-Mead objective must be callable.");
	}
	if (dimension_ == 0) {
		throw core::ValidationError("Nelder-Mead dimension must be positive.");
	}
}

double NelderMeadOptimizer::evaluate(const std::vector<double> &point, Result &result) const {
	const double score = objective_(point);
	++result.evaluations;
	if (!std::isfinite(score)) {
		DOWNHILL_ERROR("Objective returned non-finite score {} after {} evaluations", score,
		               result.evaluations);
		throw core::EvaluationError("Objective returned a non-finite score.", score);
	}
	return score;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::optimize(int max_iterations,
                                                          const std::vector<double> &start,
                                                          double step) {
	if (max_iterations < 0) {
		throw core::ValidationError("Iteration budget must be non-negative.");
	}
	if (start.size() != dimension_) {
		throw core::ValidationError("Start point length does not match the optimizer dimension.");
	}
	if (!std::all_of(start.begin(), start.end(), [](double x) { return std::isfinite(x); })) {
		throw core::ValidationError("Start point coordinates must be finite.");
	}
	if (step == 0.0 || !std::isfinite(step)) {
		throw core::ValidationError("Step must be finite and non-zero.");
	}
	options_.validate();

	DOWNHILL_DEBUG("Nelder-Mead run: dimension={}, max_iterations={}, step={}", dimension_,
	               max_iterations, step);

	Result result;
	core::Simplex simplex(start, step);
	simplex.evaluate([&](const std::vector<double> &point) { return evaluate(point, result); });

	tracker_ = ConvergenceTracker(options_.convergence_threshold, options_.stall_limit);
	tracker_.reset(*simplex.best().score);

	const std::size_t worst_index = dimension_;
	bool converged = false;

	for (int iter = 0; iter < max_iterations; ++iter) {
		simplex.sort();
		result.iterations = iter + 1;

		const double best = *simplex.best().score;
		if (tracker_.update(best)) {
			converged = true;
			break;
		}

		const std::vector<double> center = simplex.centroid();
		const core::Vertex worst = simplex.worst();

		auto reflected = core::makePoint(-options_.alpha, center, worst.position);
		const double reflected_score = evaluate(reflected, result);

		Move move = classifyReflection(reflected_score, best, *simplex.secondWorst().score);
		if (move == Move::Expand) {
			auto expanded = core::makePoint(options_.gamma, center, reflected);
			const double expanded_score = evaluate(expanded, result);
			move = resolveExpansion(expanded_score, reflected_score);
			if (move == Move::Expand) {
				simplex.set(worst_index, std::move(expanded), expanded_score);
			} else {
				simplex.set(worst_index, std::move(reflected), reflected_score);
			}
		} else if (move == Move::Reflect) {
			simplex.set(worst_index, std::move(reflected), reflected_score);
		} else {
			auto contracted = core::makePoint(options_.rho, center, worst.position);
			const double contracted_score = evaluate(contracted, result);
			move = resolveContraction(contracted_score, *worst.score);
			if (move == Move::Contract) {
				simplex.set(worst_index, std::move(contracted), contracted_score);
			} else {
				// Each vertex is scored at its new position.
				const std::vector<double> best_point = simplex.best().position;
				for (std::size_t i = 1; i < simplex.size(); ++i) {
					auto moved = core::makePoint(options_.sigma, best_point, simplex.vertex(i).position);
					const double moved_score = evaluate(moved, result);
					simplex.set(i, std::move(moved), moved_score);
				}
			}
		}

		switch (move) {
		case Move::Reflect:
			++result.moves.reflections;
			break;
		case Move::Expand:
			++result.moves.expansions;
			break;
		case Move::Contract:
			++result.moves.contractions;
			break;
		case Move::Shrink:
			++result.moves.shrinks;
			break;
		}
		DOWNHILL_TRACE("iteration {}: best={} move={}", result.iterations, best, toString(move));
	}

	result.best = simplex.best().position;
	result.value = *simplex.best().score;
	result.converged = converged;
	result.termination = converged ? Termination::Converged : Termination::Exhausted;

	DOWNHILL_DEBUG("Nelder-Mead {} after {} iterations ({} evaluations), value={}",
	               converged ? "converged" : "exhausted its budget", result.iterations,
	               result.evaluations, result.value);
	return result;
}

} // namespace downhill::optimization
