#pragma once

#include "downhill/optimization/nelder_mead.hpp"

#include <utility>
#include <vector>

namespace downhill::quick {

/**
 * @brief One-call minimization with an optimizer sized from @p start.
 */
inline optimization::NelderMeadOptimizer::Result
minimize(optimization::NelderMeadOptimizer::Objective objective, const std::vector<double> &start,
         double step, int max_iterations = 1000,
         const optimization::NelderMeadOptimizer::Options &options = {}) {
	optimization::NelderMeadOptimizer optimizer(std::move(objective), start.size(), options);
	return optimizer.optimize(max_iterations, start, step);
}

} // namespace downhill::quick
