#pragma once

#include <string>

namespace downhill::optimization {

/// The four ways an iteration can reshape the simplex.
enum class Move { Reflect, Expand, Contract, Shrink };

/**
 * @brief First decision of an iteration, taken from the reflected score.
 *
 * Reflect when best <= reflected < second_worst, Expand when the reflected
 * point beats the best vertex, Contract otherwise.
 */
Move classifyReflection(double reflected, double best, double second_worst);

/// Expand when the expanded point beats the reflected one, else Reflect.
Move resolveExpansion(double expanded, double reflected);

/// Contract when the contracted point beats the worst vertex, else Shrink.
Move resolveContraction(double contracted, double worst);

std::string toString(Move move);

} // namespace downhill::optimization
