#pragma once

#include <vector>

namespace downhill::core {

/**
 * @brief Affine combination of two points: base + factor * (other - base).
 *
 * Every simplex transformation is an instance of this primitive:
 * reflection uses a negative factor, expansion, contraction and shrink use
 * positive ones with a different choice of @p base and @p other.
 *
 * @throws std::invalid_argument when the two points differ in length.
 */
std::vector<double> makePoint(double factor, const std::vector<double> &base,
                              const std::vector<double> &other);

} // namespace downhill::core
