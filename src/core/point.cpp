#include "downhill/core/point.hpp"

#include <stdexcept>

namespace downhill::core {

std::vector<double> makePoint(double factor, const std::vector<double> &base,
                              const std::vector<double> &other) {
	if (base.size() != other.size()) {
		throw std::invalid_argument("makePoint requires points of equal length.");
	}

	std::vector<double> point(base.size());
	for (std::size_t i = 0; i < base.size(); ++i) {
		point[i] = base[i] + factor * (other[i] - base[i]);
	}
	return point;
}

} // namespace downhill::core
