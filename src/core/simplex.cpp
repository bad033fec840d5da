#include "downhill/core/simplex.hpp"

#include "downhill/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace downhill::core {

Simplex::Simplex(std::vector<double> start, double step) {
	if (start.empty()) {
		throw ValidationError("Simplex start point must have at least one coordinate.");
	}
	if (step == 0.0 || !std::isfinite(step)) {
		throw ValidationError("Simplex step must be finite and non-zero.");
	}

	const std::size_t dim = start.size();
	vertices_.resize(dim + 1);
	for (std::size_t i = 0; i < dim; ++i) {
		auto &position = vertices_[i + 1].position;
		position = start;
		position[i] += step;
	}
	vertices_.front().position = std::move(start);
}

const Vertex &Simplex::vertex(std::size_t index) const {
	if (index >= vertices_.size()) {
		throw std::out_of_range("Simplex vertex index out of range.");
	}
	return vertices_[index];
}

void Simplex::evaluate(const Objective &objective) {
	for (auto &vertex : vertices_) {
		vertex.score = objective(vertex.position);
	}
}

std::vector<double> Simplex::centroid() const {
	const std::size_t n = dimension();
	std::vector<double> center(n, 0.0);

	for (std::size_t i = 0; i < n; ++i) {
		const auto &point = vertices_[i].position;
		for (std::size_t j = 0; j < n; ++j) {
			center[j] += point[j];
		}
	}
	for (double &value : center) {
		value /= static_cast<double>(n);
	}
	return center;
}

void Simplex::sort() {
	const bool all_scored = std::all_of(vertices_.begin(), vertices_.end(),
	                                    [](const Vertex &vertex) { return vertex.isEvaluated(); });
	if (!all_scored) {
		throw std::logic_error("Simplex::sort requires every vertex to be scored.");
	}
	std::sort(vertices_.begin(), vertices_.end(),
	          [](const Vertex &lhs, const Vertex &rhs) { return *lhs.score < *rhs.score; });
}

void Simplex::set(std::size_t index, std::vector<double> position, double score) {
	if (index >= vertices_.size()) {
		throw std::out_of_range("Simplex::set index out of range.");
	}
	if (position.size() != dimension()) {
		throw std::invalid_argument("Simplex::set position length does not match the dimension.");
	}
	vertices_[index].position = std::move(position);
	vertices_[index].score = score;
}

} // namespace downhill::core
