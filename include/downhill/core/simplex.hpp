#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace downhill::core {

/**
 * @struct Vertex
 * @brief A simplex corner: a position and, once evaluated, its objective score.
 */
struct Vertex {
	std::vector<double> position;
	std::optional<double> score;

	bool isEvaluated() const {
		return score.has_value();
	}
};

/**
 * @class Simplex
 * @brief The dimension + 1 vertices the Nelder-Mead search deforms.
 *
 * The vertex count is fixed at construction. Vertices are only ever replaced
 * through set(), never added or removed. After sort() vertex 0 holds the
 * lowest score and vertex dimension() the highest.
 */
class Simplex {
public:
	using Objective = std::function<double(const std::vector<double> &)>;
	using const_iterator = std::vector<Vertex>::const_iterator;

	/**
	 * @brief Builds the initial simplex around @p start.
	 *
	 * Vertex 0 is @p start itself, vertex i (i >= 1) is @p start with
	 * coordinate i - 1 moved by @p step. The start vector is copied, so the
	 * caller's vector is never modified. Scores are left unevaluated.
	 *
	 * @throws ValidationError for an empty start or a zero/non-finite step.
	 */
	Simplex(std::vector<double> start, double step);

	/// Problem dimension d.
	std::size_t dimension() const {
		return vertices_.size() - 1;
	}

	/// Number of vertices (always dimension() + 1).
	std::size_t size() const {
		return vertices_.size();
	}

	/// Bounds-checked vertex access.
	const Vertex &vertex(std::size_t index) const;

	const Vertex &best() const {
		return vertices_.front();
	}

	const Vertex &worst() const {
		return vertices_.back();
	}

	/// Vertex at index dimension() - 1; the best vertex when dimension() == 1.
	const Vertex &secondWorst() const {
		return vertices_[vertices_.size() - 2];
	}

	const_iterator begin() const {
		return vertices_.begin();
	}

	const_iterator end() const {
		return vertices_.end();
	}

	/// Scores every vertex with @p objective, in index order.
	void evaluate(const Objective &objective);

	/**
	 * @brief Mean position of vertices 0 .. dimension() - 1.
	 *
	 * Expects a sorted simplex so that the excluded last vertex is the worst.
	 */
	std::vector<double> centroid() const;

	/**
	 * @brief Orders vertices by ascending score. Ties are not kept stable.
	 * @throws std::logic_error when a vertex has not been evaluated.
	 */
	void sort();

	/**
	 * @brief Replaces the position and score of vertex @p index.
	 * @throws std::out_of_range when @p index >= size().
	 * @throws std::invalid_argument when @p position has the wrong length.
	 */
	void set(std::size_t index, std::vector<double> position, double score);

private:
	std::vector<Vertex> vertices_;
};

} // namespace downhill::core
