#pragma once

namespace downhill::optimization {

/**
 * @class ConvergenceTracker
 * @brief Counts consecutive checks in which the best score failed to improve.
 *
 * An improvement only counts when it exceeds the threshold; the run is
 * considered converged once the stall count reaches the stall limit.
 */
class ConvergenceTracker {
public:
	ConvergenceTracker(double threshold, int stall_limit);

	/// Clears the stall count and seeds the reference score.
	void reset(double previous_best);

	/**
	 * @brief Records the current best score.
	 * @return true when the stall count has reached the stall limit.
	 */
	bool update(double best);

	int stallCount() const {
		return stall_count_;
	}

	double previousBest() const {
		return previous_best_;
	}

	double threshold() const {
		return threshold_;
	}

	int stallLimit() const {
		return stall_limit_;
	}

private:
	double threshold_;
	int stall_limit_;
	int stall_count_ = 0;
	double previous_best_ = 0.0;
};

} // namespace downhill::optimization
