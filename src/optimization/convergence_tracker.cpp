#include "downhill/optimization/convergence_tracker.hpp"

namespace downhill::optimization {

ConvergenceTracker::ConvergenceTracker(double threshold, int stall_limit)
    : threshold_(threshold), stall_limit_(stall_limit) {
}

void ConvergenceTracker::reset(double previous_best) {
	stall_count_ = 0;
	previous_best_ = previous_best;
}

bool ConvergenceTracker::update(double best) {
	if (best < previous_best_ - threshold_) {
		stall_count_ = 0;
		previous_best_ = best;
	} else {
		++stall_count_;
	}
	return stall_count_ >= stall_limit_;
}

} // namespace downhill::optimization
