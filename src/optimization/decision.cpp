#include "downhill/optimization/decision.hpp"

namespace downhill::optimization {

Move classifyReflection(double reflected, double best, double second_worst) {
	if (best <= reflected && reflected < second_worst) {
		return Move::Reflect;
	}
	if (reflected < best) {
		return Move::Expand;
	}
	return Move::Contract;
}

Move resolveExpansion(double expanded, double reflected) {
	return expanded < reflected ? Move::Expand : Move::Reflect;
}

Move resolveContraction(double contracted, double worst) {
	return contracted < worst ? Move::Contract : Move::Shrink;
}

std::string toString(Move move) {
	switch (move) {
	case Move::Reflect:
		return "reflect";
	case Move::Expand:
		return "expand";
	case Move::Contract:
		return "contract";
	case Move::Shrink:
		return "shrink";
	default:
		return "unknown";
	}
}

} // namespace downhill::optimization
