#include "downhill/quick.hpp"
#include "downhill/utils/logging.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace downhill;

namespace {

double rosenbrock(const std::vector<double> &x) {
	const double a = 1.0 - x[0];
	const double b = x[1] - x[0] * x[0];
	return a * a + 100.0 * b * b;
}

double sphere(const std::vector<double> &x) {
	double sum = 0.0;
	for (double v : x) {
		sum += v * v;
	}
	return sum;
}

double shiftedQuadratic(const std::vector<double> &x) {
	double sum = 0.0;
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double diff = x[i] - static_cast<double>(i + 1);
		sum += diff * diff;
	}
	return sum;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printResult(const optimization::NelderMeadOptimizer::Result &result) {
	std::cout << "  converged:   " << (result.converged ? "yes" : "no") << "\n";
	std::cout << "  iterations:  " << result.iterations << " (" << result.evaluations << " evaluations)\n";
	std::cout << "  moves:       reflect=" << result.moves.reflections
	          << " expand=" << result.moves.expansions << " contract=" << result.moves.contractions
	          << " shrink=" << result.moves.shrinks << "\n";
	std::cout << "  best point: ";
	for (double v : result.best) {
		std::cout << " " << std::setprecision(12) << v;
	}
	std::cout << "\n  best value:  " << std::scientific << result.value << "\n";
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::debug);

	printHeader("Rosenbrock from (-1, 1), step 0.5");
	printResult(quick::minimize(rosenbrock, {-1.0, 1.0}, 0.5, 200));

	printHeader("Sphere in 4 dimensions, negative step");
	printResult(quick::minimize(sphere, {3.0, -2.0, 1.5, 0.5}, -1.0, 2000));

	printHeader("Shifted quadratic, custom coefficients");
	optimization::NelderMeadOptimizer::Options options;
	options.gamma = 2.5;
	options.sigma = 0.4;
	options.stall_limit = 20;
	printResult(quick::minimize(shiftedQuadratic, {0.0, 0.0, 0.0}, 1.0, 1000, options));

	return 0;
}
