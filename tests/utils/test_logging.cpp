#include <catch2/catch_test_macros.hpp>

#include "downhill/optimization/nelder_mead.hpp"
#include "downhill/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <vector>

using downhill::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "downhill");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Optimizer runs with trace logging enabled", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	const auto first_level = logger->level();
	Logging::init(spdlog::level::trace);

	auto parabola = [](const std::vector<double> &x) { return (x[0] - 3.0) * (x[0] - 3.0); };
	downhill::optimization::NelderMeadOptimizer optimizer(parabola, 1);
	const auto result = optimizer.optimize(100, {0.0}, 1.0);
	REQUIRE(result.converged);

	logger->set_level(first_level);
	logger->flush_on(first_level);
}
