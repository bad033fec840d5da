#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "downhill/core/errors.hpp"
#include "downhill/core/simplex.hpp"

#include <stdexcept>
#include <vector>

using downhill::core::Simplex;
using downhill::core::ValidationError;

TEST_CASE("Simplex steps along each coordinate from the start point", "[core][simplex]") {
	const std::vector<double> start{0.5, -1.0, 2.0, 4.0};
	Simplex simplex(start, 0.25);

	REQUIRE(simplex.dimension() == 4);
	REQUIRE(simplex.size() == 5);
	REQUIRE(simplex.vertex(0).position == start);

	for (std::size_t i = 1; i < simplex.size(); ++i) {
		const auto &position = simplex.vertex(i).position;
		REQUIRE(position.size() == start.size());
		for (std::size_t j = 0; j < start.size(); ++j) {
			if (j == i - 1) {
				REQUIRE(position[j] == Catch::Approx(start[j] + 0.25));
			} else {
				REQUIRE(position[j] == start[j]);
			}
		}
	}

	for (const auto &vertex : simplex) {
		REQUIRE_FALSE(vertex.isEvaluated());
	}
}

TEST_CASE("Simplex accepts a negative step", "[core][simplex]") {
	Simplex simplex({1.0, 1.0}, -0.5);

	REQUIRE(simplex.vertex(1).position == std::vector<double>{0.5, 1.0});
	REQUIRE(simplex.vertex(2).position == std::vector<double>{1.0, 0.5});
}

TEST_CASE("Simplex owns a copy of the start point", "[core][simplex]") {
	std::vector<double> start{1.0, 2.0};
	Simplex simplex(start, 1.0);
	simplex.evaluate([](const std::vector<double> &x) { return x[0] + x[1]; });

	simplex.set(0, {9.0, 9.0}, 18.0);
	REQUIRE(start == std::vector<double>{1.0, 2.0});

	start[0] = -5.0;
	REQUIRE(simplex.vertex(1).position == std::vector<double>{2.0, 2.0});
}

TEST_CASE("Simplex centroid excludes the last vertex", "[core][simplex]") {
	Simplex simplex({0.0, 0.0, 0.0}, 3.0);

	const auto center = simplex.centroid();
	REQUIRE(center.size() == 3);
	REQUIRE(center[0] == Catch::Approx(1.0));
	REQUIRE(center[1] == Catch::Approx(1.0));
	REQUIRE(center[2] == Catch::Approx(0.0));
}

TEST_CASE("Simplex sort orders vertices by ascending score", "[core][simplex]") {
	Simplex simplex({0.0, 0.0, 0.0}, 1.0);
	const std::vector<double> scores{3.0, -1.0, 4.0, 2.0};
	for (std::size_t i = 0; i < scores.size(); ++i) {
		simplex.set(i, simplex.vertex(i).position, scores[i]);
	}

	simplex.sort();

	for (std::size_t i = 1; i < simplex.size(); ++i) {
		REQUIRE(*simplex.vertex(i - 1).score <= *simplex.vertex(i).score);
	}
	REQUIRE(*simplex.best().score == Catch::Approx(-1.0));
	REQUIRE(simplex.best().position == std::vector<double>{1.0, 0.0, 0.0});
	REQUIRE(*simplex.worst().score == Catch::Approx(4.0));
	REQUIRE(simplex.worst().position == std::vector<double>{0.0, 1.0, 0.0});
	REQUIRE(*simplex.secondWorst().score == Catch::Approx(3.0));
}

TEST_CASE("Simplex sort requires evaluated vertices", "[core][simplex]") {
	Simplex simplex({0.0, 0.0}, 1.0);
	REQUIRE_THROWS_AS(simplex.sort(), std::logic_error);

	simplex.evaluate([](const std::vector<double> &x) { return x[0] - x[1]; });
	REQUIRE_NOTHROW(simplex.sort());
	REQUIRE(*simplex.best().score == Catch::Approx(-1.0));
}

TEST_CASE("Simplex set fails fast on bad input", "[core][simplex]") {
	Simplex simplex({0.0, 0.0}, 1.0);

	REQUIRE_THROWS_AS(simplex.set(3, {1.0, 1.0}, 0.0), std::out_of_range);
	REQUIRE_THROWS_AS(simplex.set(1, {1.0}, 0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(simplex.vertex(3), std::out_of_range);

	simplex.set(2, {5.0, 6.0}, 7.0);
	REQUIRE(simplex.vertex(2).position == std::vector<double>{5.0, 6.0});
	REQUIRE(*simplex.vertex(2).score == Catch::Approx(7.0));
}

TEST_CASE("Simplex rejects degenerate construction", "[core][simplex]") {
	REQUIRE_THROWS_AS(Simplex({}, 1.0), ValidationError);
	REQUIRE_THROWS_AS(Simplex({1.0, 2.0}, 0.0), ValidationError);
}
