#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/optimization/bounded_minimizer.hpp"
#include "commodex/optimization/lbfgs_optimizer.hpp"

#include <chrono>
#include <vector>

using namespace commodex;
using optimization::BudgetTracker;

namespace {

double shiftedQuadratic(const std::vector<double> &x) {
	return (x[0] - 1.5) * (x[0] - 1.5) + 4.0 * (x[1] + 0.5) * (x[1] + 0.5);
}

} // namespace

TEST_CASE("BudgetTracker draws iterations from one allowance", "[optimization][budget]") {
	core::SolverBudget budget;
	budget.max_iterations = 10;
	BudgetTracker tracker(budget);

	REQUIRE(tracker.remainingIterations() == 10);
	REQUIRE_FALSE(tracker.exhausted());
	tracker.consume(7);
	REQUIRE(tracker.remainingIterations() == 3);
	tracker.consume(5);
	REQUIRE(tracker.remainingIterations() == 0);
	REQUIRE(tracker.usedIterations() == 12);
	REQUIRE(tracker.exhausted());
}

TEST_CASE("numericGradient respects the box", "[optimization][gradient]") {
	const std::vector<double> lower{0.0, -1.0};
	const std::vector<double> upper{3.0, 1.0};

	const auto inside = optimization::numericGradient(shiftedQuadratic, {0.5, 0.5}, lower, upper, 1e-5);
	REQUIRE(inside[0] == Catch::Approx(-2.0).margin(1e-4));
	REQUIRE(inside[1] == Catch::Approx(8.0).margin(1e-4));

	const auto pinned = optimization::numericGradient(shiftedQuadratic, {0.0, 0.0}, {0.0, 0.0}, {0.0, 1.0}, 1e-5);
	REQUIRE(pinned[0] == 0.0);
	REQUIRE(pinned[1] == Catch::Approx(4.0).margin(1e-3));
}

TEST_CASE("LBFGSOptimizer stops on the active bound", "[optimization][lbfgs]") {
	auto objective = [](const std::vector<double> &x, std::vector<double> &grad) {
		grad.resize(2);
		grad[0] = 2.0 * (x[0] - 1.5);
		grad[1] = 8.0 * (x[1] + 0.5);
		return shiftedQuadratic(x);
	};

	const auto result =
	    optimization::LBFGSOptimizer::minimize(objective, {0.2, 0.2}, {0.0, 0.0}, {1.0, 1.0});
	REQUIRE(result.converged);
	REQUIRE(result.x[0] == Catch::Approx(1.0).margin(1e-6));
	REQUIRE(result.x[1] == Catch::Approx(0.0).margin(1e-6));
	REQUIRE(result.fx == Catch::Approx(1.25).margin(1e-6));

	const optimization::LBFGSOptimizer::Options defaults;
	REQUIRE(defaults.max_iterations == 200);
	REQUIRE(defaults.m == 10);
	REQUIRE_FALSE(defaults.deadline.has_value());
}

TEST_CASE("Both minimizers reach the interior optimum", "[optimization][minimizer]") {
	const std::vector<double> lower{-5.0, -5.0};
	const std::vector<double> upper{5.0, 5.0};
	core::SolverBudget budget;
	budget.max_iterations = 2000;

	SECTION("L-BFGS-B") {
		BudgetTracker tracker(budget);
		const optimization::LbfgsMinimizer minimizer;
		const auto result = minimizer.minimize(shiftedQuadratic, {0.0, 0.0}, lower, upper, tracker);
		REQUIRE(minimizer.name() == "L-BFGS-B");
		REQUIRE(result.x[0] == Catch::Approx(1.5).margin(1e-3));
		REQUIRE(result.x[1] == Catch::Approx(-0.5).margin(1e-3));
		REQUIRE(tracker.usedIterations() >= 1);
	}

	SECTION("Nelder-Mead") {
		BudgetTracker tracker(budget);
		const optimization::NelderMeadMinimizer minimizer;
		const auto result = minimizer.minimize(shiftedQuadratic, {0.0, 0.0}, lower, upper, tracker);
		REQUIRE(minimizer.name() == "Nelder-Mead");
		REQUIRE(result.converged);
		REQUIRE(result.x[0] == Catch::Approx(1.5).margin(1e-3));
		REQUIRE(result.x[1] == Catch::Approx(-0.5).margin(1e-3));
	}
}

TEST_CASE("An exhausted budget returns the start point", "[optimization][budget]") {
	core::SolverBudget budget;
	budget.max_iterations = 0;
	BudgetTracker tracker(budget);

	const auto result = optimization::NelderMeadMinimizer().minimize(shiftedQuadratic, {0.0, 0.0}, {-5.0, -5.0},
	                                                                 {5.0, 5.0}, tracker);
	REQUIRE(result.budget_exhausted);
	REQUIRE_FALSE(result.converged);
	REQUIRE(result.x == std::vector<double>{0.0, 0.0});
	REQUIRE(result.value == Catch::Approx(shiftedQuadratic({0.0, 0.0})));
}
