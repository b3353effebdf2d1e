#pragma once

#include <chrono>
#include <functional>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace commodex::utils {

/// Derivative-free simplex search with optional box bounds and a wall-clock deadline.
class NelderMeadOptimizer {
public:
	using Clock = std::chrono::steady_clock;

	struct Options {
		double alpha = 1.0; // reflection
		double gamma = 2.0; // expansion
		double rho = 0.5;   // contraction
		double sigma = 0.5; // shrink
		double step = 0.05; // initial simplex step
		int max_iterations = 500;
		double tolerance = 1e-6;
		std::optional<Clock::time_point> deadline;
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
		bool budget_exhausted = false;
	};

	Result minimize(const std::function<double(const std::vector<double> &)> &objective,
	                const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {},
	                const std::vector<double> &upper_bounds = {}) const;

private:
	using Vertex = std::pair<std::vector<double>, double>;

	static void enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
	                          const std::vector<double> &upper);

	static double simplexSpread(const std::vector<Vertex> &simplex);
};

} // namespace commodex::utils
