#include "commodex/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace commodex::utils {

namespace {

using Vertex = std::pair<std::vector<double>, double>;

void orderSimplex(std::vector<Vertex> &simplex) {
	std::stable_sort(simplex.begin(), simplex.end(),
	                 [](const Vertex &lhs, const Vertex &rhs) { return lhs.second < rhs.second; });
}

// Centroid of every vertex except the worst.
std::vector<double> centroid(const std::vector<Vertex> &simplex) {
	const std::size_t n = simplex.front().first.size();
	const std::size_t count = simplex.size() - 1;
	std::vector<double> center(n, 0.0);
	for (std::size_t i = 0; i < count; ++i) {
		for (std::size_t j = 0; j < n; ++j) {
			center[j] += simplex[i].first[j];
		}
	}
	for (double &value : center) {
		value /= static_cast<double>(count);
	}
	return center;
}

// center + coefficient * (point - center)
std::vector<double> along(const std::vector<double> &center, const std::vector<double> &point, double coefficient) {
	std::vector<double> result(center.size());
	for (std::size_t i = 0; i < center.size(); ++i) {
		result[i] = center[i] + coefficient * (point[i] - center[i]);
	}
	return result;
}

} // namespace

void NelderMeadOptimizer::enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
                                        const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (i < lower.size()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (i < upper.size()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::simplexSpread(const std::vector<Vertex> &simplex) {
	double mean = 0.0;
	for (const auto &vertex : simplex) {
		mean += vertex.second;
	}
	mean /= static_cast<double>(simplex.size());
	double accum = 0.0;
	for (const auto &vertex : simplex) {
		accum += (vertex.second - mean) * (vertex.second - mean);
	}
	return std::sqrt(accum / static_cast<double>(simplex.size()));
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(
    const std::function<double(const std::vector<double> &)> &objective, const std::vector<double> &initial,
    const Options &options, const std::vector<double> &lower_bounds,
    const std::vector<double> &upper_bounds) const {

	Result result;
	if (initial.empty()) {
		return result;
	}

	const std::size_t n = initial.size();
	auto evaluate = [&](const std::vector<double> &point) {
		const double value = objective(point);
		return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
	};

	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);
	std::vector<double> start = initial;
	enforceBounds(start, lower_bounds, upper_bounds);
	simplex.emplace_back(start, evaluate(start));
	for (std::size_t i = 0; i < n; ++i) {
		std::vector<double> vertex = start;
		vertex[i] += options.step;
		enforceBounds(vertex, lower_bounds, upper_bounds);
		if (vertex[i] == start[i]) {
			// Pinned at the upper bound: step inwards instead.
			vertex[i] -= options.step;
			enforceBounds(vertex, lower_bounds, upper_bounds);
		}
		simplex.emplace_back(vertex, evaluate(vertex));
	}
	orderSimplex(simplex);

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		if (options.deadline && Clock::now() > *options.deadline) {
			result.budget_exhausted = true;
			break;
		}
		result.iterations = iter + 1;

		if (simplexSpread(simplex) < options.tolerance) {
			result.converged = true;
			break;
		}

		const Vertex worst = simplex.back();
		const std::vector<double> center = centroid(simplex);

		auto reflected = along(center, worst.first, -options.alpha);
		enforceBounds(reflected, lower_bounds, upper_bounds);
		const double reflected_value = evaluate(reflected);

		if (reflected_value < simplex.front().second) {
			auto expanded = along(center, reflected, options.gamma);
			enforceBounds(expanded, lower_bounds, upper_bounds);
			const double expanded_value = evaluate(expanded);
			if (expanded_value < reflected_value) {
				simplex.back() = {std::move(expanded), expanded_value};
			} else {
				simplex.back() = {std::move(reflected), reflected_value};
			}
		} else if (reflected_value < simplex[simplex.size() - 2].second) {
			simplex.back() = {std::move(reflected), reflected_value};
		} else {
			auto contracted = along(center, worst.first, options.rho);
			enforceBounds(contracted, lower_bounds, upper_bounds);
			const double contracted_value = evaluate(contracted);

			if (contracted_value < worst.second) {
				simplex.back() = {std::move(contracted), contracted_value};
			} else {
				const auto best_point = simplex.front().first;
				for (std::size_t i = 1; i < simplex.size(); ++i) {
					simplex[i].first = along(best_point, simplex[i].first, options.sigma);
					enforceBounds(simplex[i].first, lower_bounds, upper_bounds);
					simplex[i].second = evaluate(simplex[i].first);
				}
			}
		}

		orderSimplex(simplex);
	}

	if (!result.converged && !result.budget_exhausted) {
		result.budget_exhausted = result.iterations >= options.max_iterations;
	}
	result.best = simplex.front().first;
	result.value = simplex.front().second;
	return result;
}

} // namespace commodex::utils
