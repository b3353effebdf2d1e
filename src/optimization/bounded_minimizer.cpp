#include "commodex/optimization/bounded_minimizer.hpp"
#include "commodex/optimization/lbfgs_optimizer.hpp"
#include "commodex/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>

namespace commodex::optimization {

std::vector<double> numericGradient(const BoundedMinimizer::Objective &objective, const std::vector<double> &x,
                                    const std::vector<double> &lower, const std::vector<double> &upper,
                                    double step) {
	std::vector<double> gradient(x.size(), 0.0);
	std::vector<double> shifted = x;
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double h = step * std::max(1.0, std::abs(x[i]));
		const double hi = std::min(upper[i], x[i] + h);
		const double lo = std::max(lower[i], x[i] - h);
		if (hi <= lo) {
			continue;
		}
		shifted[i] = hi;
		const double f_hi = objective(shifted);
		shifted[i] = lo;
		const double f_lo = objective(shifted);
		shifted[i] = x[i];
		gradient[i] = (f_hi - f_lo) / (hi - lo);
		if (!std::isfinite(gradient[i])) {
			gradient[i] = 0.0;
		}
	}
	return gradient;
}

MinimizerResult LbfgsMinimizer::minimize(const Objective &objective, const std::vector<double> &x0,
                                         const std::vector<double> &lower, const std::vector<double> &upper,
                                         BudgetTracker &budget) const {
	MinimizerResult result;
	if (budget.exhausted()) {
		result.x = x0;
		result.value = objective(x0);
		result.budget_exhausted = true;
		result.message = "No budget left";
		return result;
	}

	LBFGSOptimizer::Options options;
	options.max_iterations = budget.remainingIterations();
	options.deadline = budget.deadline();

	auto with_gradient = [&](const std::vector<double> &x, std::vector<double> &grad) {
		grad = numericGradient(objective, x, lower, upper, gradient_step_);
		return objective(x);
	};

	const auto solved = LBFGSOptimizer::minimize(with_gradient, x0, lower, upper, options);
	budget.consume(std::max(solved.iterations, 1));

	result.x = solved.x;
	result.value = objective(solved.x);
	result.iterations = solved.iterations;
	result.converged = solved.converged;
	result.budget_exhausted = solved.budget_exhausted;
	result.message = solved.message;
	return result;
}

MinimizerResult NelderMeadMinimizer::minimize(const Objective &objective, const std::vector<double> &x0,
                                              const std::vector<double> &lower, const std::vector<double> &upper,
                                              BudgetTracker &budget) const {
	MinimizerResult result;
	if (budget.exhausted()) {
		result.x = x0;
		result.value = objective(x0);
		result.budget_exhausted = true;
		result.message = "No budget left";
		return result;
	}

	utils::NelderMeadOptimizer::Options options;
	options.max_iterations = budget.remainingIterations();
	options.deadline = budget.deadline();
	options.tolerance = tolerance_;
	options.step = step_;

	const auto solved = utils::NelderMeadOptimizer().minimize(objective, x0, options, lower, upper);
	budget.consume(solved.iterations);

	result.x = solved.best;
	result.value = solved.value;
	result.iterations = solved.iterations;
	result.converged = solved.converged;
	result.budget_exhausted = solved.budget_exhausted;
	result.message = solved.converged ? "Simplex collapsed" : "Stopped before simplex collapse";
	return result;
}

} // namespace commodex::optimization
