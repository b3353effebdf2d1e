#pragma once

#include "commodex/core/config.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace commodex::optimization {

/**
 * @brief Tracks one iteration and wall-clock allowance shared by consecutive solver runs.
 *
 * Created from a SolverBudget when a fit starts; every solver draws from the
 * same allowance, so a polish step cannot extend the configured limits.
 */
class BudgetTracker {
public:
	using Clock = std::chrono::steady_clock;

	explicit BudgetTracker(const core::SolverBudget &budget)
	    : max_iterations_(budget.max_iterations), deadline_(Clock::now() + budget.time_limit) {
	}

	int remainingIterations() const {
		return max_iterations_ > used_iterations_ ? max_iterations_ - used_iterations_ : 0;
	}

	Clock::time_point deadline() const {
		return deadline_;
	}

	bool exhausted() const {
		return remainingIterations() == 0 || Clock::now() > deadline_;
	}

	void consume(int iterations) {
		used_iterations_ += iterations;
	}

	int usedIterations() const {
		return used_iterations_;
	}

private:
	int max_iterations_;
	int used_iterations_ = 0;
	Clock::time_point deadline_;
};

struct MinimizerResult {
	std::vector<double> x;
	double value = 0.0;
	int iterations = 0;
	bool converged = false;
	bool budget_exhausted = false;
	std::string message;
};

/**
 * @brief Box-constrained minimizer that honours a shared solver budget.
 *
 * Implementations translate solver-specific stopping codes into
 * MinimizerResult and never throw for non-convergence; callers decide how to
 * report it.
 */
class BoundedMinimizer {
public:
	using Objective = std::function<double(const std::vector<double> &)>;

	virtual ~BoundedMinimizer() = default;

	virtual MinimizerResult minimize(const Objective &objective, const std::vector<double> &x0,
	                                 const std::vector<double> &lower, const std::vector<double> &upper,
	                                 BudgetTracker &budget) const = 0;

	virtual std::string name() const = 0;
};

/// L-BFGS-B with central-difference gradients.
class LbfgsMinimizer final : public BoundedMinimizer {
public:
	explicit LbfgsMinimizer(double gradient_step = 1e-5) : gradient_step_(gradient_step) {
	}

	MinimizerResult minimize(const Objective &objective, const std::vector<double> &x0,
	                         const std::vector<double> &lower, const std::vector<double> &upper,
	                         BudgetTracker &budget) const override;

	std::string name() const override {
		return "L-BFGS-B";
	}

private:
	double gradient_step_;
};

class NelderMeadMinimizer final : public BoundedMinimizer {
public:
	explicit NelderMeadMinimizer(double tolerance = 1e-8, double step = 0.05)
	    : tolerance_(tolerance), step_(step) {
	}

	MinimizerResult minimize(const Objective &objective, const std::vector<double> &x0,
	                         const std::vector<double> &lower, const std::vector<double> &upper,
	                         BudgetTracker &budget) const override;

	std::string name() const override {
		return "Nelder-Mead";
	}

private:
	double tolerance_;
	double step_;
};

/// Central-difference gradient of @p objective at @p x, stepping inside [lower, upper].
std::vector<double> numericGradient(const BoundedMinimizer::Objective &objective, const std::vector<double> &x,
                                    const std::vector<double> &lower, const std::vector<double> &upper,
                                    double step);

} // namespace commodex::optimization
