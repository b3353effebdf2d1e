#include "commodex/optimization/lbfgs_optimizer.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/logging.hpp"

#include <LBFGSB.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace commodex::optimization {

using namespace LBFGSpp;

namespace {

// Raised from inside the objective to unwind the solver once the deadline passes.
struct DeadlineReached : std::runtime_error {
    DeadlineReached() : std::runtime_error("wall-clock budget exhausted") {}
};

} // namespace

void LBFGSOptimizer::projectBounds(std::vector<double>& x,
                                   const std::vector<double>& lower,
                                   const std::vector<double>& upper) {
    for (std::size_t i = 0; i < x.size(); ++i) {
        x[i] = std::max(lower[i], std::min(x[i], upper[i]));
    }
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(
    const std::function<double(const std::vector<double>&, std::vector<double>&)>& objective,
    const std::vector<double>& x0,
    const std::vector<double>& lower,
    const std::vector<double>& upper,
    const Options& options) {

    if (x0.empty() || lower.size() != x0.size() || upper.size() != x0.size()) {
        throw core::InvalidInputError(core::Stage::Solver, "Bounds must match the parameter dimension.",
                                      {{"parameters", core::param(x0.size())},
                                       {"lower", core::param(lower.size())},
                                       {"upper", core::param(upper.size())}});
    }

    Result result;
    const int n = static_cast<int>(x0.size());

    Eigen::VectorXd x = Eigen::VectorXd::Map(x0.data(), n);
    const Eigen::VectorXd lb = Eigen::VectorXd::Map(lower.data(), n);
    const Eigen::VectorXd ub = Eigen::VectorXd::Map(upper.data(), n);
    x = x.cwiseMax(lb).cwiseMin(ub);

    LBFGSBParam<double> param;
    param.max_iterations = options.max_iterations;
    param.epsilon = options.epsilon;
    param.epsilon_rel = options.epsilon;
    param.m = options.m;
    param.ftol = options.ftol;
    param.wolfe = 0.9;
    param.max_linesearch = options.max_linesearch;
    param.past = options.past;
    param.delta = options.delta;

    LBFGSBSolver<double> solver(param);

    // Best feasible point seen, kept so an aborted run still reports progress.
    std::vector<double> best(x.data(), x.data() + n);
    double best_fx = std::numeric_limits<double>::infinity();

    auto eigen_objective = [&](const Eigen::VectorXd& x_eigen, Eigen::VectorXd& grad_eigen) {
        if (options.deadline && Clock::now() > *options.deadline) {
            throw DeadlineReached();
        }
        std::vector<double> x_vec(x_eigen.data(), x_eigen.data() + n);
        std::vector<double> grad_vec(static_cast<std::size_t>(n), 0.0);
        const double fx = objective(x_vec, grad_vec);
        for (int i = 0; i < n; ++i) {
            grad_eigen[i] = grad_vec[static_cast<std::size_t>(i)];
        }
        if (std::isfinite(fx) && fx < best_fx) {
            best_fx = fx;
            best = x_vec;
        }
        return fx;
    };

    double fx = std::numeric_limits<double>::infinity();
    try {
        result.iterations = solver.minimize(eigen_objective, x, fx, lb, ub);
        result.x.assign(x.data(), x.data() + n);
        result.fx = fx;
        result.budget_exhausted = result.iterations >= options.max_iterations;
        result.converged = !result.budget_exhausted && std::isfinite(fx);
        result.message = result.converged ? "Converged" : "Iteration limit reached";
    } catch (const DeadlineReached& e) {
        result.x = best;
        result.fx = best_fx;
        result.budget_exhausted = true;
        result.message = e.what();
    } catch (const std::exception& e) {
        // Line-search breakdowns surface as exceptions from LBFGS++.
        result.x = best;
        result.fx = best_fx;
        result.message = std::string("Failed: ") + e.what();
    }

    projectBounds(result.x, lower, upper);
    COMMODEX_DEBUG("L-BFGS-B finished after {} iterations (f = {:.6f}): {}", result.iterations, result.fx,
                   result.message);
    return result;
}

} // namespace commodex::optimization
