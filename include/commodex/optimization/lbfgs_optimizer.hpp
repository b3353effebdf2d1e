#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace commodex::optimization {

/**
 * @brief L-BFGS-B optimizer for box-constrained likelihood problems
 *
 * Wrapper around the LBFGS++ solver. The wrapper owns the stopping policy:
 * an iteration cap handed to the solver plus an optional wall-clock deadline
 * checked on every objective evaluation. Solver failures (line-search
 * breakdowns, non-finite steps) come back as a non-converged Result.
 */
class LBFGSOptimizer {
public:
    using Clock = std::chrono::steady_clock;

    struct Result {
        std::vector<double> x;           // Best parameters, projected onto the bounds
        double fx = 0.0;                 // Objective value at x
        int iterations = 0;
        bool converged = false;
        bool budget_exhausted = false;   // Iteration cap or deadline reached
        std::string message;
    };

    struct Options {
        int max_iterations;
        double epsilon;           // Projected-gradient tolerance
        int m;                    // L-BFGS memory
        double ftol;              // Sufficient decrease for the line search
        int max_linesearch;
        int past;                 // Window for the objective-decrease test (0 disables it)
        double delta;             // Relative decrease below which the run stops
        std::optional<Clock::time_point> deadline;

        Options()
            : max_iterations(200), epsilon(1e-6), m(10),
              ftol(1e-6), max_linesearch(20), past(1), delta(1e-10), deadline(std::nullopt) {}
    };

    /**
     * @brief Minimize objective function with box constraints
     *
     * @param objective Function that computes f(x) and writes the gradient into g
     * @param x0 Initial parameters, projected onto [lower, upper] first
     * @param lower Lower bounds for each parameter
     * @param upper Upper bounds for each parameter
     * @param options Optimization options
     */
    static Result minimize(
        const std::function<double(const std::vector<double>&, std::vector<double>&)>& objective,
        const std::vector<double>& x0,
        const std::vector<double>& lower,
        const std::vector<double>& upper,
        const Options& options = Options()
    );

private:
    static void projectBounds(std::vector<double>& x,
                              const std::vector<double>& lower,
                              const std::vector<double>& upper);
};

} // namespace commodex::optimization
