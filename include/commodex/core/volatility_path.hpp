#pragma once

#include "commodex/core/config.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <numeric>
#include <vector>

namespace commodex::models {
class FittedModel;
} // namespace commodex::models

namespace commodex::core {

/**
 * @struct VolatilityPath
 * @brief Conditional return variances for forecast steps 1..horizon.
 *
 * `variance[h - 1]` is the expected conditional variance of the one-period
 * return at step h. The path converges towards `unconditional_variance`.
 */
struct VolatilityPath {
	std::vector<double> variance;
	double unconditional_variance = 0.0;
	ResidualDistribution distribution = ResidualDistribution::Normal;
	double degrees_of_freedom = 0.0; // Student-t only
	std::weak_ptr<const models::FittedModel> model;

	int horizon() const {
		return static_cast<int>(variance.size());
	}

	double volatility(int step) const {
		return std::sqrt(variance.at(static_cast<std::size_t>(step - 1)));
	}

	/// Variance of the cumulative return over the first @p steps steps.
	double cumulativeVariance(int steps) const {
		const auto n = std::min(variance.size(), static_cast<std::size_t>(std::max(steps, 0)));
		return std::accumulate(variance.begin(), variance.begin() + static_cast<std::ptrdiff_t>(n), 0.0);
	}

	double meanVariance() const {
		if (variance.empty()) {
			return 0.0;
		}
		return std::accumulate(variance.begin(), variance.end(), 0.0) / static_cast<double>(variance.size());
	}

	double annualizedVolatility(double periods_per_year) const {
		return std::sqrt(meanVariance() * periods_per_year);
	}
};

} // namespace commodex::core
