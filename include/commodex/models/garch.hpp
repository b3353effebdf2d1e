#pragma once

#include "commodex/core/config.hpp"
#include "commodex/core/time_series.hpp"
#include "commodex/core/volatility_path.hpp"
#include "commodex/models/model_capability.hpp"

#include <string>
#include <vector>

namespace commodex::models {

struct GarchOptions {
	core::GarchOrder order;
	core::ResidualDistribution distribution = core::ResidualDistribution::Normal;
	double student_dof = 5.0; // fixed shape of the Student-t likelihood
	core::SolverBudget budget{2000, std::chrono::milliseconds(5000)};
	int min_observations = 100;
	bool check_stationarity = true; // ADF on the input before fitting
	double significance = 0.05;
	int diagnostic_lags = 10;

	void validate() const;
};

/// GARCH coefficients in the units of the input returns.
struct GarchParameters {
	double omega = 0.0;
	std::vector<double> alpha; // ARCH terms
	std::vector<double> beta;  // GARCH terms

	double persistence() const;

	/// omega / (1 - persistence); infinite when not covariance stationary.
	double unconditionalVariance() const;

	void validate() const;
};

/**
 * @class GarchModel
 * @brief GARCH(p, q) conditional variance model on a demeaned returns series.
 *
 *   sigma2_t = omega + sum_i alpha_i e_{t-i}^2 + sum_j beta_j sigma2_{t-j}
 */
class GarchModel final : public IFittedModel {
public:
	/**
	 * @brief Maximum-likelihood fit.
	 * @throws InvalidInputError for a levels series or a non-stationary input.
	 * @throws InsufficientDataError below options.min_observations.
	 * @throws NonConvergentFitError when the solvers fail within the budget or
	 *         the estimate is not covariance stationary.
	 */
	static GarchModel fit(const core::TimeSeries &returns, const GarchOptions &options = {});

	/// Filters @p returns through externally supplied parameters.
	static GarchModel fromParameters(const GarchParameters &parameters, const core::TimeSeries &returns,
	                                 const GarchOptions &options = {});

	ModelKind kind() const override {
		return ModelKind::GARCH;
	}

	const std::vector<std::string> &variables() const override {
		return variables_;
	}

	const ModelDiagnostics &diagnostics() const override {
		return diagnostics_;
	}

	/**
	 * @brief Cumulative return forecast from the last observation.
	 *
	 * Step h holds h * mean with bands from the variance of the summed returns,
	 * so band width never shrinks as the horizon grows. Step 0 is zero.
	 */
	core::Forecast forecast(int horizon, double confidence) const override;

	std::string describe() const override;

	/// Conditional variances for steps 1..horizon.
	core::VolatilityPath forecastVolatility(int horizon) const;

	const GarchParameters &parameters() const {
		return parameters_;
	}

	double mean() const {
		return mean_;
	}

	double logLikelihood() const {
		return diagnostics_.log_likelihood;
	}

	core::ResidualDistribution distribution() const {
		return distribution_;
	}

	double studentDof() const {
		return student_dof_;
	}

	const std::vector<double> &residuals() const {
		return residuals_;
	}

	const std::vector<double> &conditionalVariance() const {
		return sigma2_;
	}

	int iterations() const {
		return iterations_;
	}

	const std::string &solver() const {
		return solver_;
	}

private:
	GarchModel() = default;

	void filter(double backcast);
	void computeDiagnostics(int diagnostic_lags);

	std::vector<std::string> variables_;
	GarchParameters parameters_;
	core::ResidualDistribution distribution_ = core::ResidualDistribution::Normal;
	double student_dof_ = 0.0;
	double mean_ = 0.0;
	std::vector<double> residuals_;
	std::vector<double> sigma2_;
	int iterations_ = 0;
	std::string solver_;
	ModelDiagnostics diagnostics_;
};

} // namespace commodex::models
