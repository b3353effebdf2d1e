#include "commodex/models/garch.hpp"
#include "commodex/analysis/residual_tests.hpp"
#include "commodex/analysis/unit_root.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/optimization/bounded_minimizer.hpp"
#include "commodex/utils/distributions.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <utility>

namespace commodex::models {

namespace {

constexpr double kOmegaLower = 1e-8;
constexpr double kOmegaUpper = 10.0;
constexpr double kCoefficientUpper = 0.999;
constexpr double kPersistenceCap = 0.9999;
constexpr double kPenaltyWeight = 1e4;
constexpr double kInvalidObjective = 1e10;
constexpr double kLogTwoPi = 1.8378770664093453;

std::vector<double> recursion(const std::vector<double> &e, double omega, const std::vector<double> &alpha,
                              const std::vector<double> &beta, double backcast) {
	const std::size_t n = e.size();
	std::vector<double> sigma2(n, backcast);
	for (std::size_t t = 0; t < n; ++t) {
		double var = omega;
		for (std::size_t i = 0; i < alpha.size(); ++i) {
			const double shock2 = t > i ? e[t - i - 1] * e[t - i - 1] : backcast;
			var += alpha[i] * shock2;
		}
		for (std::size_t j = 0; j < beta.size(); ++j) {
			var += beta[j] * (t > j ? sigma2[t - j - 1] : backcast);
		}
		sigma2[t] = var;
	}
	return sigma2;
}

double innovationLogLikelihood(const std::vector<double> &e, const std::vector<double> &sigma2,
                               core::ResidualDistribution distribution, double dof) {
	double ll = 0.0;
	for (std::size_t t = 0; t < e.size(); ++t) {
		const double s2 = sigma2[t];
		if (!(s2 > 0.0) || !std::isfinite(s2)) {
			return -std::numeric_limits<double>::infinity();
		}
		if (distribution == core::ResidualDistribution::StudentT) {
			const double z = e[t] / std::sqrt(s2);
			ll += utils::distributions::standardizedStudentTLogPdf(z, dof) - 0.5 * std::log(s2);
		} else {
			ll += -0.5 * (kLogTwoPi + std::log(s2) + e[t] * e[t] / s2);
		}
	}
	return ll;
}

GarchParameters unpack(const std::vector<double> &theta, int p, int q) {
	GarchParameters params;
	params.omega = theta[0];
	params.alpha.assign(theta.begin() + 1, theta.begin() + 1 + p);
	params.beta.assign(theta.begin() + 1 + p, theta.begin() + 1 + p + q);
	return params;
}

double sampleVariance(const std::vector<double> &centered) {
	double sum = 0.0;
	for (double v : centered) {
		sum += v * v;
	}
	return sum / static_cast<double>(centered.size());
}

void checkReturnsInput(const core::TimeSeries &returns, const GarchOptions &options) {
	const std::string kind = returns.metadataValue(core::TimeSeries::kSeriesKindKey);
	if (kind == core::TimeSeries::kKindLevels) {
		throw core::InvalidInputError(core::Stage::Volatility, "GARCH expects a returns series, not price levels.",
		                              {{"series", returns.name()}, {"series_kind", kind}});
	}
	if (static_cast<int>(returns.size()) < options.min_observations) {
		throw core::InsufficientDataError(core::Stage::Volatility, "Too few returns for a GARCH fit.",
		                                  {{"series", returns.name()},
		                                   {"observations", core::param(returns.size())},
		                                   {"min_observations", core::param(options.min_observations)}});
	}
	if (returns.hasMissingValues()) {
		throw core::InvalidInputError(core::Stage::Volatility, "Returns contain non-finite values.",
		                              {{"series", returns.name()}});
	}
	const auto &values = returns.values();
	const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	double dispersion = 0.0;
	for (double v : values) {
		dispersion += (v - mean) * (v - mean);
	}
	if (!(dispersion > 0.0)) {
		throw core::InvalidInputError(core::Stage::Volatility, "Returns series is constant.",
		                              {{"series", returns.name()}});
	}
	if (options.check_stationarity) {
		const auto adf = analysis::augmentedDickeyFuller(values);
		if (!adf.stationary(options.significance)) {
			throw core::InvalidInputError(core::Stage::Volatility,
			                              "GARCH input is not stationary; pass returns rather than levels.",
			                              {{"series", returns.name()},
			                               {"adf_statistic", core::param(adf.statistic)},
			                               {"adf_p_value", core::param(adf.p_value)}});
		}
	}
}

} // namespace

double GarchParameters::persistence() const {
	return std::accumulate(alpha.begin(), alpha.end(), 0.0) + std::accumulate(beta.begin(), beta.end(), 0.0);
}

double GarchParameters::unconditionalVariance() const {
	const double pers = persistence();
	if (pers >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}
	return omega / (1.0 - pers);
}

void GarchParameters::validate() const {
	if (alpha.empty() || beta.empty()) {
		throw core::InvalidInputError(core::Stage::Volatility, "GARCH requires positive p and q orders.",
		                              {{"p", core::param(alpha.size())}, {"q", core::param(beta.size())}});
	}
	if (!(omega > 0.0)) {
		throw core::InvalidInputError(core::Stage::Volatility, "Omega must be positive.",
		                              {{"omega", core::param(omega)}});
	}
	for (double a : alpha) {
		if (a < 0.0) {
			throw core::InvalidInputError(core::Stage::Volatility, "Alpha coefficients must be non-negative.",
			                              {{"alpha", core::param(a)}});
		}
	}
	for (double b : beta) {
		if (b < 0.0) {
			throw core::InvalidInputError(core::Stage::Volatility, "Beta coefficients must be non-negative.",
			                              {{"beta", core::param(b)}});
		}
	}
	if (persistence() >= 1.0) {
		throw core::InvalidInputError(core::Stage::Volatility,
		                              "Sum of alpha and beta must be < 1 for stationarity.",
		                              {{"persistence", core::param(persistence())}});
	}
}

void GarchOptions::validate() const {
	if (order.p < 1 || order.q < 1) {
		throw core::InvalidInputError(core::Stage::Volatility, "GARCH requires positive p and q orders.",
		                              {{"p", core::param(order.p)}, {"q", core::param(order.q)}});
	}
	if (distribution == core::ResidualDistribution::StudentT && !(student_dof > 2.0)) {
		throw core::InvalidInputError(core::Stage::Volatility,
		                              "Student-t degrees of freedom must exceed 2.",
		                              {{"student_dof", core::param(student_dof)}});
	}
	if (min_observations < 10) {
		throw core::InvalidInputError(core::Stage::Volatility, "min_observations must be at least 10.",
		                              {{"min_observations", core::param(min_observations)}});
	}
	if (budget.max_iterations < 1 || budget.time_limit.count() <= 0) {
		throw core::InvalidInputError(core::Stage::Volatility, "Solver budget must be positive.",
		                              {{"max_iterations", core::param(budget.max_iterations)},
		                               {"time_limit_ms", core::param(budget.time_limit.count())}});
	}
}

GarchModel GarchModel::fit(const core::TimeSeries &returns, const GarchOptions &options) {
	options.validate();
	checkReturnsInput(returns, options);

	const int p = options.order.p;
	const int q = options.order.q;
	const auto &values = returns.values();
	const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	std::vector<double> centered(values.size());
	std::transform(values.begin(), values.end(), centered.begin(), [&](double v) { return v - mean; });
	const double variance = sampleVariance(centered);
	const double scale = std::sqrt(variance);

	// Estimate on unit-variance data so the bounds and start values are scale free.
	std::vector<double> scaled(centered.size());
	std::transform(centered.begin(), centered.end(), scaled.begin(), [&](double v) { return v / scale; });

	const double dof = options.distribution == core::ResidualDistribution::StudentT ? options.student_dof : 0.0;
	auto objective = [&](const std::vector<double> &theta) {
		const auto params = unpack(theta, p, q);
		const auto sigma2 = recursion(scaled, params.omega, params.alpha, params.beta, 1.0);
		const double ll = innovationLogLikelihood(scaled, sigma2, options.distribution, dof);
		if (!std::isfinite(ll)) {
			return kInvalidObjective;
		}
		const double excess = std::max(0.0, params.persistence() - kPersistenceCap);
		return -ll + kPenaltyWeight * excess * excess;
	};

	std::vector<double> x0{0.1};
	std::vector<double> lower{kOmegaLower};
	std::vector<double> upper{kOmegaUpper};
	for (int i = 0; i < p; ++i) {
		x0.push_back(0.1 / p);
		lower.push_back(0.0);
		upper.push_back(kCoefficientUpper);
	}
	for (int j = 0; j < q; ++j) {
		x0.push_back(0.8 / q);
		lower.push_back(0.0);
		upper.push_back(kCoefficientUpper);
	}

	optimization::BudgetTracker budget(options.budget);
	const optimization::LbfgsMinimizer lbfgs;
	auto best = lbfgs.minimize(objective, x0, lower, upper, budget);
	std::string solver = lbfgs.name();
	if (!best.converged && !budget.exhausted()) {
		COMMODEX_DEBUG("GARCH L-BFGS-B stopped early ({}); polishing with Nelder-Mead", best.message);
		const optimization::NelderMeadMinimizer simplex(1e-9, 0.02);
		auto polished = simplex.minimize(objective, best.x, lower, upper, budget);
		if (polished.converged || polished.value < best.value) {
			best = std::move(polished);
			solver = lbfgs.name() + " + " + simplex.name();
		}
	}

	if (!best.converged) {
		throw core::NonConvergentFitError(core::Stage::Volatility,
		                                  "GARCH likelihood optimization did not converge within budget.",
		                                  {{"iterations", core::param(budget.usedIterations())},
		                                   {"budget_exhausted", best.budget_exhausted ? "true" : "false"},
		                                   {"solver", solver},
		                                   {"message", best.message}});
	}

	GarchParameters params = unpack(best.x, p, q);
	if (params.persistence() >= 1.0) {
		throw core::NonConvergentFitError(core::Stage::Volatility,
		                                  "GARCH estimate is not covariance stationary.",
		                                  {{"persistence", core::param(params.persistence())}});
	}
	params.omega *= variance;

	GarchModel model;
	model.variables_ = {returns.name()};
	model.parameters_ = std::move(params);
	model.distribution_ = options.distribution;
	model.student_dof_ = dof;
	model.mean_ = mean;
	model.residuals_ = std::move(centered);
	model.iterations_ = budget.usedIterations();
	model.solver_ = solver;
	model.filter(variance);
	model.computeDiagnostics(options.diagnostic_lags);

	COMMODEX_INFO("Fitted {} in {} iterations ({})", model.describe(), model.iterations_, solver);
	return model;
}

GarchModel GarchModel::fromParameters(const GarchParameters &parameters, const core::TimeSeries &returns,
                                      const GarchOptions &options) {
	options.validate();
	parameters.validate();
	checkReturnsInput(returns, options);

	const auto &values = returns.values();
	const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	std::vector<double> centered(values.size());
	std::transform(values.begin(), values.end(), centered.begin(), [&](double v) { return v - mean; });

	GarchModel model;
	model.variables_ = {returns.name()};
	model.parameters_ = parameters;
	model.distribution_ = options.distribution;
	model.student_dof_ =
	    options.distribution == core::ResidualDistribution::StudentT ? options.student_dof : 0.0;
	model.mean_ = mean;
	model.solver_ = "fixed";
	const double variance = sampleVariance(centered);
	model.residuals_ = std::move(centered);
	model.filter(variance);
	model.computeDiagnostics(options.diagnostic_lags);
	return model;
}

void GarchModel::filter(double backcast) {
	sigma2_ = recursion(residuals_, parameters_.omega, parameters_.alpha, parameters_.beta, backcast);
}

void GarchModel::computeDiagnostics(int diagnostic_lags) {
	auto &diag = diagnostics_;
	const double n = static_cast<double>(residuals_.size());
	const double k = static_cast<double>(1 + parameters_.alpha.size() + parameters_.beta.size() + 1);
	diag.observations = static_cast<int>(residuals_.size());
	diag.parameters = static_cast<int>(k);
	diag.log_likelihood = innovationLogLikelihood(residuals_, sigma2_, distribution_, student_dof_);
	diag.aic = -2.0 * diag.log_likelihood + 2.0 * k;
	diag.bic = -2.0 * diag.log_likelihood + std::log(n) * k;
	diag.hqic = -2.0 * diag.log_likelihood + 2.0 * std::log(std::log(n)) * k;
	diag.persistence = parameters_.persistence();
	diag.max_root_modulus = parameters_.persistence();
	diag.stable = parameters_.persistence() < 1.0;

	Eigen::VectorXd standardized(static_cast<Eigen::Index>(residuals_.size()));
	for (std::size_t t = 0; t < residuals_.size(); ++t) {
		standardized(static_cast<Eigen::Index>(t)) = residuals_[t] / std::sqrt(sigma2_[t]);
	}
	EquationDiagnostics eq;
	eq.variable = variables_.front();
	eq.residual_variance = standardized.squaredNorm() / n;
	eq.ljung_box = analysis::ljungBox(standardized.array().square().matrix(), diagnostic_lags,
	                                  static_cast<int>(parameters_.alpha.size() + parameters_.beta.size()));
	eq.jarque_bera = analysis::jarqueBera(standardized);
	diag.equations = {eq};

	if (eq.ljung_box.p_value < 0.05) {
		diag.warnings.push_back("Remaining ARCH effects in standardized residuals");
		COMMODEX_WARN("GARCH standardized residuals of {} keep ARCH effects (Ljung-Box p={:.4f})", eq.variable,
		              eq.ljung_box.p_value);
	}
}

core::VolatilityPath GarchModel::forecastVolatility(int horizon) const {
	if (horizon < 1) {
		throw core::InvalidInputError(core::Stage::Volatility, "Volatility horizon must be positive.",
		                              {{"horizon", core::param(horizon)}});
	}
	const std::size_t n = residuals_.size();
	const double backcast = sampleVariance(residuals_);
	std::vector<double> shock2(n);
	std::transform(residuals_.begin(), residuals_.end(), shock2.begin(), [](double e) { return e * e; });
	std::vector<double> sigma2 = sigma2_;

	core::VolatilityPath path;
	path.variance.reserve(static_cast<std::size_t>(horizon));
	for (int step = 1; step <= horizon; ++step) {
		const std::size_t t = n + static_cast<std::size_t>(step) - 1;
		double var = parameters_.omega;
		for (std::size_t i = 0; i < parameters_.alpha.size(); ++i) {
			const std::size_t lag = i + 1;
			double expected = backcast;
			if (t >= lag) {
				// Future squared shocks are replaced by their conditional expectation.
				expected = t - lag < n ? shock2[t - lag] : sigma2[t - lag];
			}
			var += parameters_.alpha[i] * expected;
		}
		for (std::size_t j = 0; j < parameters_.beta.size(); ++j) {
			const std::size_t lag = j + 1;
			var += parameters_.beta[j] * (t >= lag ? sigma2[t - lag] : backcast);
		}
		sigma2.push_back(var);
		path.variance.push_back(var);
	}
	path.unconditional_variance = parameters_.unconditionalVariance();
	path.distribution = distribution_;
	path.degrees_of_freedom = student_dof_;
	return path;
}

core::Forecast GarchModel::forecast(int horizon, double confidence) const {
	if (horizon < 0) {
		throw core::InvalidInputError(core::Stage::Volatility, "Forecast horizon must be non-negative.",
		                              {{"horizon", core::param(horizon)}});
	}
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw core::InvalidInputError(core::Stage::Volatility, "Confidence level must lie in (0, 1).",
		                              {{"confidence", core::param(confidence)}});
	}
	const double quantile =
	    distribution_ == core::ResidualDistribution::StudentT
	        ? utils::distributions::standardizedStudentTQuantile(0.5 + 0.5 * confidence, student_dof_)
	        : utils::distributions::normalCritical(confidence);

	core::Forecast forecast;
	forecast.variables = variables_;
	forecast.target = variables_.front();
	forecast.confidence_level = confidence;
	const auto steps = static_cast<std::size_t>(horizon) + 1;
	forecast.point.assign(1, std::vector<double>(steps, 0.0));
	forecast.lower = forecast.point;
	forecast.upper = forecast.point;
	if (horizon > 0) {
		const auto path = forecastVolatility(horizon);
		for (int h = 1; h <= horizon; ++h) {
			const auto i = static_cast<std::size_t>(h);
			const double center = mean_ * static_cast<double>(h);
			const double half_width = quantile * std::sqrt(path.cumulativeVariance(h));
			forecast.point[0][i] = center;
			forecast.lower[0][i] = center - half_width;
			forecast.upper[0][i] = center + half_width;
		}
	}
	return forecast;
}

std::string GarchModel::describe() const {
	std::ostringstream oss;
	oss << "GARCH(" << parameters_.alpha.size() << "," << parameters_.beta.size() << ") "
	    << core::toString(distribution_) << " on " << variables_.front() << ": omega=" << parameters_.omega
	    << " alpha=[";
	for (std::size_t i = 0; i < parameters_.alpha.size(); ++i) {
		oss << (i ? ", " : "") << parameters_.alpha[i];
	}
	oss << "] beta=[";
	for (std::size_t j = 0; j < parameters_.beta.size(); ++j) {
		oss << (j ? ", " : "") << parameters_.beta[j];
	}
	oss << "] persistence=" << parameters_.persistence();
	return oss.str();
}

} // namespace commodex::models
