#include "commodex/models/var.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/least_squares.hpp"
#include "commodex/utils/logging.hpp"
#include "commodex/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace commodex::models {

namespace {

constexpr double kDiagnosticSignificance = 0.05;
constexpr double kLogTwoPi = 1.8378770664093453;

double logDeterminant(const Eigen::MatrixXd &m) {
	const Eigen::LDLT<Eigen::MatrixXd> ldlt(m);
	const Eigen::VectorXd d = ldlt.vectorD();
	if ((d.array() <= 0.0).any()) {
		return -std::numeric_limits<double>::infinity();
	}
	return d.array().log().sum();
}

std::vector<double> toStd(const Eigen::VectorXd &v) {
	return std::vector<double>(v.data(), v.data() + v.size());
}

} // namespace

namespace detail {

Eigen::MatrixXd lagRegressors(const Eigen::MatrixXd &Y, int p, Eigen::Index first) {
	const Eigen::Index k = Y.cols();
	const Eigen::Index rows = Y.rows() - first;
	Eigen::MatrixXd X(rows, 1 + k * p);
	X.col(0).setOnes();
	for (int i = 1; i <= p; ++i) {
		X.middleCols(1 + (i - 1) * k, k) = Y.middleRows(first - i, rows);
	}
	return X;
}

std::vector<EquationDiagnostics> equationDiagnostics(const std::vector<std::string> &variables,
                                                     const Eigen::MatrixXd &targets,
                                                     const Eigen::MatrixXd &residuals, int lags,
                                                     int fitted_parameters) {
	std::vector<EquationDiagnostics> equations;
	for (Eigen::Index j = 0; j < residuals.cols(); ++j) {
		EquationDiagnostics eq;
		eq.variable = variables[static_cast<std::size_t>(j)];
		const Eigen::VectorXd actual = targets.col(j);
		const Eigen::VectorXd resid = residuals.col(j);
		const Eigen::VectorXd fitted = actual - resid;
		const auto observed = toStd(actual);
		const auto predicted = toStd(fitted);
		eq.r_squared = utils::Metrics::r2(observed, predicted);
		eq.residual_variance = utils::Metrics::mse(observed, predicted);
		eq.rmse = utils::Metrics::rmse(observed, predicted);
		eq.mae = utils::Metrics::mae(observed, predicted);
		eq.ljung_box = analysis::ljungBox(resid, lags, fitted_parameters);
		eq.jarque_bera = analysis::jarqueBera(resid);
		equations.push_back(std::move(eq));
	}
	return equations;
}

void fillInformationCriteria(ModelDiagnostics &diagnostics, const Eigen::MatrixXd &residuals, int parameters) {
	const double T = static_cast<double>(residuals.rows());
	const double k = static_cast<double>(residuals.cols());
	const Eigen::MatrixXd sigma_ml = residuals.transpose() * residuals / T;
	const double log_det = logDeterminant(sigma_ml);
	const double K = static_cast<double>(parameters);
	diagnostics.observations = static_cast<int>(residuals.rows());
	diagnostics.parameters = parameters;
	diagnostics.log_likelihood = -0.5 * T * (k * kLogTwoPi + log_det + k);
	diagnostics.aic = log_det + 2.0 * K / T;
	diagnostics.bic = log_det + std::log(T) * K / T;
	diagnostics.hqic = log_det + 2.0 * std::log(std::log(T)) * K / T;
}

} // namespace detail

void VarOptions::validate() const {
	if (max_lag < 1) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "VAR max_lag must be at least 1.",
		                              {{"max_lag", core::param(max_lag)}});
	}
	if (fixed_lag && *fixed_lag < 1) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "VAR fixed lag must be at least 1.",
		                              {{"fixed_lag", core::param(*fixed_lag)}});
	}
	if (differencing_order < 0 || differencing_order > 2) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "VAR differencing order must be 0, 1 or 2.",
		                              {{"differencing_order", core::param(differencing_order)}});
	}
	if (!(stability_tolerance >= 0.0)) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Stability tolerance must be non-negative.",
		                              {{"stability_tolerance", core::param(stability_tolerance)}});
	}
	if (diagnostic_lags < 1) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Diagnostic lags must be positive.",
		                              {{"diagnostic_lags", core::param(diagnostic_lags)}});
	}
}

VarModel VarModel::fit(const core::MultivariateSeries &series, const VarOptions &options) {
	options.validate();
	const int d = options.differencing_order;
	const auto working = series.differenced(d);
	const Eigen::MatrixXd Y = working.matrix();
	const Eigen::Index T = Y.rows();
	const Eigen::Index k = Y.cols();

	VarModel model;
	model.variables_ = series.variables();
	model.differencing_order_ = d;
	model.criterion_ = options.criterion;
	model.stability_tolerance_ = options.stability_tolerance;

	int p = options.fixed_lag.value_or(1);
	if (!options.fixed_lag) {
		const int max_lag = options.max_lag;
		const Eigen::Index t_eff = T - max_lag;
		if (t_eff <= k * max_lag + 1) {
			throw core::InsufficientDataError(core::Stage::ForecastModel,
			                                  "Too few observations for the VAR lag search.",
			                                  {{"observations", core::param(T)},
			                                   {"variables", core::param(k)},
			                                   {"max_lag", core::param(max_lag)}});
		}
		const Eigen::MatrixXd targets = Y.bottomRows(t_eff);
		double best = std::numeric_limits<double>::infinity();
		for (int lag = 1; lag <= max_lag; ++lag) {
			const auto ols =
			    utils::ordinaryLeastSquares(detail::lagRegressors(Y, lag, max_lag), targets, core::Stage::ForecastModel);
			ModelDiagnostics scratch;
			detail::fillInformationCriteria(scratch, ols.residuals, static_cast<int>(k * k * lag + k));
			model.lag_selection_.push_back(LagSelectionEntry{lag, scratch.aic, scratch.bic, scratch.hqic});

			double score = scratch.aic;
			if (options.criterion == core::InformationCriterion::BIC) {
				score = scratch.bic;
			} else if (options.criterion == core::InformationCriterion::HQIC) {
				score = scratch.hqic;
			}
			COMMODEX_DEBUG("VAR lag {}: AIC={:.5f} BIC={:.5f} HQIC={:.5f}", lag, scratch.aic, scratch.bic,
			               scratch.hqic);
			if (score < best) {
				best = score;
				p = lag;
			}
		}
	}

	if (T - p <= k * p + 1) {
		throw core::InsufficientDataError(core::Stage::ForecastModel, "Too few observations for the VAR lag order.",
		                                  {{"observations", core::param(T)},
		                                   {"variables", core::param(k)},
		                                   {"lag", core::param(p)}});
	}

	const Eigen::MatrixXd targets = Y.bottomRows(T - p);
	const auto ols = utils::ordinaryLeastSquares(detail::lagRegressors(Y, p, p), targets, core::Stage::ForecastModel);

	model.intercept_ = ols.coefficients.row(0).transpose();
	for (int i = 1; i <= p; ++i) {
		model.coefficients_.push_back(ols.coefficients.middleRows(1 + (i - 1) * k, k).transpose());
	}
	model.residuals_ = ols.residuals;
	model.sigma_ = ols.residualCovariance(static_cast<double>(ols.degreesOfFreedom()));

	model.levels_.A = integrateLagPolynomial(model.coefficients_, d);
	model.levels_.intercept = model.intercept_;
	model.levels_.sigma = model.sigma_;
	const Eigen::MatrixXd levels = series.matrix();
	model.levels_.history = levels.bottomRows(p + d);

	auto &diag = model.diagnostics_;
	detail::fillInformationCriteria(diag, ols.residuals, static_cast<int>(k * k * p + k));
	diag.equations =
	    detail::equationDiagnostics(model.variables_, targets, ols.residuals, options.diagnostic_lags, p);
	diag.max_root_modulus = maxRootModulus(model.coefficients_);
	diag.stable = diag.max_root_modulus <= 1.0 + options.stability_tolerance;

	for (const auto &eq : diag.equations) {
		if (eq.ljung_box.p_value < kDiagnosticSignificance) {
			diag.warnings.push_back("Residual autocorrelation in equation " + eq.variable);
			COMMODEX_WARN("VAR residuals of {} are autocorrelated (Ljung-Box p={:.4f})", eq.variable,
			              eq.ljung_box.p_value);
		}
		if (eq.jarque_bera.p_value < kDiagnosticSignificance) {
			diag.warnings.push_back("Non-normal residuals in equation " + eq.variable);
			COMMODEX_DEBUG("VAR residuals of {} fail Jarque-Bera (p={:.4f})", eq.variable, eq.jarque_bera.p_value);
		}
	}
	if (!diag.stable) {
		diag.warnings.push_back("Companion roots outside the unit circle");
		COMMODEX_WARN("VAR({}) is unstable: max root modulus {:.6f}", p, diag.max_root_modulus);
	}

	COMMODEX_INFO("Fitted {}", model.describe());
	return model;
}

core::Forecast VarModel::forecast(int horizon, double confidence) const {
	if (!diagnostics_.stable) {
		throw core::UnstableModelError(core::Stage::ForecastModel,
		                               "VAR has characteristic roots outside the unit circle.",
		                               {{"max_root_modulus", core::param(diagnostics_.max_root_modulus)},
		                                {"tolerance", core::param(stability_tolerance_)},
		                                {"lag", core::param(lagOrder())}});
	}
	return levelsForecast(levels_, variables_, horizon, confidence);
}

std::string VarModel::describe() const {
	std::ostringstream oss;
	oss << "VAR(" << lagOrder() << ")";
	if (differencing_order_ > 0) {
		oss << " on " << differencing_order_ << (differencing_order_ == 1 ? "st" : "nd") << " differences";
	}
	oss << " of [";
	for (std::size_t i = 0; i < variables_.size(); ++i) {
		oss << (i ? ", " : "") << variables_[i];
	}
	oss << "], " << core::toString(criterion_) << ", max root " << diagnostics_.max_root_modulus;
	return oss.str();
}

double VarModel::coefficient(const std::string &effect, const std::string &cause, int lag) const {
	if (lag < 1 || lag > lagOrder()) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Lag outside the fitted order.",
		                              {{"lag", core::param(lag)}, {"order", core::param(lagOrder())}});
	}
	auto index = [&](const std::string &name) {
		for (std::size_t i = 0; i < variables_.size(); ++i) {
			if (variables_[i] == name) {
				return static_cast<Eigen::Index>(i);
			}
		}
		throw core::InvalidInputError(core::Stage::ForecastModel, "Unknown variable.", {{"variable", name}});
	};
	return coefficients_[static_cast<std::size_t>(lag - 1)](index(effect), index(cause));
}

std::vector<Eigen::MatrixXd> VarModel::impulseResponse(int steps, bool orthogonalized) const {
	if (steps < 0) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Impulse response steps must be non-negative.",
		                              {{"steps", core::param(steps)}});
	}
	auto psi = maCoefficients(coefficients_, steps, sigma_.rows());
	if (orthogonalized) {
		const Eigen::MatrixXd P = sigma_.llt().matrixL();
		for (auto &m : psi) {
			m = m * P;
		}
	}
	return psi;
}

std::vector<Eigen::MatrixXd> VarModel::forecastErrorCovariance(int horizon) const {
	return models::forecastErrorCovariance(levels_, horizon);
}

} // namespace commodex::models
