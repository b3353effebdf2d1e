#include "commodex/models/vecm.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/models/var.hpp"
#include "commodex/utils/least_squares.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <sstream>

namespace commodex::models {

void VecmOptions::validate() const {
	if (lag_differences && *lag_differences < 0) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "VECM lagged differences must be non-negative.",
		                              {{"lag_differences", core::param(*lag_differences)}});
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

VecmModel VecmModel::fit(const core::MultivariateSeries &series, const analysis::CointegrationResult &cointegration,
                         const VecmOptions &options) {
	options.validate();
	if (cointegration.variables != series.variables()) {
		throw core::InvalidInputError(core::Stage::ForecastModel,
		                              "Cointegration result was computed on different variables.",
		                              {{"series_variables", core::param(series.dimensions())},
		                               {"result_variables", core::param(cointegration.variables.size())}});
	}
	if (cointegration.rank < 1) {
		throw core::ModelNotApplicableError(core::Stage::ForecastModel,
		                                    "VECM requires at least one cointegrating relation.",
		                                    {{"rank", core::param(cointegration.rank)}});
	}

	const int m = options.lag_differences.value_or(cointegration.lag_differences);
	const Eigen::MatrixXd y = series.matrix();
	const Eigen::Index T = y.rows();
	const Eigen::Index k = y.cols();
	const Eigen::MatrixXd beta = cointegration.beta();
	const Eigen::Index r = beta.cols();
	const Eigen::MatrixXd dy = y.bottomRows(T - 1) - y.topRows(T - 1);

	// Row j describes time t = j + m + 1.
	const Eigen::Index n = T - 1 - m;
	const Eigen::Index regressors = r + k * m + 1;
	if (n <= regressors) {
		throw core::InsufficientDataError(core::Stage::ForecastModel, "Too few observations for the VECM regression.",
		                                  {{"observations", core::param(T)},
		                                   {"lag_differences", core::param(m)},
		                                   {"rank", core::param(r)}});
	}

	Eigen::MatrixXd X(n, regressors);
	X.leftCols(r) = y.middleRows(m, n) * beta;
	for (int i = 1; i <= m; ++i) {
		X.middleCols(r + (i - 1) * k, k) = dy.middleRows(m - i, n);
	}
	X.col(regressors - 1).setOnes();
	const Eigen::MatrixXd targets = dy.bottomRows(n);

	const auto ols = utils::ordinaryLeastSquares(X, targets, core::Stage::ForecastModel);

	VecmModel model;
	model.variables_ = series.variables();
	model.stability_tolerance_ = options.stability_tolerance;
	model.beta_ = beta;
	model.alpha_ = ols.coefficients.topRows(r).transpose();
	for (int i = 1; i <= m; ++i) {
		model.gamma_.push_back(ols.coefficients.middleRows(r + (i - 1) * k, k).transpose());
	}
	model.intercept_ = ols.coefficients.row(regressors - 1).transpose();
	model.sigma_ = ols.residualCovariance(static_cast<double>(ols.degreesOfFreedom()));

	// A_1 = I + Pi + Gamma_1, A_i = Gamma_i - Gamma_{i-1}, A_{m+1} = -Gamma_m.
	const Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(k, k);
	auto &A = model.levels_.A;
	Eigen::MatrixXd first = identity + model.pi();
	if (m > 0) {
		first += model.gamma_.front();
	}
	A.push_back(first);
	for (int i = 2; i <= m; ++i) {
		A.push_back(model.gamma_[static_cast<std::size_t>(i - 1)] - model.gamma_[static_cast<std::size_t>(i - 2)]);
	}
	if (m > 0) {
		A.push_back(-model.gamma_.back());
	}
	model.levels_.intercept = model.intercept_;
	model.levels_.sigma = model.sigma_;
	model.levels_.history = y.bottomRows(m + 1);

	auto &diag = model.diagnostics_;
	detail::fillInformationCriteria(diag, ols.residuals, static_cast<int>(k * regressors));
	diag.equations = detail::equationDiagnostics(model.variables_, targets, ols.residuals, options.diagnostic_lags,
	                                             std::max(m, 1));
	diag.max_root_modulus = maxRootModulus(A);
	diag.stable = diag.max_root_modulus <= 1.0 + options.stability_tolerance;
	for (const auto &eq : diag.equations) {
		if (eq.ljung_box.p_value < 0.05) {
			diag.warnings.push_back("Residual autocorrelation in equation " + eq.variable);
			COMMODEX_WARN("VECM residuals of {} are autocorrelated (Ljung-Box p={:.4f})", eq.variable,
			              eq.ljung_box.p_value);
		}
	}
	if (!diag.stable) {
		diag.warnings.push_back("Level companion roots outside the unit circle");
		COMMODEX_WARN("VECM level representation is explosive: max root modulus {:.6f}", diag.max_root_modulus);
	}

	COMMODEX_INFO("Fitted {}", model.describe());
	return model;
}

core::Forecast VecmModel::forecast(int horizon, double confidence) const {
	if (!diagnostics_.stable) {
		throw core::UnstableModelError(core::Stage::ForecastModel,
		                               "VECM level representation has explosive roots.",
		                               {{"max_root_modulus", core::param(diagnostics_.max_root_modulus)},
		                                {"tolerance", core::param(stability_tolerance_)},
		                                {"rank", core::param(rank())}});
	}
	return levelsForecast(levels_, variables_, horizon, confidence);
}

std::string VecmModel::describe() const {
	std::ostringstream oss;
	oss << "VECM(rank " << rank() << ", " << lagDifferences() << " lagged differences) of [";
	for (std::size_t i = 0; i < variables_.size(); ++i) {
		oss << (i ? ", " : "") << variables_[i];
	}
	oss << "], beta_1 = [";
	for (Eigen::Index i = 0; i < beta_.rows(); ++i) {
		oss << (i ? ", " : "") << beta_(i, 0);
	}
	oss << "]";
	return oss.str();
}

std::vector<Eigen::MatrixXd> VecmModel::impulseResponse(int steps, bool orthogonalized) const {
	if (steps < 0) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Impulse response steps must be non-negative.",
		                              {{"steps", core::param(steps)}});
	}
	auto psi = maCoefficients(levels_.A, steps, sigma_.rows());
	if (orthogonalized) {
		const Eigen::MatrixXd P = sigma_.llt().matrixL();
		for (auto &mat : psi) {
			mat = mat * P;
		}
	}
	return psi;
}

std::vector<Eigen::MatrixXd> VecmModel::forecastErrorCovariance(int horizon) const {
	return models::forecastErrorCovariance(levels_, horizon);
}

} // namespace commodex::models
