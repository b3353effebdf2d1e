#include "commodex/analysis/unit_root.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/distributions.hpp"
#include "commodex/utils/least_squares.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace commodex::analysis {

namespace {

// Response-surface bounds and coefficients for the constant-only, N = 1 case.
constexpr double kTauMax = 2.74;
constexpr double kTauMin = -18.83;
constexpr double kTauStar = -1.61;
constexpr double kSmallP[] = {2.1659, 1.4412, 0.038269};
constexpr double kLargeP[] = {1.7339, 0.93202, -0.12745, -0.010368};

int defaultMaxLag(std::size_t n) {
	return static_cast<int>(std::floor(12.0 * std::pow(static_cast<double>(n) / 100.0, 0.25)));
}

// Design for rows t = first..n-1 (indices into the level series):
// target Δy_t, regressors [1, y_{t-1}, Δy_{t-1}, ..., Δy_{t-lag}].
void buildRegression(const std::vector<double> &y, int lag, std::size_t first, Eigen::MatrixXd &X,
                     Eigen::MatrixXd &target) {
	const auto rows = static_cast<Eigen::Index>(y.size() - first);
	X.resize(rows, lag + 2);
	target.resize(rows, 1);
	for (Eigen::Index r = 0; r < rows; ++r) {
		const std::size_t t = first + static_cast<std::size_t>(r);
		target(r, 0) = y[t] - y[t - 1];
		X(r, 0) = 1.0;
		X(r, 1) = y[t - 1];
		for (int i = 1; i <= lag; ++i) {
			X(r, 1 + i) = y[t - i] - y[t - i - 1];
		}
	}
}

double criterionValue(core::InformationCriterion criterion, double rss, Eigen::Index nobs, Eigen::Index params) {
	const double n = static_cast<double>(nobs);
	const double fit = n * std::log(rss / n);
	switch (criterion) {
	case core::InformationCriterion::BIC:
		return fit + std::log(n) * static_cast<double>(params);
	case core::InformationCriterion::HQIC:
		return fit + 2.0 * std::log(std::log(n)) * static_cast<double>(params);
	case core::InformationCriterion::AIC:
	default:
		return fit + 2.0 * static_cast<double>(params);
	}
}

} // namespace

double mackinnonPValue(double statistic) {
	if (std::isnan(statistic)) {
		return 1.0;
	}
	if (statistic > kTauMax) {
		return 1.0;
	}
	if (statistic < kTauMin) {
		return 0.0;
	}
	const double t = statistic;
	double z = 0.0;
	if (t <= kTauStar) {
		z = kSmallP[0] + kSmallP[1] * t + kSmallP[2] * t * t;
	} else {
		z = kLargeP[0] + kLargeP[1] * t + kLargeP[2] * t * t + kLargeP[3] * t * t * t;
	}
	return utils::distributions::normalCdf(z);
}

void mackinnonCriticalValues(int observations, double &one, double &five, double &ten) {
	const double inv = 1.0 / static_cast<double>(std::max(observations, 1));
	one = -3.43035 - 6.5393 * inv - 16.786 * inv * inv - 79.433 * inv * inv * inv;
	five = -2.86154 - 2.8903 * inv - 4.234 * inv * inv - 40.040 * inv * inv * inv;
	ten = -2.56677 - 1.5384 * inv - 2.809 * inv * inv;
}

AdfResult augmentedDickeyFuller(const std::vector<double> &values, const AdfOptions &options) {
	const std::size_t n = values.size();
	for (double v : values) {
		if (!std::isfinite(v)) {
			throw core::InvalidInputError(core::Stage::Stationarity, "ADF input contains non-finite values.");
		}
	}

	// Keep at least the constant and level regressors estimable on the trimmed sample.
	const int cap = static_cast<int>(n / 2) - 2;
	int max_lag = options.max_lag.value_or(defaultMaxLag(n));
	if (max_lag < 0) {
		throw core::InvalidInputError(core::Stage::Stationarity, "ADF maximum lag must be non-negative.",
		                              {{"max_lag", core::param(max_lag)}});
	}
	max_lag = std::min(max_lag, cap);
	if (max_lag < 0 || n < 6) {
		throw core::InsufficientDataError(core::Stage::Stationarity, "Series too short for the ADF regression.",
		                                  {{"observations", core::param(n)}});
	}

	int best_lag = 0;
	if (max_lag > 0) {
		const std::size_t first = static_cast<std::size_t>(max_lag) + 1;
		double best_ic = std::numeric_limits<double>::infinity();
		for (int lag = 0; lag <= max_lag; ++lag) {
			Eigen::MatrixXd X;
			Eigen::MatrixXd target;
			buildRegression(values, lag, first, X, target);
			const auto fit = utils::ordinaryLeastSquares(X, target, core::Stage::Stationarity);
			const double ic = criterionValue(options.criterion, fit.rss(), fit.observations(), fit.regressors());
			if (ic < best_ic) {
				best_ic = ic;
				best_lag = lag;
			}
		}
	}

	Eigen::MatrixXd X;
	Eigen::MatrixXd target;
	buildRegression(values, best_lag, static_cast<std::size_t>(best_lag) + 1, X, target);
	const auto fit = utils::ordinaryLeastSquares(X, target, core::Stage::Stationarity);

	AdfResult result;
	result.used_lag = best_lag;
	result.observations = static_cast<int>(fit.observations());
	const double se = fit.standardError(1);
	if (!(se > 0.0) || !std::isfinite(se)) {
		throw core::ModelNotApplicableError(core::Stage::Stationarity, "ADF regression has a degenerate fit.",
		                                    {{"observations", core::param(n)}});
	}
	result.statistic = fit.coefficients(1, 0) / se;
	result.p_value = mackinnonPValue(result.statistic);
	mackinnonCriticalValues(result.observations, result.critical_1, result.critical_5, result.critical_10);
	return result;
}

} // namespace commodex::analysis
