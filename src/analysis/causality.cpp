#include "commodex/analysis/causality.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/distributions.hpp"
#include "commodex/utils/least_squares.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace commodex::analysis {

namespace {

double fStatistic(double rss_restricted, double rss_unrestricted, int restrictions, int df_denominator) {
	if (rss_unrestricted <= 0.0 || df_denominator <= 0) {
		return 0.0;
	}
	const double numerator = std::max(rss_restricted - rss_unrestricted, 0.0) / static_cast<double>(restrictions);
	return numerator / (rss_unrestricted / static_cast<double>(df_denominator));
}

} // namespace

std::string describeSignificance(double p_value) {
	if (p_value < 0.01) {
		return "highly significant (1%)";
	}
	if (p_value < 0.05) {
		return "significant (5%)";
	}
	if (p_value < 0.10) {
		return "marginally significant (10%)";
	}
	return "not significant";
}

const GrangerResult &CausalityReport::result(const std::string &cause, const std::string &effect) const {
	for (const auto &r : results) {
		if (r.cause == cause && r.effect == effect) {
			return r;
		}
	}
	throw core::InvalidInputError(core::Stage::Causality, "No causality result for the requested pair.",
	                              {{"cause", cause}, {"effect", effect}});
}

std::vector<std::string> CausalityReport::causesOf(const std::string &target) const {
	std::vector<std::string> causes;
	for (const auto &name : variables) {
		if (name == target) {
			continue;
		}
		for (const auto &r : results) {
			if (r.cause == name && r.effect == target && r.significant) {
				causes.push_back(name);
				break;
			}
		}
	}
	return causes;
}

std::vector<std::string> CausalityReport::selectVariables(const std::string &target) const {
	std::vector<std::string> selected{target};
	const auto causes = causesOf(target);
	selected.insert(selected.end(), causes.begin(), causes.end());
	return selected;
}

void CausalityTester::Options::validate() const {
	if (candidate_lags.empty() && max_lag < 1) {
		throw core::InvalidInputError(core::Stage::Causality, "max_lag must be at least 1.",
		                              {{"max_lag", core::param(max_lag)}});
	}
	for (int lag : candidate_lags) {
		if (lag < 1) {
			throw core::InvalidInputError(core::Stage::Causality, "Candidate lags must be positive.",
			                              {{"lag", core::param(lag)}});
		}
	}
	if (!(significance > 0.0 && significance < 1.0)) {
		throw core::InvalidInputError(core::Stage::Causality, "Significance must lie in (0, 1).",
		                              {{"significance", core::param(significance)}});
	}
}

std::vector<int> CausalityTester::Options::lags() const {
	if (!candidate_lags.empty()) {
		std::set<int> unique(candidate_lags.begin(), candidate_lags.end());
		return std::vector<int>(unique.begin(), unique.end());
	}
	std::vector<int> all;
	for (int lag = 1; lag <= max_lag; ++lag) {
		all.push_back(lag);
	}
	return all;
}

CausalityTester::CausalityTester(Options options) : options_(std::move(options)) {
	options_.validate();
}

double CausalityTester::correct(double p_value, std::size_t tests) const {
	const double m = static_cast<double>(std::max<std::size_t>(tests, 1));
	switch (options_.correction) {
	case core::MultipleComparisonCorrection::Sidak:
		return std::clamp(1.0 - std::pow(1.0 - p_value, m), 0.0, 1.0);
	case core::MultipleComparisonCorrection::Bonferroni:
	default:
		return std::min(1.0, m * p_value);
	}
}

LagTest CausalityTester::testLag(const std::vector<double> &cause, const std::vector<double> &effect,
                                 int lag) const {
	const auto n = static_cast<Eigen::Index>(effect.size());
	const Eigen::Index T = n - lag;
	const int df_denominator = static_cast<int>(T) - 2 * lag - 1;
	if (T <= 0 || df_denominator <= 0) {
		throw core::InsufficientDataError(core::Stage::Causality, "Too few observations for the Granger lag.",
		                                  {{"observations", core::param(n)}, {"lag", core::param(lag)}});
	}

	Eigen::MatrixXd restricted(T, 1 + lag);
	Eigen::MatrixXd unrestricted(T, 1 + 2 * lag);
	Eigen::MatrixXd y(T, 1);
	for (Eigen::Index r = 0; r < T; ++r) {
		const auto t = static_cast<std::size_t>(r + lag);
		y(r, 0) = effect[t];
		restricted(r, 0) = 1.0;
		unrestricted(r, 0) = 1.0;
		for (int i = 1; i <= lag; ++i) {
			restricted(r, i) = effect[t - static_cast<std::size_t>(i)];
			unrestricted(r, i) = effect[t - static_cast<std::size_t>(i)];
			unrestricted(r, lag + i) = cause[t - static_cast<std::size_t>(i)];
		}
	}

	const auto fit_r = utils::ordinaryLeastSquares(restricted, y, core::Stage::Causality);
	const auto fit_u = utils::ordinaryLeastSquares(unrestricted, y, core::Stage::Causality);

	LagTest result;
	result.lag = lag;
	result.df_numerator = lag;
	result.df_denominator = df_denominator;
	result.f_statistic = fStatistic(fit_r.rss(), fit_u.rss(), lag, df_denominator);
	result.p_value = utils::distributions::fisherFSurvival(result.f_statistic, lag, df_denominator);
	return result;
}

GrangerResult CausalityTester::test(const core::MultivariateSeries &series, const std::string &cause,
                                    const std::string &effect) const {
	if (cause == effect) {
		throw core::InvalidInputError(core::Stage::Causality, "Cause and effect must be different variables.",
		                              {{"variable", cause}});
	}
	const auto &x = series.column(cause);
	const auto &y = series.column(effect);

	GrangerResult result;
	result.cause = cause;
	result.effect = effect;
	for (int lag : options_.lags()) {
		result.lag_tests.push_back(testLag(x, y, lag));
	}

	const auto best = std::min_element(result.lag_tests.begin(), result.lag_tests.end(),
	                                   [](const LagTest &a, const LagTest &b) { return a.p_value < b.p_value; });
	result.best_lag = best->lag;
	result.min_p_value = best->p_value;
	result.corrected_p_value = correct(best->p_value, result.lag_tests.size());
	result.significant = result.corrected_p_value < options_.significance;

	COMMODEX_DEBUG("Granger {} -> {}: min p={:.4f} at lag {}, corrected p={:.4f}", cause, effect,
	               result.min_p_value, result.best_lag, result.corrected_p_value);
	return result;
}

CausalityReport CausalityTester::testAll(const core::MultivariateSeries &series) const {
	CausalityReport report;
	report.variables = series.variables();
	report.correction = options_.correction;
	report.significance = options_.significance;
	for (const auto &effect : series.variables()) {
		for (const auto &cause : series.variables()) {
			if (cause != effect) {
				report.results.push_back(test(series, cause, effect));
			}
		}
	}
	const auto significant = std::count_if(report.results.begin(), report.results.end(),
	                                       [](const GrangerResult &r) { return r.significant; });
	COMMODEX_INFO("Granger causality: {} of {} ordered pairs significant ({} correction)", significant,
	              report.results.size(), core::toString(options_.correction));
	return report;
}

ConditionalGrangerResult CausalityTester::testConditional(const core::MultivariateSeries &series,
                                                          const std::string &cause, const std::string &effect,
                                                          int lag) const {
	if (lag < 1) {
		throw core::InvalidInputError(core::Stage::Causality, "Conditional test lag must be positive.",
		                              {{"lag", core::param(lag)}});
	}
	if (cause == effect) {
		throw core::InvalidInputError(core::Stage::Causality, "Cause and effect must be different variables.",
		                              {{"variable", cause}});
	}
	const std::size_t cause_idx = series.indexOf(cause);
	const std::size_t effect_idx = series.indexOf(effect);
	const auto k = static_cast<Eigen::Index>(series.dimensions());
	const auto n = static_cast<Eigen::Index>(series.size());
	const Eigen::Index T = n - lag;
	const int df_denominator = static_cast<int>(T - k * lag - 1);
	if (T <= 0 || df_denominator <= 0) {
		throw core::InsufficientDataError(core::Stage::Causality,
		                                  "Too few observations for the conditional Granger test.",
		                                  {{"observations", core::param(n)},
		                                   {"variables", core::param(k)},
		                                   {"lag", core::param(lag)}});
	}

	const Eigen::MatrixXd data = series.matrix();
	Eigen::MatrixXd unrestricted(T, 1 + k * lag);
	Eigen::MatrixXd restricted(T, 1 + (k - 1) * lag);
	const Eigen::MatrixXd y = data.col(static_cast<Eigen::Index>(effect_idx)).tail(T);
	unrestricted.col(0).setOnes();
	restricted.col(0).setOnes();
	Eigen::Index ucol = 1;
	Eigen::Index rcol = 1;
	for (Eigen::Index j = 0; j < k; ++j) {
		for (int i = 1; i <= lag; ++i) {
			const auto lagged = data.col(j).segment(lag - i, T);
			unrestricted.col(ucol++) = lagged;
			if (j != static_cast<Eigen::Index>(cause_idx)) {
				restricted.col(rcol++) = lagged;
			}
		}
	}

	const auto fit_r = utils::ordinaryLeastSquares(restricted, y, core::Stage::Causality);
	const auto fit_u = utils::ordinaryLeastSquares(unrestricted, y, core::Stage::Causality);

	ConditionalGrangerResult result;
	result.cause = cause;
	result.effect = effect;
	result.lag = lag;
	result.f_statistic = fStatistic(fit_r.rss(), fit_u.rss(), lag, df_denominator);
	result.p_value = utils::distributions::fisherFSurvival(result.f_statistic, lag, df_denominator);
	result.significant = result.p_value < options_.significance;
	return result;
}

} // namespace commodex::analysis
