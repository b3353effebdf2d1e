#include "commodex/analysis/stationarity.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/transform/returns.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace commodex::analysis {

namespace {

bool isConstant(const std::vector<double> &values) {
	return std::all_of(values.begin(), values.end(),
	                   [&](double v) { return std::abs(v - values.front()) <= 1e-12 * (1.0 + std::abs(v)); });
}

/// Smallest d in [1, max_order] whose d-th difference is constant, 0 when none is.
int polynomialTrendOrder(const std::vector<double> &values, int max_order) {
	for (int d = 1; d <= max_order && static_cast<int>(values.size()) > d + 1; ++d) {
		if (isConstant(transform::difference(values, d))) {
			return d;
		}
	}
	return 0;
}

} // namespace

const StationarityEntry &StationarityReport::entry(const std::string &variable) const {
	for (const auto &e : entries) {
		if (e.variable == variable) {
			return e;
		}
	}
	throw core::InvalidInputError(core::Stage::Stationarity, "Variable not present in stationarity report.",
	                              {{"variable", variable}});
}

bool StationarityReport::allStationary() const {
	return !entries.empty() &&
	       std::all_of(entries.begin(), entries.end(), [](const StationarityEntry &e) { return e.stationary; });
}

bool StationarityReport::allNonStationary() const {
	return !entries.empty() &&
	       std::none_of(entries.begin(), entries.end(), [](const StationarityEntry &e) { return e.stationary; });
}

int StationarityReport::maxDifferencingOrder() const {
	int order = 0;
	for (const auto &e : entries) {
		order = std::max(order, e.differencing_order);
	}
	return order;
}

void StationarityAnalyzer::Options::validate() const {
	if (max_lag_order < 1) {
		throw core::InvalidInputError(core::Stage::Stationarity, "max_lag_order must be at least 1.",
		                              {{"max_lag_order", core::param(max_lag_order)}});
	}
	if (min_observations <= max_lag_order) {
		throw core::InvalidInputError(core::Stage::Stationarity, "min_observations must exceed max_lag_order.",
		                              {{"min_observations", core::param(min_observations)},
		                               {"max_lag_order", core::param(max_lag_order)}});
	}
	if (!(significance > 0.0 && significance < 1.0)) {
		throw core::InvalidInputError(core::Stage::Stationarity, "Significance must lie in (0, 1).",
		                              {{"significance", core::param(significance)}});
	}
	if (max_differencing_order < 0) {
		throw core::InvalidInputError(core::Stage::Stationarity, "max_differencing_order must be non-negative.",
		                              {{"max_differencing_order", core::param(max_differencing_order)}});
	}
	JohansenTest::Options johansen;
	johansen.lag_differences = johansen_lag_differences;
	johansen.significance = johansen_significance;
	johansen.validate();
}

StationarityAnalyzer::StationarityAnalyzer(Options options) : options_(std::move(options)) {
	options_.validate();
}

AdfResult StationarityAnalyzer::runAdf(const std::vector<double> &values) const {
	AdfOptions adf;
	adf.criterion = options_.adf_criterion;
	adf.max_lag = options_.adf_max_lag;
	return augmentedDickeyFuller(values, adf);
}

StationarityEntry StationarityAnalyzer::test(const std::string &variable, const std::vector<double> &values) const {
	if (static_cast<int>(values.size()) < options_.min_observations) {
		throw core::InsufficientDataError(core::Stage::Stationarity,
		                                  "Too few observations for the unit-root test.",
		                                  {{"variable", variable},
		                                   {"observations", core::param(values.size())},
		                                   {"min_observations", core::param(options_.min_observations)}});
	}

	StationarityEntry entry;
	entry.variable = variable;

	// A constant sequence has no unit root to test for.
	if (isConstant(values)) {
		entry.statistic = -std::numeric_limits<double>::infinity();
		entry.p_value = 0.0;
		entry.stationary = true;
		entry.observations = static_cast<int>(values.size());
		return entry;
	}

	// Deterministic trends make the ADF regressors collinear; their order is known exactly.
	const int trend_order = polynomialTrendOrder(values, options_.max_differencing_order + 1);
	if (trend_order > 0) {
		entry.statistic = std::numeric_limits<double>::quiet_NaN();
		entry.p_value = 1.0;
		entry.stationary = false;
		entry.differencing_order = std::min(trend_order, options_.max_differencing_order);
		entry.observations = static_cast<int>(values.size());
		COMMODEX_DEBUG("ADF {}: deterministic trend of order {}, d={}", variable, trend_order - 1,
		               entry.differencing_order);
		return entry;
	}

	const AdfResult levels = runAdf(values);
	entry.statistic = levels.statistic;
	entry.p_value = levels.p_value;
	entry.stationary = levels.stationary(options_.significance);
	entry.used_lag = levels.used_lag;
	entry.observations = levels.observations;
	entry.critical_5 = levels.critical_5;

	entry.differencing_order = options_.max_differencing_order;
	if (entry.stationary) {
		entry.differencing_order = 0;
	} else {
		for (int d = 1; d <= options_.max_differencing_order; ++d) {
			const auto diffed = transform::difference(values, d);
			if (isConstant(diffed) || runAdf(diffed).stationary(options_.significance)) {
				entry.differencing_order = d;
				break;
			}
		}
	}

	COMMODEX_DEBUG("ADF {}: stat={:.4f} p={:.4f} lag={} d={}", variable, entry.statistic, entry.p_value,
	               entry.used_lag, entry.differencing_order);
	return entry;
}

StationarityReport StationarityAnalyzer::analyze(const core::MultivariateSeries &series) const {
	if (static_cast<int>(series.size()) < options_.min_observations) {
		throw core::InsufficientDataError(core::Stage::Stationarity,
		                                  "Series shorter than the configured minimum number of observations.",
		                                  {{"observations", core::param(series.size())},
		                                   {"min_observations", core::param(options_.min_observations)},
		                                   {"max_lag_order", core::param(options_.max_lag_order)}});
	}

	StationarityReport report;
	report.significance = options_.significance;
	for (const auto &name : series.variables()) {
		report.entries.push_back(test(name, series.column(name)));
	}

	const auto stationary =
	    std::count_if(report.entries.begin(), report.entries.end(), [](const StationarityEntry &e) { return e.stationary; });
	COMMODEX_INFO("Stationarity: {} of {} variables stationary at {:.0f}%", stationary, report.entries.size(),
	              100.0 * options_.significance);
	return report;
}

CointegrationResult StationarityAnalyzer::cointegration(const core::MultivariateSeries &series,
                                                        const StationarityReport &report) const {
	if (series.dimensions() < 2) {
		throw core::ModelNotApplicableError(core::Stage::Cointegration,
		                                    "Cointegration rank is undefined for fewer than 2 variables.",
		                                    {{"variables", core::param(series.dimensions())}});
	}
	std::vector<std::string> stationary;
	for (const auto &name : series.variables()) {
		if (report.entry(name).stationary) {
			stationary.push_back(name);
		}
	}
	if (!stationary.empty()) {
		throw core::ModelNotApplicableError(core::Stage::Cointegration,
		                                    "Cointegration requires every variable to be non-stationary.",
		                                    {{"stationary_variables", core::param(stationary.size())},
		                                     {"first_stationary", stationary.front()}});
	}

	JohansenTest::Options johansen;
	johansen.lag_differences = options_.johansen_lag_differences;
	johansen.significance = options_.johansen_significance;
	return JohansenTest(johansen).run(series);
}

} // namespace commodex::analysis
