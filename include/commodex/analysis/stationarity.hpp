#pragma once

#include "commodex/analysis/cointegration.hpp"
#include "commodex/analysis/unit_root.hpp"
#include "commodex/core/config.hpp"
#include "commodex/core/multivariate_series.hpp"

#include <optional>
#include <string>
#include <vector>

namespace commodex::analysis {

struct StationarityEntry {
	std::string variable;
	double statistic = 0.0;
	double p_value = 1.0;
	bool stationary = false;
	int differencing_order = 0; // suggested d
	int used_lag = 0;
	int observations = 0;
	double critical_5 = 0.0;
};

/**
 * @struct StationarityReport
 * @brief Per-variable unit-root decisions for one analysis run.
 */
struct StationarityReport {
	std::vector<StationarityEntry> entries;
	double significance = 0.05;

	const StationarityEntry &entry(const std::string &variable) const;

	bool allStationary() const;
	bool allNonStationary() const;

	/// Largest suggested differencing order across variables.
	int maxDifferencingOrder() const;
};

/**
 * @class StationarityAnalyzer
 * @brief Runs ADF tests per variable and, when every variable has a unit root,
 * the Johansen rank test.
 */
class StationarityAnalyzer {
public:
	struct Options {
		int min_observations = 30; // must exceed max_lag_order
		int max_lag_order = 5;
		double significance = 0.05;
		int max_differencing_order = 2;
		core::InformationCriterion adf_criterion = core::InformationCriterion::AIC;
		std::optional<int> adf_max_lag;
		int johansen_lag_differences = 1;
		double johansen_significance = 0.05;

		void validate() const;
	};

	StationarityAnalyzer() = default;
	explicit StationarityAnalyzer(Options options);

	/**
	 * @throws InsufficientDataError when the series has fewer than min_observations rows.
	 */
	StationarityReport analyze(const core::MultivariateSeries &series) const;

	/// Unit-root test of a single sequence.
	StationarityEntry test(const std::string &variable, const std::vector<double> &values) const;

	/**
	 * @brief Johansen rank test over the variables of @p report.
	 * @throws ModelNotApplicableError when fewer than 2 variables are given or
	 *         some variable is already stationary.
	 */
	CointegrationResult cointegration(const core::MultivariateSeries &series, const StationarityReport &report) const;

	const Options &options() const {
		return options_;
	}

private:
	AdfResult runAdf(const std::vector<double> &values) const;

	Options options_;
};

} // namespace commodex::analysis
