#pragma once

#include "commodex/core/config.hpp"
#include "commodex/core/multivariate_series.hpp"

#include <string>
#include <vector>

namespace commodex::analysis {

struct LagTest {
	int lag = 0;
	double f_statistic = 0.0;
	double p_value = 1.0;
	int df_numerator = 0;
	int df_denominator = 0;
};

/// Granger test of "cause helps predict effect" scanned over candidate lags.
struct GrangerResult {
	std::string cause;
	std::string effect;
	std::vector<LagTest> lag_tests;
	int best_lag = 0;
	double min_p_value = 1.0;
	double corrected_p_value = 1.0; // after the multiple-comparison correction
	bool significant = false;
};

/// Block-exogeneity test of one variable inside the full system.
struct ConditionalGrangerResult {
	std::string cause;
	std::string effect;
	int lag = 0;
	double f_statistic = 0.0;
	double p_value = 1.0;
	bool significant = false;
};

/// Human-readable significance band of a p-value.
std::string describeSignificance(double p_value);

struct CausalityReport {
	std::vector<std::string> variables;
	std::vector<GrangerResult> results;
	core::MultipleComparisonCorrection correction = core::MultipleComparisonCorrection::Bonferroni;
	double significance = 0.05;

	const GrangerResult &result(const std::string &cause, const std::string &effect) const;

	/// Variables that significantly Granger-cause @p target, in series order.
	std::vector<std::string> causesOf(const std::string &target) const;

	/// @p target followed by its significant causes.
	std::vector<std::string> selectVariables(const std::string &target) const;
};

/**
 * @class CausalityTester
 * @brief Pairwise and conditional Granger causality with lag-scan correction.
 */
class CausalityTester {
public:
	struct Options {
		std::vector<int> candidate_lags; // empty: 1..max_lag
		int max_lag = 5;
		double significance = 0.05;
		core::MultipleComparisonCorrection correction = core::MultipleComparisonCorrection::Bonferroni;

		void validate() const;
		std::vector<int> lags() const;
	};

	CausalityTester() = default;
	explicit CausalityTester(Options options);

	/// Tests whether @p cause Granger-causes @p effect.
	GrangerResult test(const core::MultivariateSeries &series, const std::string &cause,
	                   const std::string &effect) const;

	/// Every ordered pair of distinct variables.
	CausalityReport testAll(const core::MultivariateSeries &series) const;

	/**
	 * @brief Conditional test at a fixed lag: the unrestricted regression holds
	 * lags of every variable, the restricted one drops the lags of @p cause.
	 */
	ConditionalGrangerResult testConditional(const core::MultivariateSeries &series, const std::string &cause,
	                                         const std::string &effect, int lag) const;

	/// Applies the configured correction to a minimum p-value over @p tests lags.
	double correct(double p_value, std::size_t tests) const;

	const Options &options() const {
		return options_;
	}

private:
	LagTest testLag(const std::vector<double> &cause, const std::vector<double> &effect, int lag) const;

	Options options_;
};

} // namespace commodex::analysis
