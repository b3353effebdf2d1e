#pragma once

#include "commodex/core/config.hpp"

#include <optional>
#include <vector>

namespace commodex::analysis {

/// Outcome of an augmented Dickey-Fuller regression with a constant.
struct AdfResult {
	double statistic = 0.0; // t-ratio of the lagged level
	double p_value = 1.0;
	int used_lag = 0;
	int observations = 0; // rows in the final regression
	double critical_1 = 0.0;
	double critical_5 = 0.0;
	double critical_10 = 0.0;

	/// Whether the unit-root null is rejected at @p significance.
	bool stationary(double significance) const {
		return p_value < significance;
	}
};

struct AdfOptions {
	/// Largest lag considered; defaults to floor(12 * (n / 100)^(1/4)).
	std::optional<int> max_lag;
	core::InformationCriterion criterion = core::InformationCriterion::AIC;
};

/**
 * @brief Augmented Dickey-Fuller test.
 *
 * Regresses the first difference on a constant, the lagged level and L lagged
 * differences. L is picked by the information criterion over 0..max_lag on a
 * common sample, then the regression is re-run on every usable row.
 *
 * @throws InsufficientDataError when the series is too short for any lag.
 * @throws ModelNotApplicableError for a constant series.
 */
AdfResult augmentedDickeyFuller(const std::vector<double> &values, const AdfOptions &options = {});

/// MacKinnon (1994) approximate p-value for the constant-only single-series case.
double mackinnonPValue(double statistic);

/// MacKinnon (2010) 1%, 5% and 10% critical values for @p observations rows.
void mackinnonCriticalValues(int observations, double &one, double &five, double &ten);

} // namespace commodex::analysis
