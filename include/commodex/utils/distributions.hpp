#pragma once

namespace commodex::utils {

/**
 * @brief Distribution functions used by the hypothesis tests and risk quantiles.
 *
 * Thin wrappers over Boost.Math. Survival functions return upper-tail
 * probabilities; degenerate arguments (non-finite statistics, non-positive
 * degrees of freedom) map to the conservative p-value of 1.
 */
namespace distributions {

double normalCdf(double x);
double normalQuantile(double p);

/// Two-sided critical value for a central interval of coverage @p confidence.
double normalCritical(double confidence);

double studentTQuantile(double p, double degrees_of_freedom);

/// Quantile of the Student-t rescaled to unit variance (requires dof > 2).
double standardizedStudentTQuantile(double p, double degrees_of_freedom);

/// Log density of the unit-variance Student-t at @p z.
double standardizedStudentTLogPdf(double z, double degrees_of_freedom);

/**
 * @brief Expected shortfall of a unit-variance loss beyond its @p confidence quantile.
 *
 * Normal: phi(z) / (1 - c). Student-t: the t tail mean rescaled to unit variance.
 */
double normalExpectedShortfall(double confidence);
double standardizedStudentTExpectedShortfall(double confidence, double degrees_of_freedom);

double chiSquaredSurvival(double statistic, double degrees_of_freedom);
double fisherFSurvival(double statistic, double numerator_dof, double denominator_dof);

} // namespace distributions

} // namespace commodex::utils
