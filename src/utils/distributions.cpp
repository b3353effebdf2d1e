#include "commodex/utils/distributions.hpp"
#include "commodex/core/errors.hpp"

#include <boost/math/constants/constants.hpp>
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <cmath>

namespace commodex::utils::distributions {

namespace {

void checkProbability(double p) {
	if (!(p > 0.0 && p < 1.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Probability must lie strictly between 0 and 1.",
		                              {{"probability", core::param(p)}});
	}
}

} // namespace

double normalCdf(double x) {
	if (std::isnan(x)) {
		return x;
	}
	if (std::isinf(x)) {
		return x > 0.0 ? 1.0 : 0.0;
	}
	return boost::math::cdf(boost::math::normal(), x);
}

double normalQuantile(double p) {
	checkProbability(p);
	return boost::math::quantile(boost::math::normal(), p);
}

double normalCritical(double confidence) {
	checkProbability(confidence);
	return normalQuantile(0.5 + 0.5 * confidence);
}

double studentTQuantile(double p, double degrees_of_freedom) {
	checkProbability(p);
	if (!(degrees_of_freedom > 0.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Student-t degrees of freedom must be positive.",
		                              {{"dof", core::param(degrees_of_freedom)}});
	}
	return boost::math::quantile(boost::math::students_t(degrees_of_freedom), p);
}

double standardizedStudentTQuantile(double p, double degrees_of_freedom) {
	if (!(degrees_of_freedom > 2.0)) {
		throw core::InvalidInputError(core::Stage::Risk,
		                              "Unit-variance Student-t requires more than 2 degrees of freedom.",
		                              {{"dof", core::param(degrees_of_freedom)}});
	}
	return studentTQuantile(p, degrees_of_freedom) * std::sqrt((degrees_of_freedom - 2.0) / degrees_of_freedom);
}

double standardizedStudentTLogPdf(double z, double degrees_of_freedom) {
	const double nu = degrees_of_freedom;
	const double pi = boost::math::constants::pi<double>();
	return std::lgamma(0.5 * (nu + 1.0)) - std::lgamma(0.5 * nu) - 0.5 * std::log(pi * (nu - 2.0)) -
	       0.5 * (nu + 1.0) * std::log1p(z * z / (nu - 2.0));
}

double normalExpectedShortfall(double confidence) {
	checkProbability(confidence);
	const boost::math::normal normal;
	return boost::math::pdf(normal, boost::math::quantile(normal, confidence)) / (1.0 - confidence);
}

double standardizedStudentTExpectedShortfall(double confidence, double degrees_of_freedom) {
	checkProbability(confidence);
	const double nu = degrees_of_freedom;
	if (!(nu > 2.0)) {
		throw core::InvalidInputError(core::Stage::Risk,
		                              "Unit-variance Student-t requires more than 2 degrees of freedom.",
		                              {{"dof", core::param(nu)}});
	}
	const double scale = std::sqrt((nu - 2.0) / nu);
	const boost::math::students_t dist(nu);
	const double t = boost::math::quantile(dist, confidence);
	const double tail = boost::math::pdf(dist, t) / (1.0 - confidence) * (nu + t * t) / (nu - 1.0);
	return tail * scale;
}

double chiSquaredSurvival(double statistic, double degrees_of_freedom) {
	if (!std::isfinite(statistic) || !(degrees_of_freedom > 0.0)) {
		return 1.0;
	}
	if (statistic <= 0.0) {
		return 1.0;
	}
	return boost::math::cdf(boost::math::complement(boost::math::chi_squared(degrees_of_freedom), statistic));
}

double fisherFSurvival(double statistic, double numerator_dof, double denominator_dof) {
	if (!std::isfinite(statistic) || !(numerator_dof > 0.0) || !(denominator_dof > 0.0)) {
		return 1.0;
	}
	if (statistic <= 0.0) {
		return 1.0;
	}
	return boost::math::cdf(
	    boost::math::complement(boost::math::fisher_f(numerator_dof, denominator_dof), statistic));
}

} // namespace commodex::utils::distributions
