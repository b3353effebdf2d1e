#include "commodex/utils/metrics.hpp"
#include "commodex/core/errors.hpp"

#include <cmath>
#include <limits>
#include <numeric>

namespace commodex::utils {

namespace {

void validateLengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw core::InvalidInputError(core::Stage::ForecastModel,
		                              "Actual and predicted vectors must be non-empty and equal length.",
		                              {{"actual", core::param(actual.size())},
		                               {"predicted", core::param(predicted.size())}});
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validateLengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validateLengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validateLengths(actual, predicted);
	const double mean = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());
	double ss_tot = 0.0;
	double ss_res = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		ss_tot += (actual[i] - mean) * (actual[i] - mean);
		ss_res += (actual[i] - predicted[i]) * (actual[i] - predicted[i]);
	}
	if (ss_tot <= std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return 1.0 - ss_res / ss_tot;
}

} // namespace commodex::utils
