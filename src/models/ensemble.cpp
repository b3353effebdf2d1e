#include "commodex/models/ensemble.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace commodex::models {

namespace {

double median(std::vector<double> values) {
	std::sort(values.begin(), values.end());
	const std::size_t n = values.size();
	if (n % 2 == 0) {
		return 0.5 * (values[n / 2 - 1] + values[n / 2]);
	}
	return values[n / 2];
}

double combine(const std::vector<double> &values, const std::vector<double> &weights,
               EnsembleCombinationMethod method) {
	if (method == EnsembleCombinationMethod::Median) {
		return median(values);
	}
	double sum = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		sum += weights[i] * values[i];
	}
	return sum;
}

} // namespace

std::string toString(EnsembleCombinationMethod method) {
	switch (method) {
	case EnsembleCombinationMethod::Mean:
		return "mean";
	case EnsembleCombinationMethod::Median:
		return "median";
	case EnsembleCombinationMethod::WeightedAccuracy:
		return "accuracy-weighted";
	default:
		return "?";
	}
}

ForecastEnsemble::ForecastEnsemble(std::vector<FittedModelPtr> models, const EnsembleConfig &config)
    : models_(std::move(models)), config_(config) {
	if (models_.empty()) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Ensemble needs at least one model.");
	}
	if (!(config_.min_rmse > 0.0)) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Ensemble RMSE floor must be positive.",
		                              {{"min_rmse", core::param(config_.min_rmse)}});
	}
	for (std::size_t i = 0; i < models_.size(); ++i) {
		if (!models_[i]) {
			throw core::InvalidInputError(core::Stage::ForecastModel, "Ensemble member is not fitted.",
			                              {{"member", core::param(i)}});
		}
		if (models_[i]->kind() == ModelKind::GARCH) {
			throw core::InvalidInputError(core::Stage::ForecastModel, "Ensemble members must be mean models.",
			                              {{"member", core::param(i)}, {"kind", toString(models_[i]->kind())}});
		}
	}
}

std::string ForecastEnsemble::name() const {
	return "Ensemble<" + toString(config_.method) + ", " + std::to_string(models_.size()) + " models>";
}

std::vector<double> ForecastEnsemble::weights(const std::string &target) const {
	std::vector<double> result(models_.size(), 1.0 / static_cast<double>(models_.size()));
	if (config_.method != EnsembleCombinationMethod::WeightedAccuracy) {
		return result;
	}

	double total = 0.0;
	for (std::size_t i = 0; i < models_.size(); ++i) {
		const auto &equations = models_[i]->diagnostics().equations;
		const auto it = std::find_if(equations.begin(), equations.end(),
		                             [&](const EquationDiagnostics &eq) { return eq.variable == target; });
		if (it == equations.end() || !std::isfinite(it->rmse)) {
			throw core::InvalidInputError(core::Stage::ForecastModel, "Ensemble member has no fit for the target.",
			                              {{"member", core::param(i)}, {"target", target}});
		}
		result[i] = 1.0 / std::max(it->rmse, config_.min_rmse);
		total += result[i];
	}
	for (auto &weight : result) {
		weight /= total;
	}
	return result;
}

std::vector<core::Forecast> ForecastEnsemble::individualForecasts(int horizon, double confidence,
                                                                  const std::string &target) const {
	std::vector<core::Forecast> forecasts;
	forecasts.reserve(models_.size());
	for (const auto &model : models_) {
		forecasts.push_back(forecast(model, horizon, confidence, target));
	}
	return forecasts;
}

core::Forecast ForecastEnsemble::predict(int horizon, double confidence, const std::string &target) const {
	if (target.empty()) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Ensemble forecasts need a target variable.");
	}
	const auto members = individualForecasts(horizon, confidence, target);
	const auto member_weights = weights(target);

	core::Forecast result;
	result.variables = {target};
	result.target = target;
	result.confidence_level = confidence;
	const auto steps = static_cast<std::size_t>(horizon) + 1;
	result.point.assign(1, std::vector<double>(steps, 0.0));
	result.lower.assign(1, std::vector<double>(steps, 0.0));
	result.upper.assign(1, std::vector<double>(steps, 0.0));

	std::vector<double> points(members.size());
	std::vector<double> below(members.size());
	std::vector<double> above(members.size());
	for (std::size_t h = 0; h < steps; ++h) {
		for (std::size_t i = 0; i < members.size(); ++i) {
			const std::size_t v = members[i].targetIndex();
			points[i] = members[i].point[v][h];
			below[i] = points[i] - members[i].lower[v][h];
			above[i] = members[i].upper[v][h] - points[i];
		}
		const double center = combine(points, member_weights, config_.method);
		result.point[0][h] = center;
		result.lower[0][h] = center - combine(below, member_weights, config_.method);
		result.upper[0][h] = center + combine(above, member_weights, config_.method);
	}

	COMMODEX_DEBUG("{} forecast of '{}' over {} steps", name(), target, horizon);
	return result;
}

} // namespace commodex::models
