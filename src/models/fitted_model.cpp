#include "commodex/models/fitted_model.hpp"
#include "commodex/core/errors.hpp"

namespace commodex::models {

std::string toString(ModelKind kind) {
	switch (kind) {
	case ModelKind::VAR:
		return "VAR";
	case ModelKind::VECM:
		return "VECM";
	case ModelKind::GARCH:
		return "GARCH";
	default:
		return "?";
	}
}

const IFittedModel &FittedModel::capability() const {
	return std::visit([](const auto &model) -> const IFittedModel & { return model; }, model_);
}

FittedModelPtr fitVar(const core::MultivariateSeries &series, const VarOptions &options) {
	return std::make_shared<const FittedModel>(VarModel::fit(series, options));
}

FittedModelPtr fitVecm(const core::MultivariateSeries &series, const analysis::CointegrationResult &cointegration,
                       const VecmOptions &options) {
	return std::make_shared<const FittedModel>(VecmModel::fit(series, cointegration, options));
}

FittedModelPtr fitGarch(const core::TimeSeries &returns, const GarchOptions &options) {
	return std::make_shared<const FittedModel>(GarchModel::fit(returns, options));
}

core::Forecast forecast(const FittedModelPtr &model, int horizon, double confidence, const std::string &target) {
	if (!model) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Cannot forecast without a fitted model.");
	}
	core::Forecast result = model->capability().forecast(horizon, confidence);
	if (!target.empty()) {
		result.indexOf(target);
		result.target = target;
	} else if (result.target.empty()) {
		result.target = result.variables.front();
	}
	result.model = model;
	return result;
}

core::VolatilityPath forecastVolatility(const FittedModelPtr &model, int horizon) {
	const GarchModel *garch = model ? model->as<GarchModel>() : nullptr;
	if (!garch) {
		throw core::InvalidInputError(core::Stage::Volatility, "Volatility forecasts need a GARCH model.",
		                              {{"kind", model ? toString(model->kind()) : std::string("none")}});
	}
	core::VolatilityPath path = garch->forecastVolatility(horizon);
	path.model = model;
	return path;
}

} // namespace commodex::models
