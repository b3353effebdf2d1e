#pragma once

#include "commodex/core/forecast.hpp"
#include "commodex/core/volatility_path.hpp"
#include "commodex/models/garch.hpp"
#include "commodex/models/model_capability.hpp"
#include "commodex/models/var.hpp"
#include "commodex/models/vecm.hpp"

#include <memory>
#include <utility>
#include <variant>

namespace commodex::models {

/**
 * @class FittedModel
 * @brief Sum type over the fitted model alternatives.
 *
 * Dispatch goes through the IFittedModel capability of the held alternative.
 * Instances are created by the fit functions below, never mutated, and shared
 * through std::shared_ptr<const FittedModel>.
 */
class FittedModel {
public:
	using Variant = std::variant<VarModel, VecmModel, GarchModel>;

	explicit FittedModel(Variant model) : model_(std::move(model)) {
	}

	ModelKind kind() const {
		return capability().kind();
	}

	const IFittedModel &capability() const;

	const ModelDiagnostics &diagnostics() const {
		return capability().diagnostics();
	}

	const std::vector<std::string> &variables() const {
		return capability().variables();
	}

	std::string describe() const {
		return capability().describe();
	}

	const Variant &variant() const {
		return model_;
	}

	/// The held alternative, or nullptr when it is of another kind.
	template <typename Model>
	const Model *as() const {
		return std::get_if<Model>(&model_);
	}

private:
	Variant model_;
};

using FittedModelPtr = std::shared_ptr<const FittedModel>;

FittedModelPtr fitVar(const core::MultivariateSeries &series, const VarOptions &options = {});

FittedModelPtr fitVecm(const core::MultivariateSeries &series, const analysis::CointegrationResult &cointegration,
                       const VecmOptions &options = {});

FittedModelPtr fitGarch(const core::TimeSeries &returns, const GarchOptions &options = {});

/**
 * @brief Forecast tied to the model that produced it.
 *
 * @p target names the price variable when the model holds several.
 */
core::Forecast forecast(const FittedModelPtr &model, int horizon, double confidence,
                        const std::string &target = {});

/// @throws InvalidInputError unless @p model holds a GARCH fit.
core::VolatilityPath forecastVolatility(const FittedModelPtr &model, int horizon);

} // namespace commodex::models
