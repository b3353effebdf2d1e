#pragma once

#include "commodex/core/forecast.hpp"
#include "commodex/models/fitted_model.hpp"

#include <string>
#include <vector>

namespace commodex::models {

/**
 * @enum EnsembleCombinationMethod
 * @brief Specifies how member price paths are combined.
 */
enum class EnsembleCombinationMethod {
	/**
	 * @brief Arithmetic mean of the members (equal weights)
	 */
	Mean,

	/**
	 * @brief Pointwise median of the members (robust to a diverging member)
	 */
	Median,

	/**
	 * @brief Weighted mean, weights proportional to 1 / in-sample RMSE of
	 * each member's target equation
	 */
	WeightedAccuracy
};

std::string toString(EnsembleCombinationMethod method);

/**
 * @struct EnsembleConfig
 * @brief Configuration for forecast ensembles
 */
struct EnsembleConfig {
	/// Method for combining member forecasts
	EnsembleCombinationMethod method = EnsembleCombinationMethod::Mean;

	/// Floor applied to member RMSEs before inversion
	double min_rmse = 1e-12;
};

/**
 * @class ForecastEnsemble
 * @brief Combines the target price paths of several fitted mean models.
 *
 * Point paths and the lower and upper band half-widths are combined
 * separately, so the combined band never narrows as the horizon grows when no
 * member band does. The combined forecast holds the target variable only and
 * carries no model reference, since no single model produced it.
 *
 * @example
 * ```cpp
 * ForecastEnsemble ensemble({var_model, univariate_model});
 * auto combined = ensemble.predict(30, 0.95, "copper");
 * ```
 */
class ForecastEnsemble {
public:
	/**
	 * @throws InvalidInputError when @p models is empty or holds a null or
	 *         volatility-only member.
	 */
	explicit ForecastEnsemble(std::vector<FittedModelPtr> models, const EnsembleConfig &config = EnsembleConfig{});

	/**
	 * @brief Combined forecast of @p target.
	 * @throws InvalidInputError when a member does not model @p target.
	 */
	core::Forecast predict(int horizon, double confidence, const std::string &target) const;

	/// Member weights in model order, summing to one. Median ensembles report equal weights.
	std::vector<double> weights(const std::string &target) const;

	std::vector<core::Forecast> individualForecasts(int horizon, double confidence, const std::string &target) const;

	const std::vector<FittedModelPtr> &models() const {
		return models_;
	}

	const EnsembleConfig &config() const {
		return config_;
	}

	std::string name() const;

private:
	std::vector<FittedModelPtr> models_;
	EnsembleConfig config_;
};

} // namespace commodex::models
