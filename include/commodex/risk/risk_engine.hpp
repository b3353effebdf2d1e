#pragma once

#include "commodex/core/config.hpp"
#include "commodex/core/forecast.hpp"
#include "commodex/core/volatility_path.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace commodex::risk {

enum class RiskLevel {
	Low,
	Medium,
	High
};

enum class HedgeStrategy {
	NoHedge,
	PartialHedge,
	FullHedge,
	DynamicHedge
};

std::string toString(RiskLevel level);
std::string toString(HedgeStrategy strategy);

/**
 * @struct HedgingOptions
 * @brief Cost rates and volatility bands of the hedge strategy comparison.
 *
 * Volatilities here are horizon volatilities, the standard deviation of the
 * cumulative return over the forecast horizon.
 */
struct HedgingOptions {
	double partial_ratio = 0.5;
	double partial_cost_rate = 0.02;  // fraction of the hedged notional
	double full_cost_rate = 0.035;
	double full_risk_reduction = 0.9; // basis risk remains under a full hedge
	double dynamic_cost_rate = 0.025;
	double dynamic_max_ratio = 0.8;
	double dynamic_volatility_scale = 0.05; // ratio = min(max ratio, volatility / scale)
	double full_hedge_volatility = 0.06;
	double partial_hedge_volatility = 0.03;
	double dynamic_hedge_volatility = 0.015;

	void validate() const;
};

struct RiskOptions {
	double confidence_level = 0.95;
	core::RiskThresholds thresholds;
	double risk_tolerance = 0.30;  // annualized volatility that calls for a full hedge
	double periods_per_year = 252.0;
	HedgingOptions hedging;

	void validate() const;
};

struct ValueAtRisk {
	double confidence_level = 0.95;
	int horizon = 0;                // volatility steps aggregated
	double exposure = 0.0;
	double reference_price = 0.0;
	double horizon_volatility = 0.0; // standard deviation of the cumulative return
	double quantile = 0.0;
	double value_at_risk = 0.0;
	double expected_shortfall = 0.0;
	core::ResidualDistribution distribution = core::ResidualDistribution::Normal;
};

/// Percentage shift applied to the target point forecast, e.g. -0.10.
struct StressScenario {
	std::string name;
	double shock = 0.0;
	std::optional<int> step; // defaults to the last forecast step
};

struct ScenarioImpact {
	std::string name;
	double shock = 0.0;
	int step = 0;
	double price = 0.0;
	double cost_delta = 0.0;
};

struct StressTestResult {
	double exposure = 0.0;
	std::vector<ScenarioImpact> impacts; // in scenario order

	const ScenarioImpact &impact(const std::string &name) const;

	/// Scenario with the largest absolute cost delta, nullptr when empty.
	const ScenarioImpact *worst() const;
};

struct HedgeRecommendation {
	double annualized_volatility = 0.0;
	double ratio = 0.0;
	double quantity = 0.0;
	HedgeStrategy strategy = HedgeStrategy::NoHedge;
};

struct HedgeScenario {
	HedgeStrategy strategy = HedgeStrategy::NoHedge;
	double hedge_ratio = 0.0;
	double hedge_quantity = 0.0;
	double hedging_cost = 0.0;
	double risk_reduction = 0.0;
	double max_loss = 0.0;                  // VaR left after the hedge
	std::optional<double> cost_benefit_ratio; // cost per unit of VaR removed, empty when nothing is removed
};

/**
 * @struct HedgingAnalysis
 * @brief Side-by-side costs and residual losses of the four hedge strategies.
 */
struct HedgingAnalysis {
	double quantity = 0.0;
	double current_price = 0.0;
	double horizon_volatility = 0.0;
	double unhedged_var = 0.0;
	double expected_shortfall = 0.0;
	std::vector<HedgeScenario> scenarios; // no, partial, full and dynamic hedge
	HedgeStrategy recommended = HedgeStrategy::NoHedge;

	const HedgeScenario &scenario(HedgeStrategy strategy) const;

	const HedgeScenario &recommendedScenario() const {
		return scenario(recommended);
	}
};

/**
 * @struct RiskAssessment
 * @brief Risk figures for one exposure, with read-only references to the
 * forecast and volatility path they were derived from.
 */
struct RiskAssessment {
	std::shared_ptr<const core::Forecast> forecast;
	std::shared_ptr<const core::VolatilityPath> volatility;
	ValueAtRisk value_at_risk;
	StressTestResult stress;
	HedgeRecommendation hedge;
	HedgingAnalysis hedging;
	RiskLevel level = RiskLevel::Low;
	double annualized_volatility = 0.0;
};

/**
 * @class RiskEngine
 * @brief Parametric VaR, stress scenarios, hedge sizing and risk banding.
 *
 * The VaR quantile follows the distribution family recorded on the volatility
 * path, so it matches the likelihood the volatility model was fitted with.
 */
class RiskEngine {
public:
	RiskEngine() = default;
	explicit RiskEngine(RiskOptions options);

	/**
	 * @brief VaR = exposure * price * q(confidence) * sqrt(sum of path variances).
	 *
	 * The reference price is the target point forecast at the last step covered
	 * by both the forecast and the path. Without an exposure the figures are per
	 * unit of the commodity.
	 *
	 * @throws InvalidInputError on an empty path, an empty forecast, a
	 *         confidence outside (0, 1) or a negative exposure.
	 */
	ValueAtRisk computeVaR(const core::Forecast &forecast, const core::VolatilityPath &path, double confidence_level,
	                       double exposure = 1.0) const;

	/// Per-unit VaR at the configured confidence level.
	ValueAtRisk computeVaR(const core::Forecast &forecast, const core::VolatilityPath &path) const {
		return computeVaR(forecast, path, options_.confidence_level);
	}

	/**
	 * @brief Cost delta per scenario: exposure * shock * price at the scenario step.
	 *
	 * Scenarios are evaluated independently against the unshocked forecast.
	 * @throws InvalidInputError on duplicate or empty names, or a step outside the forecast.
	 */
	StressTestResult stressTest(const core::Forecast &forecast, const std::vector<StressScenario> &scenarios,
	                            double exposure) const;

	/// Ratio = clamp(annualized volatility / risk tolerance, 0, 1).
	HedgeRecommendation recommendHedge(const core::VolatilityPath &path, double exposure) const;

	/**
	 * @brief Compares no, partial, full and dynamic hedges of a purchase quantity.
	 *
	 * Hedging costs are charged on the notional at the current price (forecast
	 * step 0). Each strategy keeps (1 - risk reduction) of the unhedged VaR. The
	 * recommendation follows the horizon volatility bands in HedgingOptions.
	 *
	 * @throws InvalidInputError on an empty forecast or path, or a negative quantity.
	 */
	HedgingAnalysis compareHedges(const core::Forecast &forecast, const core::VolatilityPath &path,
	                              double quantity) const;

	RiskLevel classify(double annualized_volatility) const;

	RiskLevel classify(const core::VolatilityPath &path) const {
		return classify(path.annualizedVolatility(options_.periods_per_year));
	}

	RiskAssessment assess(std::shared_ptr<const core::Forecast> forecast,
	                      std::shared_ptr<const core::VolatilityPath> volatility, double exposure,
	                      const std::vector<StressScenario> &scenarios = {}) const;

	const RiskOptions &options() const {
		return options_;
	}

private:
	RiskOptions options_;
};

} // namespace commodex::risk
