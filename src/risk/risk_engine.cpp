#include "commodex/risk/risk_engine.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/distributions.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace commodex::risk {

namespace {

void checkExposure(double exposure) {
	if (!std::isfinite(exposure) || exposure < 0.0) {
		throw core::InvalidInputError(core::Stage::Risk, "Exposure must be a finite non-negative quantity.",
		                              {{"exposure", core::param(exposure)}});
	}
}

void checkPath(const core::VolatilityPath &path) {
	if (path.variance.empty()) {
		throw core::InvalidInputError(core::Stage::Risk, "Volatility path is empty.");
	}
	for (std::size_t i = 0; i < path.variance.size(); ++i) {
		if (!std::isfinite(path.variance[i]) || path.variance[i] < 0.0) {
			throw core::InvalidInputError(core::Stage::Risk, "Volatility path holds an invalid variance.",
			                              {{"step", core::param(i + 1)}, {"variance", core::param(path.variance[i])}});
		}
	}
}

void checkForecast(const core::Forecast &forecast) {
	if (forecast.empty()) {
		throw core::InvalidInputError(core::Stage::Risk, "Forecast is empty.");
	}
}

} // namespace

std::string toString(RiskLevel level) {
	switch (level) {
	case RiskLevel::Low:
		return "Low";
	case RiskLevel::Medium:
		return "Medium";
	case RiskLevel::High:
		return "High";
	default:
		return "?";
	}
}

std::string toString(HedgeStrategy strategy) {
	switch (strategy) {
	case HedgeStrategy::NoHedge:
		return "no hedge";
	case HedgeStrategy::PartialHedge:
		return "partial hedge";
	case HedgeStrategy::FullHedge:
		return "full hedge";
	case HedgeStrategy::DynamicHedge:
		return "dynamic hedge";
	default:
		return "?";
	}
}

void HedgingOptions::validate() const {
	const auto checkFraction = [](const char *name, double value) {
		if (!(value >= 0.0 && value <= 1.0)) {
			throw core::InvalidInputError(core::Stage::Risk, "Hedging fraction must lie in [0, 1].",
			                              {{name, core::param(value)}});
		}
	};
	checkFraction("partial_ratio", partial_ratio);
	checkFraction("partial_cost_rate", partial_cost_rate);
	checkFraction("full_cost_rate", full_cost_rate);
	checkFraction("full_risk_reduction", full_risk_reduction);
	checkFraction("dynamic_cost_rate", dynamic_cost_rate);
	checkFraction("dynamic_max_ratio", dynamic_max_ratio);
	if (!(dynamic_volatility_scale > 0.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Dynamic hedge volatility scale must be positive.",
		                              {{"dynamic_volatility_scale", core::param(dynamic_volatility_scale)}});
	}
	if (!(dynamic_hedge_volatility >= 0.0 && partial_hedge_volatility > dynamic_hedge_volatility &&
	      full_hedge_volatility > partial_hedge_volatility)) {
		throw core::InvalidInputError(core::Stage::Risk, "Hedge volatility bands must be non-negative and increasing.",
		                              {{"dynamic", core::param(dynamic_hedge_volatility)},
		                               {"partial", core::param(partial_hedge_volatility)},
		                               {"full", core::param(full_hedge_volatility)}});
	}
}

void RiskOptions::validate() const {
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Confidence level must lie in (0, 1).",
		                              {{"confidence_level", core::param(confidence_level)}});
	}
	if (!(thresholds.low > 0.0) || !(thresholds.medium > thresholds.low)) {
		throw core::InvalidInputError(core::Stage::Risk, "Risk thresholds must be positive and increasing.",
		                              {{"low", core::param(thresholds.low)},
		                               {"medium", core::param(thresholds.medium)}});
	}
	if (!(risk_tolerance > 0.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Risk tolerance must be positive.",
		                              {{"risk_tolerance", core::param(risk_tolerance)}});
	}
	if (!(periods_per_year > 0.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Periods per year must be positive.",
		                              {{"periods_per_year", core::param(periods_per_year)}});
	}
	hedging.validate();
}

const HedgeScenario &HedgingAnalysis::scenario(HedgeStrategy strategy) const {
	const auto it = std::find_if(scenarios.begin(), scenarios.end(),
	                             [&](const HedgeScenario &entry) { return entry.strategy == strategy; });
	if (it == scenarios.end()) {
		throw core::InvalidInputError(core::Stage::Risk, "Hedge strategy was not evaluated.",
		                              {{"strategy", toString(strategy)}});
	}
	return *it;
}

const ScenarioImpact &StressTestResult::impact(const std::string &name) const {
	const auto it = std::find_if(impacts.begin(), impacts.end(),
	                             [&](const ScenarioImpact &entry) { return entry.name == name; });
	if (it == impacts.end()) {
		throw core::InvalidInputError(core::Stage::Risk, "Unknown stress scenario.", {{"scenario", name}});
	}
	return *it;
}

const ScenarioImpact *StressTestResult::worst() const {
	const ScenarioImpact *result = nullptr;
	for (const auto &entry : impacts) {
		if (!result || std::abs(entry.cost_delta) > std::abs(result->cost_delta)) {
			result = &entry;
		}
	}
	return result;
}

RiskEngine::RiskEngine(RiskOptions options) : options_(options) {
	options_.validate();
}

ValueAtRisk RiskEngine::computeVaR(const core::Forecast &forecast, const core::VolatilityPath &path,
                                   double confidence_level, double exposure) const {
	checkForecast(forecast);
	checkPath(path);
	checkExposure(exposure);
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw core::InvalidInputError(core::Stage::Risk, "Confidence level must lie in (0, 1).",
		                              {{"confidence_level", core::param(confidence_level)}});
	}

	ValueAtRisk result;
	result.confidence_level = confidence_level;
	result.horizon = path.horizon();
	result.exposure = exposure;
	result.distribution = path.distribution;

	const int price_step = std::min(path.horizon(), forecast.horizon());
	result.reference_price = forecast.series(forecast.targetIndex()).at(static_cast<std::size_t>(price_step));
	result.horizon_volatility = std::sqrt(path.cumulativeVariance(path.horizon()));

	double tail_mean = 0.0;
	if (path.distribution == core::ResidualDistribution::StudentT) {
		result.quantile = utils::distributions::standardizedStudentTQuantile(confidence_level, path.degrees_of_freedom);
		tail_mean = utils::distributions::standardizedStudentTExpectedShortfall(confidence_level,
		                                                                        path.degrees_of_freedom);
	} else {
		result.quantile = utils::distributions::normalQuantile(confidence_level);
		tail_mean = utils::distributions::normalExpectedShortfall(confidence_level);
	}

	const double notional = exposure * std::abs(result.reference_price);
	result.value_at_risk = notional * result.quantile * result.horizon_volatility;
	result.expected_shortfall = notional * tail_mean * result.horizon_volatility;

	COMMODEX_INFO("VaR({:.0f}%, {} steps, {}) = {:.2f}, ES = {:.2f}", 100.0 * confidence_level, result.horizon,
	              core::toString(result.distribution), result.value_at_risk, result.expected_shortfall);
	return result;
}

StressTestResult RiskEngine::stressTest(const core::Forecast &forecast, const std::vector<StressScenario> &scenarios,
                                        double exposure) const {
	checkForecast(forecast);
	checkExposure(exposure);

	std::set<std::string> seen;
	for (const auto &scenario : scenarios) {
		if (scenario.name.empty()) {
			throw core::InvalidInputError(core::Stage::Risk, "Stress scenarios need a name.");
		}
		if (!seen.insert(scenario.name).second) {
			throw core::InvalidInputError(core::Stage::Risk, "Duplicate stress scenario name.",
			                              {{"scenario", scenario.name}});
		}
		if (!std::isfinite(scenario.shock)) {
			throw core::InvalidInputError(core::Stage::Risk, "Scenario shock must be finite.",
			                              {{"scenario", scenario.name}, {"shock", core::param(scenario.shock)}});
		}
		if (scenario.step && (*scenario.step < 0 || *scenario.step > forecast.horizon())) {
			throw core::InvalidInputError(core::Stage::Risk, "Scenario step lies outside the forecast horizon.",
			                              {{"scenario", scenario.name},
			                               {"step", core::param(*scenario.step)},
			                               {"horizon", core::param(forecast.horizon())}});
		}
	}

	const auto &prices = forecast.series(forecast.targetIndex());
	StressTestResult result;
	result.exposure = exposure;
	result.impacts.reserve(scenarios.size());
	for (const auto &scenario : scenarios) {
		ScenarioImpact impact;
		impact.name = scenario.name;
		impact.shock = scenario.shock;
		impact.step = scenario.step.value_or(forecast.horizon());
		impact.price = prices[static_cast<std::size_t>(impact.step)];
		impact.cost_delta = exposure * scenario.shock * impact.price;
		COMMODEX_DEBUG("Stress '{}' ({:+.1f}% at step {}): cost delta {:.2f}", impact.name, 100.0 * impact.shock,
		               impact.step, impact.cost_delta);
		result.impacts.push_back(impact);
	}
	return result;
}

HedgeRecommendation RiskEngine::recommendHedge(const core::VolatilityPath &path, double exposure) const {
	checkPath(path);
	checkExposure(exposure);

	HedgeRecommendation result;
	result.annualized_volatility = path.annualizedVolatility(options_.periods_per_year);
	result.ratio = std::clamp(result.annualized_volatility / options_.risk_tolerance, 0.0, 1.0);
	result.quantity = result.ratio * exposure;
	if (result.ratio <= 0.0) {
		result.strategy = HedgeStrategy::NoHedge;
	} else if (result.ratio >= 1.0) {
		result.strategy = HedgeStrategy::FullHedge;
	} else {
		result.strategy = HedgeStrategy::PartialHedge;
	}
	return result;
}

HedgingAnalysis RiskEngine::compareHedges(const core::Forecast &forecast, const core::VolatilityPath &path,
                                          double quantity) const {
	const ValueAtRisk var = computeVaR(forecast, path, options_.confidence_level, quantity);
	const HedgingOptions &hedging = options_.hedging;

	HedgingAnalysis result;
	result.quantity = quantity;
	result.current_price = std::abs(forecast.series(forecast.targetIndex()).front());
	result.horizon_volatility = var.horizon_volatility;
	result.unhedged_var = var.value_at_risk;
	result.expected_shortfall = var.expected_shortfall;

	const auto addScenario = [&](HedgeStrategy strategy, double ratio, double cost_rate, double reduction) {
		HedgeScenario scenario;
		scenario.strategy = strategy;
		scenario.hedge_ratio = ratio;
		scenario.hedge_quantity = ratio * quantity;
		scenario.hedging_cost = scenario.hedge_quantity * result.current_price * cost_rate;
		scenario.risk_reduction = reduction;
		scenario.max_loss = result.unhedged_var * (1.0 - reduction);
		const double removed = result.unhedged_var - scenario.max_loss;
		if (removed > 0.0) {
			scenario.cost_benefit_ratio = scenario.hedging_cost / removed;
		}
		result.scenarios.push_back(scenario);
	};

	const double dynamic_ratio =
	    std::min(hedging.dynamic_max_ratio, result.horizon_volatility / hedging.dynamic_volatility_scale);
	addScenario(HedgeStrategy::NoHedge, 0.0, 0.0, 0.0);
	addScenario(HedgeStrategy::PartialHedge, hedging.partial_ratio, hedging.partial_cost_rate, hedging.partial_ratio);
	addScenario(HedgeStrategy::FullHedge, 1.0, hedging.full_cost_rate, hedging.full_risk_reduction);
	addScenario(HedgeStrategy::DynamicHedge, dynamic_ratio, hedging.dynamic_cost_rate, dynamic_ratio);

	if (result.horizon_volatility > hedging.full_hedge_volatility) {
		result.recommended = HedgeStrategy::FullHedge;
	} else if (result.horizon_volatility > hedging.partial_hedge_volatility) {
		result.recommended = HedgeStrategy::PartialHedge;
	} else if (result.horizon_volatility > hedging.dynamic_hedge_volatility) {
		result.recommended = HedgeStrategy::DynamicHedge;
	} else {
		result.recommended = HedgeStrategy::NoHedge;
	}

	COMMODEX_INFO("Hedge comparison at {:.1f}% horizon volatility: {} leaves {:.2f} of {:.2f} VaR for {:.2f}",
	              100.0 * result.horizon_volatility, toString(result.recommended),
	              result.recommendedScenario().max_loss, result.unhedged_var, result.recommendedScenario().hedging_cost);
	return result;
}

RiskLevel RiskEngine::classify(double annualized_volatility) const {
	if (!std::isfinite(annualized_volatility) || annualized_volatility < 0.0) {
		throw core::InvalidInputError(core::Stage::Risk, "Volatility must be finite and non-negative.",
		                              {{"volatility", core::param(annualized_volatility)}});
	}
	if (annualized_volatility < options_.thresholds.low) {
		return RiskLevel::Low;
	}
	if (annualized_volatility < options_.thresholds.medium) {
		return RiskLevel::Medium;
	}
	return RiskLevel::High;
}

RiskAssessment RiskEngine::assess(std::shared_ptr<const core::Forecast> forecast,
                                  std::shared_ptr<const core::VolatilityPath> volatility, double exposure,
                                  const std::vector<StressScenario> &scenarios) const {
	if (!forecast || !volatility) {
		throw core::InvalidInputError(core::Stage::Risk, "Risk assessment needs a forecast and a volatility path.");
	}

	RiskAssessment assessment;
	assessment.value_at_risk = computeVaR(*forecast, *volatility, options_.confidence_level, exposure);
	assessment.stress = stressTest(*forecast, scenarios, exposure);
	assessment.hedge = recommendHedge(*volatility, exposure);
	assessment.hedging = compareHedges(*forecast, *volatility, exposure);
	assessment.annualized_volatility = assessment.hedge.annualized_volatility;
	assessment.level = classify(assessment.annualized_volatility);
	assessment.forecast = std::move(forecast);
	assessment.volatility = std::move(volatility);

	COMMODEX_INFO("Risk level {} (annualized volatility {:.1f}%), hedge ratio {:.2f} ({})",
	              toString(assessment.level), 100.0 * assessment.annualized_volatility, assessment.hedge.ratio,
	              toString(assessment.hedge.strategy));
	return assessment;
}

} // namespace commodex::risk
