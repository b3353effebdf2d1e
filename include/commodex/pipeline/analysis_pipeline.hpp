#pragma once

#include "commodex/analysis/causality.hpp"
#include "commodex/analysis/cointegration.hpp"
#include "commodex/analysis/stationarity.hpp"
#include "commodex/core/config.hpp"
#include "commodex/core/forecast.hpp"
#include "commodex/core/multivariate_series.hpp"
#include "commodex/core/volatility_path.hpp"
#include "commodex/models/ensemble.hpp"
#include "commodex/models/fitted_model.hpp"
#include "commodex/procurement/procurement_optimizer.hpp"
#include "commodex/risk/risk_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace commodex::pipeline {

/**
 * @struct EngineConfig
 * @brief Configuration threaded through every stage of one analysis.
 *
 * The top-level knobs override the matching fields of the per-stage option
 * structs; the for*() accessors return the merged stage options.
 */
struct EngineConfig {
	int max_lag_order = 5;
	core::InformationCriterion information_criterion = core::InformationCriterion::AIC;
	double confidence_level = 0.95;
	core::GarchOrder garch_order;
	int min_observations = 30;
	core::RiskThresholds risk_thresholds;
	double holding_cost_rate = 0.02;
	double ordering_cost = 25000.0;

	bool drop_non_causal = true; // keep only the target's significant Granger causes
	bool parallel = true;        // run independent stages on worker threads
	bool ensemble_univariate = true; // blend a multivariate price path with a univariate fit of the target

	analysis::StationarityAnalyzer::Options stationarity;
	analysis::CausalityTester::Options causality;
	models::VarOptions var;
	models::VecmOptions vecm;
	models::GarchOptions garch;
	models::EnsembleConfig ensemble;
	risk::RiskOptions risk;
	procurement::ProcurementOptions procurement;

	analysis::StationarityAnalyzer::Options forStationarity() const;
	analysis::CausalityTester::Options forCausality() const;
	models::VarOptions forVar(int differencing_order) const;
	models::VecmOptions forVecm() const;
	models::GarchOptions forGarch() const;
	risk::RiskOptions forRisk() const;
	procurement::ProcurementOptions forProcurement() const;

	void validate() const;
};

struct AnalysisRequest {
	std::string target;
	int horizon = 30;
	double exposure = 0.0;    // quantity exposed to the target price
	double demand_rate = 0.0; // units consumed per forecast step
	std::vector<procurement::SupplierQuote> quotes;
	std::vector<risk::StressScenario> scenarios;
	std::optional<procurement::InventoryPosition> inventory;
};

enum class ModelChoice {
	UnivariateAR,
	LevelsVAR,
	DifferencedVAR,
	VECM
};

std::string toString(ModelChoice choice);

/**
 * @struct AnalysisReport
 * @brief Every intermediate record of one analysis run.
 */
struct AnalysisReport {
	std::string target;
	analysis::StationarityReport stationarity;
	analysis::CausalityReport causality;
	std::vector<std::string> selected_variables;
	std::optional<analysis::CointegrationResult> cointegration;
	ModelChoice model_choice = ModelChoice::LevelsVAR;
	std::string model_rationale;
	models::FittedModelPtr mean_model;
	models::FittedModelPtr volatility_model;
	models::FittedModelPtr univariate_model;            // set when the ensemble ran
	std::shared_ptr<const core::Forecast> forecast;     // mean model forecast
	std::shared_ptr<const core::Forecast> ensemble_forecast;
	std::vector<double> ensemble_weights;
	std::shared_ptr<const core::VolatilityPath> volatility;
	std::shared_ptr<const risk::RiskAssessment> risk;
	procurement::ProcurementPlan plan;

	/// Price path used for procurement: the ensemble when it ran, else the mean model forecast.
	const std::shared_ptr<const core::Forecast> &priceForecast() const {
		return ensemble_forecast ? ensemble_forecast : forecast;
	}
};

/**
 * @class AnalysisPipeline
 * @brief Runs stationarity, causality, model fitting, risk and procurement
 * for one target variable.
 *
 * Independent stages run concurrently and are joined before their dependants.
 * Errors from any stage propagate unchanged.
 */
class AnalysisPipeline {
public:
	AnalysisPipeline() = default;
	explicit AnalysisPipeline(EngineConfig config);

	AnalysisReport run(const core::MultivariateSeries &series, const AnalysisRequest &request) const;

	const EngineConfig &config() const {
		return config_;
	}

private:
	/// Picks and fits the mean model; records the choice on @p report.
	models::FittedModelPtr fitMeanModel(const core::MultivariateSeries &selected, AnalysisReport &report) const;

	models::FittedModelPtr fitUnivariate(const core::MultivariateSeries &selected, AnalysisReport &report,
	                                     const std::string &reason) const;

	EngineConfig config_;
};

} // namespace commodex::pipeline
