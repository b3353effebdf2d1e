#include "commodex/pipeline/analysis_pipeline.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/transform/returns.hpp"
#include "commodex/utils/logging.hpp"

#include <future>
#include <utility>

namespace commodex::pipeline {

namespace {

template <typename Function>
auto launch(bool parallel, Function &&function) {
	return std::async(parallel ? std::launch::async : std::launch::deferred, std::forward<Function>(function));
}

} // namespace

std::string toString(ModelChoice choice) {
	switch (choice) {
	case ModelChoice::UnivariateAR:
		return "univariate AR";
	case ModelChoice::LevelsVAR:
		return "VAR on levels";
	case ModelChoice::DifferencedVAR:
		return "VAR on differences";
	case ModelChoice::VECM:
		return "VECM";
	default:
		return "?";
	}
}

analysis::StationarityAnalyzer::Options EngineConfig::forStationarity() const {
	auto options = stationarity;
	options.min_observations = min_observations;
	options.max_lag_order = max_lag_order;
	return options;
}

analysis::CausalityTester::Options EngineConfig::forCausality() const {
	auto options = causality;
	options.max_lag = max_lag_order;
	return options;
}

models::VarOptions EngineConfig::forVar(int differencing_order) const {
	auto options = var;
	options.max_lag = max_lag_order;
	options.criterion = information_criterion;
	options.differencing_order = differencing_order;
	return options;
}

models::VecmOptions EngineConfig::forVecm() const {
	return vecm;
}

models::GarchOptions EngineConfig::forGarch() const {
	auto options = garch;
	options.order = garch_order;
	return options;
}

risk::RiskOptions EngineConfig::forRisk() const {
	auto options = risk;
	options.confidence_level = confidence_level;
	options.thresholds = risk_thresholds;
	return options;
}

procurement::ProcurementOptions EngineConfig::forProcurement() const {
	auto options = procurement;
	options.holding_cost_rate = holding_cost_rate;
	options.ordering_cost = ordering_cost;
	return options;
}

void EngineConfig::validate() const {
	if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
		throw core::InvalidInputError(core::Stage::Pipeline, "Confidence level must lie in (0, 1).",
		                              {{"confidence_level", core::param(confidence_level)}});
	}
	forStationarity().validate();
	forCausality().validate();
	forVar(0).validate();
	forVecm().validate();
	forGarch().validate();
	if (!(ensemble.min_rmse > 0.0)) {
		throw core::InvalidInputError(core::Stage::Pipeline, "Ensemble RMSE floor must be positive.",
		                              {{"min_rmse", core::param(ensemble.min_rmse)}});
	}
	forRisk().validate();
	forProcurement().validate();
}

AnalysisPipeline::AnalysisPipeline(EngineConfig config) : config_(std::move(config)) {
	config_.validate();
}

models::FittedModelPtr AnalysisPipeline::fitUnivariate(const core::MultivariateSeries &selected,
                                                       AnalysisReport &report, const std::string &reason) const {
	const int d = report.stationarity.entry(report.target).differencing_order;
	report.model_choice = ModelChoice::UnivariateAR;
	report.model_rationale = reason;
	return models::fitVar(selected.select({report.target}), config_.forVar(d));
}

models::FittedModelPtr AnalysisPipeline::fitMeanModel(const core::MultivariateSeries &selected,
                                                      AnalysisReport &report) const {
	if (selected.dimensions() == 1) {
		return fitUnivariate(selected, report, "single variable selected");
	}

	bool all_stationary = true;
	bool all_non_stationary = true;
	for (const auto &name : selected.variables()) {
		const bool stationary = report.stationarity.entry(name).stationary;
		all_stationary = all_stationary && stationary;
		all_non_stationary = all_non_stationary && !stationary;
	}

	if (all_stationary) {
		report.model_choice = ModelChoice::LevelsVAR;
		report.model_rationale = "every variable is stationary";
		return models::fitVar(selected, config_.forVar(0));
	}
	if (!all_non_stationary) {
		report.model_choice = ModelChoice::DifferencedVAR;
		report.model_rationale = "mixed integration orders";
		return models::fitVar(selected, config_.forVar(1));
	}

	const analysis::StationarityAnalyzer analyzer(config_.forStationarity());
	try {
		report.cointegration = analyzer.cointegration(selected, report.stationarity);
	} catch (const core::ModelNotApplicableError &e) {
		COMMODEX_WARN("Cointegration test not applicable, falling back to univariate treatment: {}", e.what());
		return fitUnivariate(selected, report, std::string("cointegration not applicable: ") + e.detail());
	}

	const int rank = report.cointegration->rank;
	const auto k = static_cast<int>(selected.dimensions());
	if (rank == 0) {
		report.model_choice = ModelChoice::DifferencedVAR;
		report.model_rationale = "non-stationary without cointegration";
		return models::fitVar(selected, config_.forVar(1));
	}
	if (rank >= k) {
		report.model_choice = ModelChoice::LevelsVAR;
		report.model_rationale = "full cointegration rank";
		return models::fitVar(selected, config_.forVar(0));
	}
	report.model_choice = ModelChoice::VECM;
	report.model_rationale = "cointegration rank " + std::to_string(rank);
	return models::fitVecm(selected, *report.cointegration, config_.forVecm());
}

AnalysisReport AnalysisPipeline::run(const core::MultivariateSeries &series, const AnalysisRequest &request) const {
	if (!series.contains(request.target)) {
		throw core::InvalidInputError(core::Stage::Pipeline, "Target variable not present in the series.",
		                              {{"target", request.target}});
	}
	if (request.horizon < 1) {
		throw core::InvalidInputError(core::Stage::Pipeline, "Forecast horizon must be positive.",
		                              {{"horizon", core::param(request.horizon)}});
	}

	// Workers log through the shared logger; create it before any thread starts.
	utils::Logging::getLogger();
	COMMODEX_INFO("Analysing '{}' over {} observations of {} variables", request.target, series.size(),
	              series.dimensions());

	const utils::StageTimer run_timer("analysis of '" + request.target + "'");
	AnalysisReport report;
	report.target = request.target;

	const analysis::StationarityAnalyzer analyzer(config_.forStationarity());
	const analysis::CausalityTester tester(config_.forCausality());
	auto stationarity = launch(config_.parallel, [&] { return analyzer.analyze(series); });
	auto causality = launch(config_.parallel, [&] { return tester.testAll(series); });
	report.stationarity = stationarity.get();
	report.causality = causality.get();

	report.selected_variables =
	    config_.drop_non_causal ? report.causality.selectVariables(request.target) : series.variables();
	const core::MultivariateSeries selected = series.select(report.selected_variables);
	COMMODEX_INFO("Selected {} variable(s) for the mean model", report.selected_variables.size());

	const auto returns = transform::logReturns(series.series(request.target));
	const auto garch_options = config_.forGarch();
	auto volatility_fit = launch(config_.parallel, [&] { return models::fitGarch(returns, garch_options); });
	const bool ensemble = config_.ensemble_univariate && selected.dimensions() > 1;
	const auto univariate_options = config_.forVar(report.stationarity.entry(request.target).differencing_order);
	auto univariate_fit = launch(config_.parallel && ensemble, [&]() -> models::FittedModelPtr {
		return ensemble ? models::fitVar(series.select({request.target}), univariate_options) : nullptr;
	});
	report.mean_model = fitMeanModel(selected, report);
	report.volatility_model = volatility_fit.get();
	report.univariate_model = univariate_fit.get();
	COMMODEX_INFO("Mean model: {} ({})", toString(report.model_choice), report.model_rationale);

	report.forecast = std::make_shared<const core::Forecast>(
	    models::forecast(report.mean_model, request.horizon, config_.confidence_level, request.target));
	if (report.univariate_model && report.mean_model->variables().size() > 1) {
		const models::ForecastEnsemble combined({report.mean_model, report.univariate_model}, config_.ensemble);
		report.ensemble_weights = combined.weights(request.target);
		report.ensemble_forecast = std::make_shared<const core::Forecast>(
		    combined.predict(request.horizon, config_.confidence_level, request.target));
		COMMODEX_INFO("{} weights: {:.2f} multivariate, {:.2f} univariate", combined.name(),
		              report.ensemble_weights[0], report.ensemble_weights[1]);
	} else {
		report.univariate_model = nullptr;
	}
	report.volatility = std::make_shared<const core::VolatilityPath>(
	    models::forecastVolatility(report.volatility_model, request.horizon));

	const utils::StageTimer decision_timer("risk and procurement");
	const risk::RiskEngine engine(config_.forRisk());
	report.risk = std::make_shared<const risk::RiskAssessment>(
	    engine.assess(report.forecast, report.volatility, request.exposure, request.scenarios));

	const procurement::ProcurementOptimizer optimizer(config_.forProcurement());
	report.plan =
	    optimizer.plan(report.priceForecast(), request.demand_rate, request.quotes, report.risk, request.inventory);
	return report;
}

} // namespace commodex::pipeline
