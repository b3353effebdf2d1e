#include "commodex/core/errors.hpp"
#include "commodex/core/multivariate_series.hpp"
#include "commodex/pipeline/analysis_pipeline.hpp"
#include "commodex/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace commodex;

namespace {

using TimePoint = core::TimeSeries::TimePoint;

struct Market {
	core::TimeSeries copper;
	core::TimeSeries futures;
	core::TimeSeries freight;
};

std::vector<TimePoint> tradingDays(std::size_t count) {
	std::vector<TimePoint> days;
	days.reserve(count);
	const auto start = TimePoint{} + std::chrono::hours(24 * 365 * 50);
	for (std::size_t i = 0; i < count; ++i) {
		days.push_back(start + std::chrono::hours(24 * static_cast<long long>(i)));
	}
	return days;
}

Market synthesizeMarket(std::size_t length) {
	std::mt19937 rng(11);
	std::normal_distribution<double> shock(0.0, 1.0);

	std::vector<double> copper;
	std::vector<double> futures;
	std::vector<double> freight;
	copper.reserve(length);
	futures.reserve(length);
	freight.reserve(length);

	double variance = 1.5e-4;
	double previous_return = 0.0;
	double price = 8500.0;
	double basis = 0.0;
	double freight_level = 0.0;
	for (std::size_t i = 0; i < length; ++i) {
		variance = 5e-6 + 0.08 * previous_return * previous_return + 0.88 * variance;
		previous_return = std::sqrt(variance) * shock(rng);
		price *= std::exp(previous_return);
		basis = 0.6 * basis + 15.0 * shock(rng);
		freight_level = 0.3 * freight_level + shock(rng);

		copper.push_back(price);
		futures.push_back(1.01 * price + basis);
		freight.push_back(40.0 + freight_level);
	}

	const auto days = tradingDays(length);
	return Market{core::TimeSeries(days, copper, "copper"), core::TimeSeries(days, futures, "copper_3m"),
	              core::TimeSeries(days, freight, "freight_index")};
}

void printPath(const core::Forecast &forecast, int every) {
	const auto rows = forecast.path(forecast.target);
	std::cout << "  step      point      lower      upper\n";
	for (const auto &row : rows) {
		if (row.step % every != 0 && row.step != forecast.horizon()) {
			continue;
		}
		std::cout << "  " << std::setw(4) << row.step << std::setw(11) << row.point << std::setw(11) << row.lower
		          << std::setw(11) << row.upper << '\n';
	}
}

void printReport(const pipeline::AnalysisReport &report) {
	std::cout << std::fixed << std::setprecision(2);

	std::cout << "\nStationarity\n";
	for (const auto &entry : report.stationarity.entries) {
		std::cout << "  " << std::setw(14) << std::left << entry.variable << std::right
		          << (entry.stationary ? " stationary" : " unit root ") << " (ADF p=" << entry.p_value
		          << ", d=" << entry.differencing_order << ")\n";
	}

	std::cout << "\nGranger causes of " << report.target << '\n';
	for (const auto &result : report.causality.results) {
		if (result.effect != report.target) {
			continue;
		}
		std::cout << "  " << result.cause << ": corrected p=" << std::setprecision(4) << result.corrected_p_value
		          << std::setprecision(2) << (result.significant ? " (kept)" : "") << '\n';
	}

	std::cout << "\nMean model: " << pipeline::toString(report.model_choice) << " - " << report.model_rationale
	          << "\n  " << report.mean_model->describe() << '\n';
	std::cout << "Volatility model: " << report.volatility_model->describe() << '\n';

	std::cout << "\nForecast for " << report.target << '\n';
	printPath(*report.forecast, 5);
	if (report.ensemble_forecast) {
		std::cout << "Ensemble with a univariate fit (weights " << report.ensemble_weights[0] << " / "
		          << report.ensemble_weights[1] << ")\n";
		printPath(*report.ensemble_forecast, 5);
	}

	const auto &assessment = *report.risk;
	std::cout << "\nRisk\n";
	const auto &var = assessment.value_at_risk;
	std::cout << "  VaR " << 100.0 * var.confidence_level << "%: " << var.value_at_risk
	          << "  ES: " << var.expected_shortfall << '\n';
	std::cout << "  Level: " << risk::toString(assessment.level) << " (annualized volatility "
	          << 100.0 * assessment.annualized_volatility << "%)\n";
	std::cout << "  Hedge: " << risk::toString(assessment.hedge.strategy) << ", ratio " << assessment.hedge.ratio
	          << ", " << assessment.hedge.quantity << " units\n";
	for (const auto &impact : assessment.stress.impacts) {
		std::cout << "  Stress " << impact.name << ": " << impact.cost_delta << '\n';
	}
	std::cout << "  Hedge comparison (recommended: " << risk::toString(assessment.hedging.recommended) << ")\n";
	for (const auto &scenario : assessment.hedging.scenarios) {
		std::cout << "    " << std::setw(14) << std::left << risk::toString(scenario.strategy) << std::right
		          << " cost " << std::setw(10) << scenario.hedging_cost << "  max loss " << scenario.max_loss << '\n';
	}

	const auto &plan = report.plan;
	std::cout << "\nProcurement\n";
	std::cout << "  Order " << plan.recommendedQuantity() << " units at step " << plan.recommendedTiming()
	          << " (unit price " << plan.order.unit_price << ")\n";
	std::cout << "  Total cost " << plan.order.total_cost << " vs. baseline " << plan.order.baseline_cost
	          << ", savings " << plan.projectedSavings() << '\n';
	for (const auto &supplier : plan.suppliers.ranked) {
		std::cout << "  " << std::setw(10) << std::left << supplier.name << std::right << " "
		          << supplier.cost_per_unit << " per unit\n";
	}
	std::cout << "  Timing: " << procurement::toString(plan.timing.action) << " - " << plan.timing.rationale
	          << '\n';
	if (plan.inventory) {
		const auto &stock = *plan.inventory;
		std::cout << "  Inventory: " << stock.days_of_supply << " days of supply (target "
		          << stock.target_days_of_supply << "), shortage " << stock.inventory_shortage << ", excess "
		          << stock.excess_inventory << '\n';
		std::cout << "  Best buy at step " << stock.best_buy_step << " (" << stock.best_buy_price
		          << "), carrying cost " << stock.monthly_holding_cost << " per month\n";
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto market = synthesizeMarket(600);
	const core::MultivariateSeries series({market.copper, market.futures, market.freight});

	pipeline::EngineConfig config;
	config.information_criterion = core::InformationCriterion::BIC;
	config.ordering_cost = 1200.0;
	config.holding_cost_rate = 0.0005;

	pipeline::AnalysisRequest request;
	request.target = "copper";
	request.horizon = 30;
	request.exposure = 250.0;
	request.demand_rate = 12.0;
	request.scenarios = {{"smelter outage", 0.15, std::nullopt},
	                     {"demand slowdown", -0.10, std::nullopt},
	                     {"short squeeze", 0.25, 5}};

	procurement::SupplierQuote trader;
	trader.name = "trader";
	trader.logistics_cost_per_unit = 35.0;
	trader.payment_terms_days = 30;
	trader.reliability = 0.97;

	procurement::SupplierQuote mine;
	mine.name = "mine-direct";
	mine.price_premium = -0.015;
	mine.logistics_cost_per_unit = 110.0;
	mine.payment_terms_days = 0;
	mine.reliability = 0.9;
	mine.minimum_order = 200.0;

	procurement::SupplierQuote warehouse;
	warehouse.name = "warehouse";
	warehouse.price_premium = 0.01;
	warehouse.payment_terms_days = 60;
	warehouse.quality_score = 0.98;
	request.quotes = {trader, mine, warehouse};
	request.inventory = procurement::InventoryPosition{180.0, 360.0};

	try {
		const pipeline::AnalysisPipeline analysis(config);
		const auto report = analysis.run(series, request);
		printReport(report);
	} catch (const core::EngineError &e) {
		std::cerr << "Analysis failed: " << e.what() << '\n';
		return 1;
	}
	return 0;
}
