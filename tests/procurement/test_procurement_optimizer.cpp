#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/procurement/procurement_optimizer.hpp"
#include "common/forecast_helpers.hpp"

#include <cmath>
#include <memory>
#include <vector>

using namespace commodex;
using procurement::InventoryPosition;
using procurement::ProcurementOptimizer;
using procurement::ProcurementOptions;
using procurement::SupplierQuote;
using procurement::TimingAction;

namespace {

core::Forecast flatForecast(int horizon, double price) {
	return tests::helpers::makePriceForecast(std::vector<double>(static_cast<std::size_t>(horizon) + 1, price));
}

SupplierQuote quote(const std::string &name) {
	SupplierQuote q;
	q.name = name;
	return q;
}

} // namespace

TEST_CASE("Flat prices order the full demand now", "[procurement][eoq]") {
	const ProcurementOptimizer optimizer;
	const auto decision = optimizer.optimizeOrderQuantity(flatForecast(10, 100.0), 100.0);

	// EOQ sqrt(2 * 25000 * 1000 / 20) exceeds the demand, so the whole demand is ordered.
	REQUIRE(decision.demand == Catch::Approx(1000.0));
	REQUIRE(decision.economic_order_quantity == Catch::Approx(std::sqrt(2.5e6)));
	REQUIRE(decision.quantity == Catch::Approx(1000.0));
	REQUIRE(decision.timing == 0);
	REQUIRE(decision.ordering_cost == Catch::Approx(25000.0));
	REQUIRE(decision.purchase_cost == Catch::Approx(100000.0));
	REQUIRE(decision.holding_cost == Catch::Approx(10000.0));
	REQUIRE(decision.total_cost == Catch::Approx(135000.0));
	REQUIRE(decision.baseline_feasible);
	REQUIRE(decision.projected_savings == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(decision.candidates_evaluated == 11 * 22);
}

TEST_CASE("Falling prices defer the order", "[procurement][eoq]") {
	ProcurementOptions options;
	options.ordering_cost = 100.0;
	options.holding_cost_rate = 0.01;
	const auto forecast = tests::helpers::makePriceForecast({100.0, 98.0, 96.0, 94.0, 92.0, 90.0});

	const auto decision = ProcurementOptimizer(options).optimizeOrderQuantity(forecast, 10.0);
	REQUIRE(decision.timing == 5);
	REQUIRE(decision.unit_price == 90.0);
	REQUIRE(decision.economic_order_quantity == Catch::Approx(std::sqrt(2.0 * 100.0 * 50.0 / (0.01 * 90.0 * 5.0))));
	REQUIRE(decision.quantity == Catch::Approx(decision.economic_order_quantity));
	REQUIRE(decision.total_cost <= decision.baseline_cost);
	REQUIRE(decision.projected_savings == Catch::Approx(decision.baseline_cost - decision.total_cost));
	REQUIRE(decision.projected_savings > 0.0);

	options.max_wait_steps = 2;
	const auto capped = ProcurementOptimizer(options).optimizeOrderQuantity(forecast, 10.0);
	REQUIRE(capped.timing == 2);
	REQUIRE(capped.total_cost >= decision.total_cost);
}

TEST_CASE("Quantity bounds", "[procurement][eoq][bounds]") {
	ProcurementOptions options;
	options.capacity = 400.0;
	const auto limited = ProcurementOptimizer(options).optimizeOrderQuantity(flatForecast(10, 100.0), 100.0);
	REQUIRE(limited.quantity == Catch::Approx(400.0));
	REQUIRE_FALSE(limited.baseline_feasible);

	options = ProcurementOptions{};
	options.min_order_quantity = 2000.0;
	REQUIRE_THROWS_AS(ProcurementOptimizer(options).optimizeOrderQuantity(flatForecast(10, 100.0), 100.0),
	                  core::NoFeasibleSolutionError);

	options = ProcurementOptions{};
	options.max_order_quantity = 500.0;
	options.min_order_quantity = 600.0;
	REQUIRE_THROWS_AS(ProcurementOptimizer(options).optimizeOrderQuantity(flatForecast(10, 100.0), 100.0),
	                  core::NoFeasibleSolutionError);
}

TEST_CASE("Order optimization input checks", "[procurement][eoq][validation]") {
	const ProcurementOptimizer optimizer;
	REQUIRE_THROWS_AS(optimizer.optimizeOrderQuantity(flatForecast(0, 100.0), 10.0), core::InvalidInputError);
	REQUIRE_THROWS_AS(optimizer.optimizeOrderQuantity(tests::helpers::makePriceForecast({100.0, -1.0}), 10.0),
	                  core::InvalidInputError);
	REQUIRE_THROWS_AS(optimizer.optimizeOrderQuantity(flatForecast(5, 100.0), 0.0), core::InvalidInputError);

	ProcurementOptions options;
	options.quantity_grid_points = 1;
	REQUIRE_THROWS_AS(ProcurementOptimizer(options), core::InvalidInputError);
	options = ProcurementOptions{};
	options.extended_wait_steps = 10;
	REQUIRE_THROWS_AS(ProcurementOptimizer(options), core::InvalidInputError);
}

TEST_CASE("Suppliers are ranked by landed cost", "[procurement][suppliers]") {
	const ProcurementOptimizer optimizer;
	const auto forecast = flatForecast(10, 100.0);

	auto listed = quote("listed");
	listed.unit_price = 100.0;
	listed.logistics_cost_per_unit = 1.0;

	auto deferred = quote("deferred");
	deferred.payment_terms_days = 30;
	deferred.reliability = 0.9;

	auto bulk = quote("bulk");
	bulk.minimum_order = 10000.0;

	auto cheap = quote("cheap");
	cheap.unit_price = 99.0;
	cheap.quality_score = 0.5;

	const auto ranking = optimizer.rankSuppliers({listed, deferred, bulk, cheap}, forecast, 100.0);
	REQUIRE(ranking.opportunity_rate == Catch::Approx(0.12));
	REQUIRE(ranking.excluded == std::vector<std::string>{"bulk"});
	REQUIRE(ranking.ranked.size() == 3);
	for (std::size_t i = 1; i < ranking.ranked.size(); ++i) {
		REQUIRE(ranking.ranked[i - 1].total_cost <= ranking.ranked[i].total_cost);
	}

	const auto &best = ranking.best();
	REQUIRE(best.name == "deferred");
	REQUIRE(best.unit_price == Catch::Approx(100.0));
	REQUIRE(best.financing_adjustment == Catch::Approx(-10000.0 * (1.0 - std::pow(1.12, -30.0 / 365.0))));
	REQUIRE(best.risk_premium == Catch::Approx(10000.0 * 0.1 * 0.1));
	REQUIRE(ranking.ranked[1].name == "listed");
	REQUIRE(ranking.ranked[1].total_cost == Catch::Approx(10100.0));
	REQUIRE(ranking.ranked[2].name == "cheap");
	REQUIRE(ranking.ranked[2].quality_adjustment == Catch::Approx(9900.0 * 0.5 * 0.05));
	REQUIRE(ranking.ranked[2].cost_per_unit == Catch::Approx(ranking.ranked[2].total_cost / 100.0));
}

TEST_CASE("Supplier ranking edge cases", "[procurement][suppliers][edge]") {
	const ProcurementOptimizer optimizer;
	const auto forecast = flatForecast(10, 100.0);

	const auto tied = optimizer.rankSuppliers({quote("zeta"), quote("alpha")}, forecast, 10.0);
	REQUIRE(tied.ranked[0].name == "alpha");
	REQUIRE(tied.ranked[1].name == "zeta");

	auto big = quote("big");
	big.minimum_order = 500.0;
	REQUIRE_THROWS_AS(optimizer.rankSuppliers({big}, forecast, 10.0), core::NoFeasibleSolutionError);
	REQUIRE_THROWS_AS(optimizer.rankSuppliers({quote("a"), quote("a")}, forecast, 10.0), core::InvalidInputError);

	auto unreliable = quote("odd");
	unreliable.reliability = 1.5;
	REQUIRE_THROWS_AS(optimizer.rankSuppliers({unreliable}, forecast, 10.0), core::InvalidInputError);
	REQUIRE_THROWS_AS(optimizer.rankSuppliers({quote("a")}, forecast, 0.0), core::InvalidInputError);

	std::vector<double> rising(11);
	for (std::size_t t = 0; t < rising.size(); ++t) {
		rising[t] = 100.0 + static_cast<double>(t);
	}
	const auto inflating = optimizer.rankSuppliers({quote("a")}, tests::helpers::makePriceForecast(rising), 10.0);
	REQUIRE(inflating.opportunity_rate == Catch::Approx(0.12 + std::log(110.0 / 100.0) / 10.0 * 365.0));
	REQUIRE(inflating.ranked[0].unit_price == Catch::Approx(105.5));

	const procurement::SupplierRanking empty{};
	REQUIRE_THROWS_AS(empty.best(), core::NoFeasibleSolutionError);
}

TEST_CASE("Timing recommendations", "[procurement][timing]") {
	const ProcurementOptimizer optimizer;

	SECTION("Flat prices buy now") {
		const auto timing = optimizer.recommendTiming(flatForecast(20, 100.0), 10.0);
		REQUIRE(timing.action == TimingAction::BuyNow);
		REQUIRE(timing.step == 0);
		REQUIRE(timing.savings == 0.0);
		REQUIRE(procurement::toString(timing.action) == "buy now");
	}

	SECTION("A near dip is worth waiting for") {
		std::vector<double> prices(21, 90.0);
		prices[0] = 100.0;
		const auto timing = optimizer.recommendTiming(tests::helpers::makePriceForecast(prices), 10.0);
		REQUIRE(timing.action == TimingAction::WaitForOptimal);
		REQUIRE(timing.step == 1);
		REQUIRE(timing.price == 90.0);
		REQUIRE(timing.savings == Catch::Approx(8.0 * 200.0));
		REQUIRE(timing.savings_fraction == Catch::Approx(0.08));
	}

	SECTION("A late trough is reported as the lowest price") {
		std::vector<double> prices(31, 100.0);
		for (std::size_t t = 16; t < prices.size(); ++t) {
			prices[t] = 80.0;
		}
		const auto timing = optimizer.recommendTiming(tests::helpers::makePriceForecast(prices), 10.0);
		REQUIRE(timing.action == TimingAction::WaitForLowest);
		REQUIRE(timing.step == 16);
		REQUIRE(timing.savings_fraction == Catch::Approx(0.2));
	}
}

TEST_CASE("Inventory metrics value stock at today's price", "[procurement][inventory]") {
	const ProcurementOptimizer optimizer;
	const auto forecast = tests::helpers::makePriceForecast({100.0, 104.0, 97.0, 99.0, 110.0, 101.0});

	const auto metrics = optimizer.inventoryMetrics(forecast, InventoryPosition{900.0, 1000.0});
	REQUIRE(metrics.current_price == 100.0);
	REQUIRE(metrics.best_buy_step == 2);
	REQUIRE(metrics.best_buy_price == 97.0);
	REQUIRE(metrics.worst_buy_step == 4);
	REQUIRE(metrics.worst_buy_price == 110.0);
	REQUIRE(metrics.potential_savings_per_unit == Catch::Approx(13.0));

	REQUIRE(metrics.days_of_supply == Catch::Approx(27.0));
	REQUIRE(metrics.target_days_of_supply == 45.0);
	REQUIRE(metrics.safety_stock == Catch::Approx(1500.0));
	REQUIRE(metrics.excess_inventory == 0.0);
	REQUIRE(metrics.inventory_shortage == Catch::Approx(600.0));

	REQUIRE(metrics.monthly_procurement_value == Catch::Approx(100000.0));
	REQUIRE(metrics.monthly_holding_cost == Catch::Approx(1800.0));
	REQUIRE(metrics.total_monthly_cost == Catch::Approx(101800.0));
	REQUIRE(metrics.cost_per_unit == Catch::Approx(102.0));
}

TEST_CASE("Inventory metrics edge cases", "[procurement][inventory][edge]") {
	const ProcurementOptimizer optimizer;
	const auto forecast = flatForecast(5, 80.0);

	const auto empty = optimizer.inventoryMetrics(forecast, InventoryPosition{0.0, 100.0});
	REQUIRE(empty.days_of_supply == 0.0);
	REQUIRE(empty.monthly_holding_cost == 0.0);
	REQUIRE(empty.cost_per_unit == 80.0);
	REQUIRE(empty.inventory_shortage == Catch::Approx(150.0));
	REQUIRE(empty.best_buy_step == 1);
	REQUIRE(empty.potential_savings_per_unit == 0.0);

	const auto stocked = optimizer.inventoryMetrics(forecast, InventoryPosition{400.0, 100.0});
	REQUIRE(stocked.excess_inventory == Catch::Approx(250.0));
	REQUIRE(stocked.inventory_shortage == 0.0);
	REQUIRE(stocked.days_of_supply == Catch::Approx(120.0));

	REQUIRE_THROWS_AS(optimizer.inventoryMetrics(forecast, InventoryPosition{-1.0, 100.0}), core::InvalidInputError);
	REQUIRE_THROWS_AS(optimizer.inventoryMetrics(forecast, InventoryPosition{10.0, 0.0}), core::InvalidInputError);
	REQUIRE_THROWS_AS(optimizer.inventoryMetrics(flatForecast(0, 80.0), InventoryPosition{10.0, 10.0}),
	                  core::InvalidInputError);

	ProcurementOptions options;
	options.days_per_month = 0.0;
	REQUIRE_THROWS_AS(ProcurementOptimizer(options), core::InvalidInputError);
}

TEST_CASE("Procurement plan bundles the decisions", "[procurement][plan]") {
	const ProcurementOptimizer optimizer;
	auto forecast = std::make_shared<const core::Forecast>(flatForecast(10, 100.0));

	const auto bare = optimizer.plan(forecast, 100.0);
	REQUIRE(bare.forecast == forecast);
	REQUIRE(bare.risk == nullptr);
	REQUIRE(bare.suppliers.ranked.empty());
	REQUIRE(bare.suppliers.quantity == bare.recommendedQuantity());
	REQUIRE(bare.recommendedTiming() == 0);
	REQUIRE(bare.projectedSavings() == Catch::Approx(0.0).margin(1e-9));
	REQUIRE_FALSE(bare.inventory.has_value());

	const auto full = optimizer.plan(forecast, 100.0, {quote("a"), quote("b")});
	REQUIRE(full.suppliers.best().name == "a");
	REQUIRE(full.suppliers.quantity == full.recommendedQuantity());

	const auto stocked = optimizer.plan(forecast, 100.0, {}, nullptr, InventoryPosition{500.0, 3000.0});
	REQUIRE(stocked.inventory.has_value());
	REQUIRE(stocked.inventory->days_of_supply == Catch::Approx(5.0));

	REQUIRE_THROWS_AS(optimizer.plan(nullptr, 100.0), core::InvalidInputError);
}
