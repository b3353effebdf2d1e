#include "commodex/procurement/procurement_optimizer.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>
#include <utility>

namespace commodex::procurement {

namespace {

constexpr double kDaysPerYear = 365.0;

void checkDemand(double demand_rate) {
	if (!std::isfinite(demand_rate) || !(demand_rate > 0.0)) {
		throw core::InvalidInputError(core::Stage::Procurement, "Demand rate must be positive.",
		                              {{"demand_rate", core::param(demand_rate)}});
	}
}

struct CostBreakdown {
	double ordering = 0.0;
	double purchase = 0.0;
	double holding = 0.0;

	double total() const {
		return ordering + purchase + holding;
	}
};

CostBreakdown orderCost(double quantity, double demand, double price, double holding_rate, double ordering_cost,
                        int horizon) {
	CostBreakdown cost;
	cost.ordering = ordering_cost * demand / quantity;
	cost.purchase = demand * price;
	cost.holding = holding_rate * price * (quantity / 2.0) * static_cast<double>(horizon);
	return cost;
}

void validateQuotes(const std::vector<SupplierQuote> &quotes) {
	std::set<std::string> names;
	for (const auto &quote : quotes) {
		if (quote.name.empty()) {
			throw core::InvalidInputError(core::Stage::Procurement, "Supplier quotes need a name.");
		}
		if (!names.insert(quote.name).second) {
			throw core::InvalidInputError(core::Stage::Procurement, "Duplicate supplier name.",
			                              {{"supplier", quote.name}});
		}
		if (quote.unit_price && !(*quote.unit_price > 0.0 && std::isfinite(*quote.unit_price))) {
			throw core::InvalidInputError(core::Stage::Procurement, "Quoted unit price must be positive.",
			                              {{"supplier", quote.name}, {"unit_price", core::param(*quote.unit_price)}});
		}
		if (!(quote.price_premium > -1.0)) {
			throw core::InvalidInputError(core::Stage::Procurement, "Price premium must exceed -100%.",
			                              {{"supplier", quote.name}, {"price_premium", core::param(quote.price_premium)}});
		}
		if (quote.logistics_cost_per_unit < 0.0 || quote.payment_terms_days < 0 || quote.minimum_order < 0.0 ||
		    quote.lead_time_days < 0) {
			throw core::InvalidInputError(core::Stage::Procurement, "Supplier terms must be non-negative.",
			                              {{"supplier", quote.name}});
		}
		if (quote.reliability < 0.0 || quote.reliability > 1.0 || quote.quality_score < 0.0 ||
		    quote.quality_score > 1.0) {
			throw core::InvalidInputError(core::Stage::Procurement, "Reliability and quality scores must lie in [0, 1].",
			                              {{"supplier", quote.name},
			                               {"reliability", core::param(quote.reliability)},
			                               {"quality_score", core::param(quote.quality_score)}});
		}
	}
}

} // namespace

std::string toString(TimingAction action) {
	switch (action) {
	case TimingAction::BuyNow:
		return "buy now";
	case TimingAction::WaitForOptimal:
		return "wait for optimal timing";
	case TimingAction::WaitForLowest:
		return "wait for lowest price";
	default:
		return "?";
	}
}

void ProcurementOptions::validate() const {
	auto fail = [](const std::string &message, const std::string &name, double value) {
		throw core::InvalidInputError(core::Stage::Procurement, message, {{name, core::param(value)}});
	};
	if (!(holding_cost_rate >= 0.0) || !std::isfinite(holding_cost_rate)) {
		fail("Holding cost rate must be non-negative.", "holding_cost_rate", holding_cost_rate);
	}
	if (!(ordering_cost >= 0.0) || !std::isfinite(ordering_cost)) {
		fail("Ordering cost must be non-negative.", "ordering_cost", ordering_cost);
	}
	if (!(min_order_quantity >= 0.0)) {
		fail("Minimum order quantity must be non-negative.", "min_order_quantity", min_order_quantity);
	}
	if (max_order_quantity && !(*max_order_quantity > 0.0)) {
		fail("Maximum order quantity must be positive.", "max_order_quantity", *max_order_quantity);
	}
	if (capacity && !(*capacity > 0.0)) {
		fail("Capacity must be positive.", "capacity", *capacity);
	}
	if (quantity_grid_points < 2) {
		fail("Quantity grid needs at least 2 points.", "quantity_grid_points", quantity_grid_points);
	}
	if (max_wait_steps && *max_wait_steps < 0) {
		fail("Maximum wait must be non-negative.", "max_wait_steps", *max_wait_steps);
	}
	if (!(cost_of_capital >= 0.0)) {
		fail("Cost of capital must be non-negative.", "cost_of_capital", cost_of_capital);
	}
	if (!(days_per_step > 0.0)) {
		fail("Days per step must be positive.", "days_per_step", days_per_step);
	}
	if (reliability_premium_rate < 0.0 || quality_premium_rate < 0.0) {
		fail("Premium rates must be non-negative.", "reliability_premium_rate", reliability_premium_rate);
	}
	if (!(wait_savings_threshold >= 0.0) || !(lowest_savings_threshold >= 0.0)) {
		fail("Savings thresholds must be non-negative.", "wait_savings_threshold", wait_savings_threshold);
	}
	if (optimal_wait_steps < 0 || extended_wait_steps < optimal_wait_steps) {
		fail("Wait windows must be non-negative and nested.", "extended_wait_steps", extended_wait_steps);
	}
	if (!(monthly_holding_cost_rate >= 0.0) || !std::isfinite(monthly_holding_cost_rate)) {
		fail("Monthly holding cost rate must be non-negative.", "monthly_holding_cost_rate",
		     monthly_holding_cost_rate);
	}
	if (!(safety_stock_months >= 0.0)) {
		fail("Safety stock must be non-negative.", "safety_stock_months", safety_stock_months);
	}
	if (!(target_days_of_supply >= 0.0)) {
		fail("Target days of supply must be non-negative.", "target_days_of_supply", target_days_of_supply);
	}
	if (!(days_per_month > 0.0)) {
		fail("Days per month must be positive.", "days_per_month", days_per_month);
	}
}

const SupplierCost &SupplierRanking::best() const {
	if (ranked.empty()) {
		throw core::NoFeasibleSolutionError(core::Stage::Procurement, "No supplier is feasible.",
		                                    {{"quantity", core::param(quantity)}});
	}
	return ranked.front();
}

ProcurementOptimizer::ProcurementOptimizer(ProcurementOptions options) : options_(std::move(options)) {
	options_.validate();
}

std::vector<double> ProcurementOptimizer::pricePath(const core::Forecast &forecast) const {
	if (forecast.empty() || forecast.horizon() < 1) {
		throw core::InvalidInputError(core::Stage::Procurement, "Forecast must cover at least one future step.",
		                              {{"horizon", core::param(forecast.horizon())}});
	}
	const auto &prices = forecast.series(forecast.targetIndex());
	for (std::size_t t = 0; t < prices.size(); ++t) {
		if (!std::isfinite(prices[t]) || !(prices[t] > 0.0)) {
			throw core::InvalidInputError(core::Stage::Procurement, "Forecast prices must be positive.",
			                              {{"step", core::param(t)}, {"price", core::param(prices[t])}});
		}
	}
	return prices;
}

OrderDecision ProcurementOptimizer::optimizeOrderQuantity(const core::Forecast &forecast, double demand_rate) const {
	checkDemand(demand_rate);
	const auto prices = pricePath(forecast);
	const int horizon = forecast.horizon();
	const double demand = demand_rate * static_cast<double>(horizon);

	double upper = demand;
	if (options_.capacity) {
		upper = std::min(upper, *options_.capacity);
	}
	if (options_.max_order_quantity) {
		upper = std::min(upper, *options_.max_order_quantity);
	}
	if (options_.min_order_quantity > upper) {
		throw core::NoFeasibleSolutionError(core::Stage::Procurement,
		                                    "Minimum order quantity exceeds the largest admissible order.",
		                                    {{"min_order_quantity", core::param(options_.min_order_quantity)},
		                                     {"max_admissible", core::param(upper)},
		                                     {"demand", core::param(demand)}});
	}
	const double lower =
	    options_.min_order_quantity > 0.0 ? options_.min_order_quantity : upper / options_.quantity_grid_points;

	std::vector<double> grid;
	const int points = options_.quantity_grid_points;
	for (int i = 0; i < points; ++i) {
		grid.push_back(lower + (upper - lower) * static_cast<double>(i) / static_cast<double>(points - 1));
	}

	const int last_step = options_.max_wait_steps ? std::min(horizon, *options_.max_wait_steps) : horizon;
	const double S = options_.ordering_cost;
	const double h = options_.holding_cost_rate;

	OrderDecision best;
	best.demand = demand;
	double best_cost = std::numeric_limits<double>::infinity();
	CostBreakdown best_breakdown;

	for (int t = 0; t <= last_step; ++t) {
		const double price = prices[static_cast<std::size_t>(t)];
		const double holding_per_unit = h * price * static_cast<double>(horizon);
		const double eoq = holding_per_unit > 0.0 ? std::sqrt(2.0 * S * demand / holding_per_unit) : upper;

		std::vector<double> candidates = grid;
		candidates.push_back(std::clamp(eoq, lower, upper));
		candidates.push_back(upper); // the full demand whenever it is admissible
		std::sort(candidates.begin(), candidates.end());

		for (double quantity : candidates) {
			const CostBreakdown cost = orderCost(quantity, demand, price, h, S, horizon);
			++best.candidates_evaluated;
			if (cost.total() < best_cost) {
				best_cost = cost.total();
				best_breakdown = cost;
				best.quantity = quantity;
				best.timing = t;
				best.unit_price = price;
				best.economic_order_quantity = eoq;
			}
		}
	}

	best.ordering_cost = best_breakdown.ordering;
	best.purchase_cost = best_breakdown.purchase;
	best.holding_cost = best_breakdown.holding;
	best.total_cost = best_cost;
	best.baseline_cost = orderCost(demand, demand, prices.front(), h, S, horizon).total();
	best.baseline_feasible = demand <= upper && demand >= options_.min_order_quantity;
	best.projected_savings = best.baseline_cost - best.total_cost;

	COMMODEX_INFO("Order {:.1f} units at step {} (price {:.2f}): cost {:.2f}, savings {:.2f} over the baseline",
	              best.quantity, best.timing, best.unit_price, best.total_cost, best.projected_savings);
	return best;
}

SupplierRanking ProcurementOptimizer::rankSuppliers(const std::vector<SupplierQuote> &quotes,
                                                    const core::Forecast &forecast, double quantity) const {
	if (!std::isfinite(quantity) || !(quantity > 0.0)) {
		throw core::InvalidInputError(core::Stage::Procurement, "Quantity must be positive.",
		                              {{"quantity", core::param(quantity)}});
	}
	validateQuotes(quotes);
	const auto prices = pricePath(forecast);
	const int horizon = forecast.horizon();

	const double mean_price =
	    std::accumulate(prices.begin() + 1, prices.end(), 0.0) / static_cast<double>(horizon);
	const double steps_per_year = kDaysPerYear / options_.days_per_step;
	const double drift = std::log(prices.back() / prices.front()) / static_cast<double>(horizon) * steps_per_year;

	SupplierRanking ranking;
	ranking.quantity = quantity;
	ranking.opportunity_rate = options_.cost_of_capital + std::max(0.0, drift);

	for (const auto &quote : quotes) {
		if (quote.minimum_order > quantity) {
			COMMODEX_DEBUG("Supplier {} excluded: minimum order {:.1f} above {:.1f}", quote.name, quote.minimum_order,
			               quantity);
			ranking.excluded.push_back(quote.name);
			continue;
		}
		SupplierCost cost;
		cost.name = quote.name;
		cost.lead_time_days = quote.lead_time_days;
		cost.unit_price = quote.unit_price ? *quote.unit_price : mean_price * (1.0 + quote.price_premium);
		cost.purchase_cost = cost.unit_price * quantity;
		cost.logistics_cost = quote.logistics_cost_per_unit * quantity;
		const double years = static_cast<double>(quote.payment_terms_days) / kDaysPerYear;
		cost.financing_adjustment =
		    -cost.purchase_cost * (1.0 - 1.0 / std::pow(1.0 + ranking.opportunity_rate, years));
		cost.risk_premium = cost.purchase_cost * (1.0 - quote.reliability) * options_.reliability_premium_rate;
		cost.quality_adjustment = cost.purchase_cost * (1.0 - quote.quality_score) * options_.quality_premium_rate;
		cost.total_cost = cost.purchase_cost + cost.logistics_cost + cost.financing_adjustment + cost.risk_premium +
		                  cost.quality_adjustment;
		cost.cost_per_unit = cost.total_cost / quantity;
		ranking.ranked.push_back(cost);
	}

	if (ranking.ranked.empty()) {
		throw core::NoFeasibleSolutionError(core::Stage::Procurement,
		                                    "No supplier accepts an order of this size.",
		                                    {{"quantity", core::param(quantity)},
		                                     {"suppliers", core::param(quotes.size())}});
	}

	std::stable_sort(ranking.ranked.begin(), ranking.ranked.end(), [](const SupplierCost &a, const SupplierCost &b) {
		if (a.total_cost != b.total_cost) {
			return a.total_cost < b.total_cost;
		}
		return a.name < b.name;
	});

	COMMODEX_INFO("Best supplier {} at {:.2f} per unit ({} ranked, {} excluded)", ranking.ranked.front().name,
	              ranking.ranked.front().cost_per_unit, ranking.ranked.size(), ranking.excluded.size());
	return ranking;
}

TimingRecommendation ProcurementOptimizer::recommendTiming(const core::Forecast &forecast, double demand_rate) const {
	checkDemand(demand_rate);
	const auto prices = pricePath(forecast);
	const int horizon = forecast.horizon();
	const double demand = demand_rate * static_cast<double>(horizon);
	const double today = prices.front();
	const double spend = today * demand;

	TimingRecommendation result;
	result.price = today;
	result.rationale = "Current price is optimal or waiting costs exceed the potential savings";

	int optimal_step = 0;
	double optimal_net = 0.0;
	for (int t = 1; t <= std::min(horizon, options_.optimal_wait_steps); ++t) {
		const double net = (today - prices[static_cast<std::size_t>(t)]) -
		                   static_cast<double>(t) * options_.holding_cost_rate * today;
		if (net > optimal_net) {
			optimal_net = net;
			optimal_step = t;
		}
	}
	if (optimal_step > 0 && optimal_net * demand > options_.wait_savings_threshold * spend) {
		result.action = TimingAction::WaitForOptimal;
		result.step = optimal_step;
		result.price = prices[static_cast<std::size_t>(optimal_step)];
		result.savings = optimal_net * demand;
		result.savings_fraction = result.savings / spend;
		result.rationale = "Wait " + std::to_string(optimal_step) + " steps for net savings after holding costs";
		return result;
	}

	int lowest_step = 0;
	for (int t = 1; t <= std::min(horizon, options_.extended_wait_steps); ++t) {
		if (prices[static_cast<std::size_t>(t)] < prices[static_cast<std::size_t>(lowest_step)]) {
			lowest_step = t;
		}
	}
	const double lowest_savings = (today - prices[static_cast<std::size_t>(lowest_step)]) * demand;
	if (lowest_step > 0 && lowest_savings > options_.lowest_savings_threshold * spend) {
		result.action = TimingAction::WaitForLowest;
		result.step = lowest_step;
		result.price = prices[static_cast<std::size_t>(lowest_step)];
		result.savings = lowest_savings;
		result.savings_fraction = result.savings / spend;
		result.rationale = "Lowest forecast price in " + std::to_string(lowest_step) + " steps";
	}
	return result;
}

InventoryMetrics ProcurementOptimizer::inventoryMetrics(const core::Forecast &forecast,
                                                       const InventoryPosition &position) const {
	if (!std::isfinite(position.on_hand) || position.on_hand < 0.0) {
		throw core::InvalidInputError(core::Stage::Procurement, "Inventory on hand must be non-negative.",
		                              {{"on_hand", core::param(position.on_hand)}});
	}
	if (!std::isfinite(position.monthly_consumption) || !(position.monthly_consumption > 0.0)) {
		throw core::InvalidInputError(core::Stage::Procurement, "Monthly consumption must be positive.",
		                              {{"monthly_consumption", core::param(position.monthly_consumption)}});
	}
	const auto prices = pricePath(forecast);

	InventoryMetrics result;
	result.current_price = prices.front();
	const auto best = std::min_element(prices.begin() + 1, prices.end());
	const auto worst = std::max_element(prices.begin() + 1, prices.end());
	result.best_buy_step = static_cast<int>(best - prices.begin());
	result.best_buy_price = *best;
	result.worst_buy_step = static_cast<int>(worst - prices.begin());
	result.worst_buy_price = *worst;
	result.potential_savings_per_unit = result.worst_buy_price - result.best_buy_price;

	result.days_of_supply = position.on_hand / position.monthly_consumption * options_.days_per_month;
	result.target_days_of_supply = options_.target_days_of_supply;
	result.safety_stock = options_.safety_stock_months * position.monthly_consumption;
	result.excess_inventory = std::max(0.0, position.on_hand - result.safety_stock);
	result.inventory_shortage = std::max(0.0, result.safety_stock - position.on_hand);

	result.monthly_procurement_value = position.monthly_consumption * result.current_price;
	result.monthly_holding_cost = position.on_hand * result.current_price * options_.monthly_holding_cost_rate;
	result.total_monthly_cost = result.monthly_procurement_value + result.monthly_holding_cost;
	result.cost_per_unit = result.current_price;
	if (position.on_hand > 0.0) {
		result.cost_per_unit += result.monthly_holding_cost / position.on_hand;
	}

	COMMODEX_DEBUG("Inventory covers {:.1f} days (target {:.0f}), shortage {:.1f}, excess {:.1f}",
	               result.days_of_supply, result.target_days_of_supply, result.inventory_shortage,
	               result.excess_inventory);
	return result;
}

ProcurementPlan ProcurementOptimizer::plan(std::shared_ptr<const core::Forecast> forecast, double demand_rate,
                                           const std::vector<SupplierQuote> &quotes,
                                           std::shared_ptr<const risk::RiskAssessment> risk,
                                           const std::optional<InventoryPosition> &inventory) const {
	if (!forecast) {
		throw core::InvalidInputError(core::Stage::Procurement, "Procurement planning needs a forecast.");
	}
	ProcurementPlan result;
	result.order = optimizeOrderQuantity(*forecast, demand_rate);
	if (!quotes.empty()) {
		result.suppliers = rankSuppliers(quotes, *forecast, result.order.quantity);
	} else {
		result.suppliers.quantity = result.order.quantity;
	}
	result.timing = recommendTiming(*forecast, demand_rate);
	if (inventory) {
		result.inventory = inventoryMetrics(*forecast, *inventory);
	}
	result.forecast = std::move(forecast);
	result.risk = std::move(risk);

	COMMODEX_INFO("Timing: {} (step {}, savings {:.2f})", toString(result.timing.action), result.timing.step,
	              result.timing.savings);
	return result;
}

} // namespace commodex::procurement
