#pragma once

#include "commodex/core/forecast.hpp"
#include "commodex/risk/risk_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace commodex::procurement {

struct ProcurementOptions {
	double holding_cost_rate = 0.02;     // per forecast step, fraction of the unit price
	double ordering_cost = 25000.0;      // fixed cost per order
	double min_order_quantity = 0.0;
	std::optional<double> max_order_quantity;
	std::optional<double> capacity;      // storage limit on a single order
	int quantity_grid_points = 20;
	std::optional<int> max_wait_steps;   // latest admissible order step
	double cost_of_capital = 0.12;       // annual
	double days_per_step = 1.0;
	double reliability_premium_rate = 0.10;
	double quality_premium_rate = 0.05;
	double wait_savings_threshold = 0.05;
	double lowest_savings_threshold = 0.08;
	int optimal_wait_steps = 15;
	int extended_wait_steps = 30;
	double monthly_holding_cost_rate = 0.02; // fraction of inventory value per month
	double safety_stock_months = 1.5;        // consumption held as safety stock
	double target_days_of_supply = 45.0;
	double days_per_month = 30.0;

	void validate() const;
};

/// Optimal (quantity, timing) pair and its comparison with ordering everything now.
struct OrderDecision {
	double demand = 0.0;           // demand_rate * horizon
	double quantity = 0.0;
	int timing = 0;                // forecast step at which to order
	double unit_price = 0.0;
	double economic_order_quantity = 0.0; // unconstrained EOQ at the chosen step
	double ordering_cost = 0.0;
	double purchase_cost = 0.0;
	double holding_cost = 0.0;
	double total_cost = 0.0;
	double baseline_cost = 0.0;
	bool baseline_feasible = true;
	double projected_savings = 0.0;
	int candidates_evaluated = 0;
};

/**
 * @struct SupplierQuote
 * @brief Commercial terms offered by one supplier.
 *
 * Without an explicit unit price the supplier prices at the mean forecast
 * price adjusted by `price_premium`.
 */
struct SupplierQuote {
	std::string name;
	std::optional<double> unit_price;
	double price_premium = 0.0;
	double logistics_cost_per_unit = 0.0;
	int payment_terms_days = 0;
	double reliability = 1.0;
	double quality_score = 1.0;
	double minimum_order = 0.0;
	int lead_time_days = 0;
};

struct SupplierCost {
	std::string name;
	double unit_price = 0.0;
	double purchase_cost = 0.0;
	double logistics_cost = 0.0;
	double financing_adjustment = 0.0; // negative: value of paying later
	double risk_premium = 0.0;
	double quality_adjustment = 0.0;
	double total_cost = 0.0;
	double cost_per_unit = 0.0;
	int lead_time_days = 0;
};

struct SupplierRanking {
	double quantity = 0.0;
	double opportunity_rate = 0.0;      // annual rate used to discount deferred payments
	std::vector<SupplierCost> ranked;   // ascending total cost
	std::vector<std::string> excluded;  // minimum order above the quantity

	const SupplierCost &best() const;
};

enum class TimingAction {
	BuyNow,
	WaitForOptimal,
	WaitForLowest
};

std::string toString(TimingAction action);

struct TimingRecommendation {
	TimingAction action = TimingAction::BuyNow;
	int step = 0;
	double price = 0.0;
	double savings = 0.0;           // over buying the full demand now
	double savings_fraction = 0.0;  // savings relative to the spend at today's price
	std::string rationale;
};

struct InventoryPosition {
	double on_hand = 0.0;
	double monthly_consumption = 0.0;
};

/**
 * @struct InventoryMetrics
 * @brief Buy-window, stock coverage and carrying cost figures for one inventory position.
 *
 * Prices are valued at today's price (forecast step 0); the buy window is
 * searched over the future steps only.
 */
struct InventoryMetrics {
	double current_price = 0.0;
	int best_buy_step = 0;
	double best_buy_price = 0.0;
	int worst_buy_step = 0;
	double worst_buy_price = 0.0;
	double potential_savings_per_unit = 0.0; // worst minus best forecast price

	double days_of_supply = 0.0;
	double target_days_of_supply = 0.0;
	double safety_stock = 0.0;
	double excess_inventory = 0.0;
	double inventory_shortage = 0.0;

	double monthly_procurement_value = 0.0;
	double monthly_holding_cost = 0.0;
	double total_monthly_cost = 0.0;
	double cost_per_unit = 0.0; // price plus holding cost spread over the stock on hand
};

/**
 * @struct ProcurementPlan
 * @brief Immutable output of one optimization call.
 */
struct ProcurementPlan {
	std::shared_ptr<const core::Forecast> forecast;
	std::shared_ptr<const risk::RiskAssessment> risk; // may be null
	OrderDecision order;
	SupplierRanking suppliers;
	TimingRecommendation timing;
	std::optional<InventoryMetrics> inventory;

	double recommendedQuantity() const {
		return order.quantity;
	}

	int recommendedTiming() const {
		return order.timing;
	}

	double projectedSavings() const {
		return order.projected_savings;
	}
};

/**
 * @class ProcurementOptimizer
 * @brief EOQ search over a forecast price path, supplier landed-cost ranking
 * and purchase timing.
 *
 * Prices come from the target variable of the forecast. Step 0 is today's
 * observed price.
 */
class ProcurementOptimizer {
public:
	ProcurementOptimizer() = default;
	explicit ProcurementOptimizer(ProcurementOptions options);

	/**
	 * @brief Minimises S*D/Q + D*p_t + h*p_t*(Q/2)*H over the timing steps and a quantity grid.
	 *
	 * Ties resolve to the earliest step, then the smaller quantity.
	 * @throws NoFeasibleSolutionError when the quantity bounds leave nothing to order.
	 * @throws InvalidInputError on a forecast without future steps or non-positive prices.
	 */
	OrderDecision optimizeOrderQuantity(const core::Forecast &forecast, double demand_rate) const;

	/**
	 * @brief Orders feasible quotes by total landed cost for @p quantity.
	 * @throws NoFeasibleSolutionError when every quote requires a larger minimum order.
	 */
	SupplierRanking rankSuppliers(const std::vector<SupplierQuote> &quotes, const core::Forecast &forecast,
	                              double quantity) const;

	TimingRecommendation recommendTiming(const core::Forecast &forecast, double demand_rate) const;

	/**
	 * @brief Stock coverage, safety stock gap, monthly carrying cost and the cheapest buy step.
	 * @throws InvalidInputError on a negative stock, a non-positive consumption or a forecast
	 *         without future steps.
	 */
	InventoryMetrics inventoryMetrics(const core::Forecast &forecast, const InventoryPosition &position) const;

	/// Runs every optimization; supplier ranking and inventory metrics are skipped without their inputs.
	ProcurementPlan plan(std::shared_ptr<const core::Forecast> forecast, double demand_rate,
	                     const std::vector<SupplierQuote> &quotes = {},
	                     std::shared_ptr<const risk::RiskAssessment> risk = nullptr,
	                     const std::optional<InventoryPosition> &inventory = std::nullopt) const;

	const ProcurementOptions &options() const {
		return options_;
	}

private:
	std::vector<double> pricePath(const core::Forecast &forecast) const;

	ProcurementOptions options_;
};

} // namespace commodex::procurement
