#include "commodex/transform/returns.hpp"

#include <cmath>
#include <functional>
#include <utility>

namespace commodex::transform {

namespace {

core::TimeSeries returnsOf(const core::TimeSeries &prices, const std::function<double(double, double)> &rate) {
	if (prices.size() < 2) {
		throw core::InsufficientDataError(core::Stage::SeriesStore, "Returns need at least two prices.",
		                                  {{"series", prices.name()}, {"size", core::param(prices.size())}});
	}
	const auto &values = prices.values();
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (!std::isfinite(values[i]) || values[i] <= 0.0) {
			throw core::InvalidInputError(core::Stage::SeriesStore, "Returns require strictly positive prices.",
			                              {{"series", prices.name()},
			                               {"index", core::param(i)},
			                               {"value", core::param(values[i])}});
		}
	}

	std::vector<double> returns;
	returns.reserve(values.size() - 1);
	for (std::size_t i = 1; i < values.size(); ++i) {
		returns.push_back(rate(values[i], values[i - 1]));
	}
	std::vector<core::TimeSeries::TimePoint> stamps(prices.timestamps().begin() + 1, prices.timestamps().end());
	auto metadata = prices.metadata();
	metadata[core::TimeSeries::kSeriesKindKey] = core::TimeSeries::kKindReturns;
	return core::TimeSeries(std::move(stamps), std::move(returns), prices.name(), std::move(metadata));
}

} // namespace

core::TimeSeries logReturns(const core::TimeSeries &prices) {
	return returnsOf(prices, [](double current, double previous) { return std::log(current / previous); });
}

core::TimeSeries simpleReturns(const core::TimeSeries &prices) {
	return returnsOf(prices, [](double current, double previous) { return current / previous - 1.0; });
}

std::vector<double> difference(const std::vector<double> &values, int order) {
	if (order < 0) {
		throw core::InvalidInputError(core::Stage::SeriesStore, "Differencing order must be non-negative.",
		                              {{"order", core::param(order)}});
	}
	if (values.size() <= static_cast<std::size_t>(order)) {
		throw core::InsufficientDataError(core::Stage::SeriesStore,
		                                  "Insufficient data length for requested differencing order.",
		                                  {{"order", core::param(order)}, {"size", core::param(values.size())}});
	}
	std::vector<double> result = values;
	for (int round = 0; round < order; ++round) {
		for (std::size_t i = result.size() - 1; i > 0; --i) {
			result[i] -= result[i - 1];
		}
		result.erase(result.begin());
	}
	return result;
}

} // namespace commodex::transform
