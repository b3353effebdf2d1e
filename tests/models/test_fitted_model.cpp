#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/models/fitted_model.hpp"
#include "common/series_helpers.hpp"

using namespace commodex;

TEST_CASE("FittedModel dispatches through the held alternative", "[models][fitted]") {
	const auto var = models::fitVar(tests::helpers::leadLagSeries(300, 111));
	REQUIRE(var->kind() == models::ModelKind::VAR);
	REQUIRE(var->as<models::VarModel>() != nullptr);
	REQUIRE(var->as<models::GarchModel>() == nullptr);
	REQUIRE(var->variables() == std::vector<std::string>{"x", "y"});
	REQUIRE(var->describe().rfind("VAR(", 0) == 0);
	REQUIRE(models::toString(var->kind()) == "VAR");

	const auto returns = tests::helpers::makeSeries("ret", tests::helpers::garchReturns(800, 0.05, 0.1, 0.8, 112))
	                         .withMetadata(core::TimeSeries::kSeriesKindKey, core::TimeSeries::kKindReturns);
	const auto garch = models::fitGarch(returns);
	REQUIRE(garch->kind() == models::ModelKind::GARCH);
	REQUIRE(garch->diagnostics().persistence.has_value());
}

TEST_CASE("Forecasts reference the producing model", "[models][fitted][forecast]") {
	const auto model = models::fitVar(tests::helpers::leadLagSeries(300, 113));

	const auto defaulted = models::forecast(model, 4, 0.9);
	REQUIRE(defaulted.target == "x");
	REQUIRE(defaulted.model.lock() == model);
	REQUIRE(defaulted.confidence_level == 0.9);

	const auto targeted = models::forecast(model, 4, 0.9, "y");
	REQUIRE(targeted.target == "y");
	REQUIRE(targeted.targetIndex() == 1);

	REQUIRE_THROWS_AS(models::forecast(model, 4, 0.9, "z"), core::InvalidInputError);
	REQUIRE_THROWS_AS(models::forecast(nullptr, 4, 0.9), core::InvalidInputError);
}

TEST_CASE("Volatility forecasts need a GARCH model", "[models][fitted][volatility]") {
	const auto var = models::fitVar(tests::helpers::leadLagSeries(300, 114));
	REQUIRE_THROWS_AS(models::forecastVolatility(var, 5), core::InvalidInputError);
	REQUIRE_THROWS_AS(models::forecastVolatility(nullptr, 5), core::InvalidInputError);

	const auto returns = tests::helpers::makeSeries("ret", tests::helpers::garchReturns(800, 0.05, 0.1, 0.8, 115))
	                         .withMetadata(core::TimeSeries::kSeriesKindKey, core::TimeSeries::kKindReturns);
	const auto garch = models::fitGarch(returns);
	const auto path = models::forecastVolatility(garch, 5);
	REQUIRE(path.horizon() == 5);
	REQUIRE(path.model.lock() == garch);
}
