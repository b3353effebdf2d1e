#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/core/forecast.hpp"
#include "commodex/core/volatility_path.hpp"
#include "common/forecast_helpers.hpp"

#include <cmath>

using commodex::core::Forecast;
using commodex::core::InvalidInputError;

TEST_CASE("Forecast exposes paths by variable", "[core][forecast]") {
	auto forecast = tests::helpers::makePriceForecast({100.0, 101.0, 102.0}, "copper", 0.1);

	REQUIRE_FALSE(forecast.empty());
	REQUIRE(forecast.dimensions() == 1);
	REQUIRE(forecast.horizon() == 2);
	REQUIRE(forecast.targetIndex() == 0);
	REQUIRE(forecast.series("copper")[2] == Catch::Approx(102.0));
	REQUIRE(forecast.intervalWidth(0, 0) == Catch::Approx(0.0));
	REQUIRE(forecast.intervalWidth(0, 1) == Catch::Approx(20.2));

	const auto rows = forecast.path("copper");
	REQUIRE(rows.size() == 3);
	REQUIRE(rows[1].step == 1);
	REQUIRE(rows[1].lower == Catch::Approx(90.9));

	REQUIRE_THROWS_AS(forecast.series("gold"), InvalidInputError);
	REQUIRE_THROWS_AS(forecast.series(std::size_t{3}), InvalidInputError);
	REQUIRE(forecast.model.expired());
}

TEST_CASE("Empty forecast reports zero horizon", "[core][forecast][edge]") {
	Forecast forecast;
	REQUIRE(forecast.empty());
	REQUIRE(forecast.horizon() == 0);
}

TEST_CASE("VolatilityPath aggregates variances", "[core][volatility_path]") {
	commodex::core::VolatilityPath path;
	path.variance = {0.0001, 0.0002, 0.0003};

	REQUIRE(path.horizon() == 3);
	REQUIRE(path.volatility(2) == Catch::Approx(std::sqrt(0.0002)));
	REQUIRE(path.cumulativeVariance(2) == Catch::Approx(0.0003));
	REQUIRE(path.cumulativeVariance(10) == Catch::Approx(0.0006));
	REQUIRE(path.meanVariance() == Catch::Approx(0.0002));
	REQUIRE(path.annualizedVolatility(252.0) == Catch::Approx(std::sqrt(0.0002 * 252.0)));
}
