#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/analysis/unit_root.hpp"
#include "commodex/core/errors.hpp"
#include "common/series_helpers.hpp"

using namespace commodex;

TEST_CASE("ADF rejects a unit root for white noise", "[analysis][adf]") {
	const auto noise = tests::helpers::whiteNoise(300, 1.0, 3);
	const auto result = analysis::augmentedDickeyFuller(noise);

	REQUIRE(result.statistic < result.critical_1);
	REQUIRE(result.p_value < 0.01);
	REQUIRE(result.stationary(0.05));
	REQUIRE(result.observations > 250);
}

TEST_CASE("ADF keeps the unit root for a random walk", "[analysis][adf]") {
	const auto walk = tests::helpers::randomWalk(300, 50.0, 1.0, 5);
	const auto result = analysis::augmentedDickeyFuller(walk);

	REQUIRE(result.p_value > 0.05);
	REQUIRE_FALSE(result.stationary(0.05));
}

TEST_CASE("ADF honours an explicit maximum lag", "[analysis][adf]") {
	const auto series = tests::helpers::ar1(200, 0.5, 1.0, 9);
	analysis::AdfOptions options;
	options.max_lag = 0;
	const auto result = analysis::augmentedDickeyFuller(series, options);

	REQUIRE(result.used_lag == 0);
	REQUIRE(result.observations == 199);
}

TEST_CASE("MacKinnon p-values are monotone in the statistic", "[analysis][adf]") {
	REQUIRE(analysis::mackinnonPValue(-1.0) == Catch::Approx(0.75).margin(0.02));
	REQUIRE(analysis::mackinnonPValue(-2.86) == Catch::Approx(0.05).margin(0.01));
	REQUIRE(analysis::mackinnonPValue(-3.43) == Catch::Approx(0.01).margin(0.005));
	REQUIRE(analysis::mackinnonPValue(-30.0) == Catch::Approx(0.0));
	REQUIRE(analysis::mackinnonPValue(5.0) == Catch::Approx(1.0));
	REQUIRE(analysis::mackinnonPValue(-2.0) < analysis::mackinnonPValue(-1.5));

	double one = 0.0;
	double five = 0.0;
	double ten = 0.0;
	analysis::mackinnonCriticalValues(500, one, five, ten);
	REQUIRE(one < five);
	REQUIRE(five < ten);
	REQUIRE(five == Catch::Approx(-2.867).margin(0.01));
}

TEST_CASE("ADF needs enough observations", "[analysis][adf][validation]") {
	REQUIRE_THROWS_AS(analysis::augmentedDickeyFuller({1.0, 2.0, 1.5, 3.0}), core::InsufficientDataError);
}
