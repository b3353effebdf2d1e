#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/models/ensemble.hpp"
#include "common/series_helpers.hpp"

#include <algorithm>
#include <vector>

using namespace commodex;
using models::EnsembleCombinationMethod;
using models::EnsembleConfig;
using models::ForecastEnsemble;

namespace {

struct Members {
	models::FittedModelPtr joint;
	models::FittedModelPtr own;
};

/// y follows x with a one-step lead; the joint model sees x, the own-history model does not.
Members leadLagMembers(unsigned seed) {
	const auto series = tests::helpers::leadLagSeries(400, seed);
	models::VarOptions options;
	options.fixed_lag = 1;
	return {models::fitVar(series, options), models::fitVar(series.select({"y"}), options)};
}

} // namespace

TEST_CASE("Mean ensemble averages paths and band half-widths", "[models][ensemble]") {
	const auto members = leadLagMembers(121);
	const ForecastEnsemble ensemble({members.joint, members.own});
	REQUIRE(ensemble.name() == "Ensemble<mean, 2 models>");
	REQUIRE(ensemble.weights("y") == std::vector<double>{0.5, 0.5});

	const auto parts = ensemble.individualForecasts(6, 0.9, "y");
	REQUIRE(parts.size() == 2);
	const auto combined = ensemble.predict(6, 0.9, "y");
	REQUIRE(combined.variables == std::vector<std::string>{"y"});
	REQUIRE(combined.target == "y");
	REQUIRE(combined.confidence_level == 0.9);
	REQUIRE(combined.horizon() == 6);
	REQUIRE(combined.model.expired());

	const auto &joint_y = parts[0].series("y");
	const auto &own_y = parts[1].series("y");
	REQUIRE(combined.point[0][0] == Catch::Approx(joint_y[0]));
	REQUIRE(combined.intervalWidth(0, 0) == Catch::Approx(0.0).margin(1e-12));
	for (int h = 1; h <= 6; ++h) {
		REQUIRE(combined.series(0)[h] == Catch::Approx(0.5 * (joint_y[h] + own_y[h])));
		REQUIRE(combined.intervalWidth(0, h) ==
		        Catch::Approx(0.5 * (parts[0].intervalWidth(1, h) + parts[1].intervalWidth(0, h))));
		REQUIRE(combined.intervalWidth(0, h) >= combined.intervalWidth(0, h - 1) - 1e-12);
	}
}

TEST_CASE("Accuracy weighting favours the better-fitting member", "[models][ensemble][weights]") {
	const auto members = leadLagMembers(122);
	EnsembleConfig config;
	config.method = EnsembleCombinationMethod::WeightedAccuracy;
	const ForecastEnsemble ensemble({members.joint, members.own}, config);

	const double joint_rmse = members.joint->diagnostics().equations[1].rmse;
	const double own_rmse = members.own->diagnostics().equations[0].rmse;
	REQUIRE(joint_rmse < own_rmse);

	const auto weights = ensemble.weights("y");
	REQUIRE(weights[0] + weights[1] == Catch::Approx(1.0));
	REQUIRE(weights[0] > weights[1]);
	REQUIRE(weights[0] == Catch::Approx((1.0 / joint_rmse) / (1.0 / joint_rmse + 1.0 / own_rmse)));

	const auto parts = ensemble.individualForecasts(3, 0.95, "y");
	const auto combined = ensemble.predict(3, 0.95, "y");
	REQUIRE(combined.point[0][3] ==
	        Catch::Approx(weights[0] * parts[0].series("y")[3] + weights[1] * parts[1].series("y")[3]));
}

TEST_CASE("Median ensemble follows the middle member", "[models][ensemble][median]") {
	const auto series = tests::helpers::leadLagSeries(400, 123);
	models::VarOptions lag_one;
	lag_one.fixed_lag = 1;
	models::VarOptions lag_three;
	lag_three.fixed_lag = 3;
	const auto joint = models::fitVar(series, lag_one);
	const auto own = models::fitVar(series.select({"y"}), lag_one);
	const auto own_long = models::fitVar(series.select({"y"}), lag_three);

	EnsembleConfig config;
	config.method = EnsembleCombinationMethod::Median;
	const ForecastEnsemble ensemble({joint, own, own_long}, config);
	const auto parts = ensemble.individualForecasts(4, 0.95, "y");
	const auto combined = ensemble.predict(4, 0.95, "y");
	for (std::size_t h = 0; h <= 4; ++h) {
		std::vector<double> points{parts[0].series("y")[h], parts[1].series("y")[h], parts[2].series("y")[h]};
		std::sort(points.begin(), points.end());
		REQUIRE(combined.point[0][h] == Catch::Approx(points[1]));
	}
	REQUIRE(models::toString(EnsembleCombinationMethod::Median) == "median");
}

TEST_CASE("Ensemble validation", "[models][ensemble][validation]") {
	const auto members = leadLagMembers(124);
	REQUIRE_THROWS_AS(ForecastEnsemble(std::vector<models::FittedModelPtr>{}), core::InvalidInputError);
	REQUIRE_THROWS_AS(ForecastEnsemble({members.joint, nullptr}), core::InvalidInputError);

	const auto returns = tests::helpers::makeSeries("ret", tests::helpers::garchReturns(800, 0.05, 0.1, 0.8, 125))
	                         .withMetadata(core::TimeSeries::kSeriesKindKey, core::TimeSeries::kKindReturns);
	REQUIRE_THROWS_AS(ForecastEnsemble({members.joint, models::fitGarch(returns)}), core::InvalidInputError);

	const ForecastEnsemble ensemble({members.joint, members.own});
	REQUIRE_THROWS_AS(ensemble.predict(3, 0.95, "x"), core::InvalidInputError);
	REQUIRE_THROWS_AS(ensemble.predict(3, 0.95, ""), core::InvalidInputError);

	EnsembleConfig weighted;
	weighted.method = EnsembleCombinationMethod::WeightedAccuracy;
	REQUIRE_THROWS_AS(ForecastEnsemble({members.joint, members.own}, weighted).weights("x"),
	                  core::InvalidInputError);

	EnsembleConfig no_floor;
	no_floor.min_rmse = 0.0;
	REQUIRE_THROWS_AS(ForecastEnsemble({members.joint}, no_floor), core::InvalidInputError);
}
