#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/models/var.hpp"
#include "common/series_helpers.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <vector>

using namespace commodex;
using models::VarModel;
using models::VarOptions;

TEST_CASE("VAR recovers a known lead coefficient", "[models][var]") {
	const auto series = tests::helpers::leadLagSeries(500, 81);
	VarOptions options;
	options.criterion = core::InformationCriterion::BIC;
	const auto model = VarModel::fit(series, options);

	REQUIRE(model.kind() == models::ModelKind::VAR);
	REQUIRE(model.lagOrder() == 1);
	REQUIRE(model.lagSelection().size() == 5);
	REQUIRE(model.coefficient("y", "x", 1) == Catch::Approx(0.8).margin(0.1));
	REQUIRE(model.coefficient("x", "y", 1) == Catch::Approx(0.0).margin(0.1));
	REQUIRE(model.isStable());
	REQUIRE(model.diagnostics().equations.size() == 2);
	REQUIRE(model.diagnostics().observations == 499);

	// y's equation leaves the N(0, 0.25) noise; x is unpredictable N(0, 1).
	const auto &y_fit = model.diagnostics().equations[1];
	REQUIRE(y_fit.variable == "y");
	REQUIRE(y_fit.rmse == Catch::Approx(0.5).margin(0.05));
	REQUIRE(y_fit.rmse == Catch::Approx(std::sqrt(y_fit.residual_variance)));
	REQUIRE(y_fit.mae < y_fit.rmse);
	REQUIRE(model.diagnostics().equations[0].rmse == Catch::Approx(1.0).margin(0.1));

	REQUIRE_THROWS_AS(model.coefficient("y", "x", 2), core::InvalidInputError);
	REQUIRE_THROWS_AS(model.coefficient("y", "missing", 1), core::InvalidInputError);
}

TEST_CASE("VAR forecast starts at the last observation", "[models][var][forecast]") {
	const auto series = tests::helpers::leadLagSeries(400, 82);
	VarOptions options;
	options.fixed_lag = 2;
	const auto model = VarModel::fit(series, options);
	REQUIRE(model.lagOrder() == 2);
	REQUIRE(model.lagSelection().empty());

	const auto forecast = model.forecast(10, 0.95);
	REQUIRE(forecast.horizon() == 10);
	REQUIRE(forecast.variables == series.variables());
	for (std::size_t v = 0; v < forecast.dimensions(); ++v) {
		REQUIRE(forecast.point[v][0] == Catch::Approx(series.column(v).back()));
		REQUIRE(forecast.intervalWidth(v, 0) == 0.0);
		for (int h = 1; h <= 10; ++h) {
			REQUIRE(forecast.lower[v][h] <= forecast.point[v][h]);
			REQUIRE(forecast.point[v][h] <= forecast.upper[v][h]);
			REQUIRE(forecast.intervalWidth(v, h) >= forecast.intervalWidth(v, h - 1) - 1e-12);
		}
	}

	const auto empty = model.forecast(0, 0.95);
	REQUIRE(empty.horizon() == 0);
	REQUIRE(empty.point[1][0] == Catch::Approx(series.column(1).back()));
}

TEST_CASE("Differenced VAR forecasts in levels", "[models][var][differencing]") {
	const auto a = tests::helpers::randomWalk(300, 50.0, 1.0, 83);
	const auto b = tests::helpers::randomWalk(300, 80.0, 1.0, 84);
	const auto series = tests::helpers::makeMultivariate({"a", "b"}, {a, b});

	VarOptions options;
	options.differencing_order = 1;
	options.fixed_lag = 1;
	const auto model = VarModel::fit(series, options);
	REQUIRE(model.differencingOrder() == 1);
	REQUIRE(model.levels().lags() == 2);

	const auto forecast = model.forecast(5, 0.9);
	REQUIRE(forecast.point[0][0] == Catch::Approx(a.back()));
	REQUIRE(forecast.point[1][0] == Catch::Approx(b.back()));
	REQUIRE(forecast.point[0][5] == Catch::Approx(a.back()).margin(5.0));
	REQUIRE(forecast.intervalWidth(0, 5) > forecast.intervalWidth(0, 1));
}

TEST_CASE("Explosive VAR refuses to forecast", "[models][var][stability]") {
	const auto noise = tests::helpers::whiteNoise(200, 1.0, 85);
	const auto other = tests::helpers::whiteNoise(200, 1.0, 86);
	std::vector<double> explosive(200);
	double level = 1.0;
	for (std::size_t t = 0; t < explosive.size(); ++t) {
		level = 1.05 * level + noise[t];
		explosive[t] = level;
	}
	const auto series = tests::helpers::makeMultivariate({"boom", "calm"}, {explosive, other});

	VarOptions options;
	options.fixed_lag = 1;
	const auto model = VarModel::fit(series, options);
	REQUIRE_FALSE(model.isStable());
	REQUIRE(model.diagnostics().max_root_modulus > 1.0);
	REQUIRE_FALSE(model.diagnostics().warnings.empty());
	REQUIRE_THROWS_AS(model.forecast(5, 0.95), core::UnstableModelError);
}

TEST_CASE("VAR impulse responses", "[models][var][irf]") {
	const auto model = VarModel::fit(tests::helpers::leadLagSeries(400, 87), [] {
		VarOptions options;
		options.fixed_lag = 1;
		return options;
	}());

	const auto psi = model.impulseResponse(4);
	REQUIRE(psi.size() == 5);
	REQUIRE(psi[0].isApprox(Eigen::MatrixXd::Identity(2, 2)));
	REQUIRE(psi[1].isApprox(model.coefficientMatrices()[0]));

	const auto orthogonal = model.impulseResponse(2, true);
	REQUIRE(orthogonal[0](0, 1) == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(orthogonal[0](0, 0) > 0.0);

	REQUIRE_THROWS_AS(model.impulseResponse(-1), core::InvalidInputError);
}

TEST_CASE("VAR validation", "[models][var][validation]") {
	VarOptions options;
	options.max_lag = 0;
	REQUIRE_THROWS_AS(options.validate(), core::InvalidInputError);

	options = VarOptions{};
	options.differencing_order = 3;
	REQUIRE_THROWS_AS(options.validate(), core::InvalidInputError);

	const auto tiny = tests::helpers::makeMultivariate({"a", "b"}, {tests::helpers::whiteNoise(10, 1.0, 88),
	                                                                tests::helpers::whiteNoise(10, 1.0, 89)});
	REQUIRE_THROWS_AS(VarModel::fit(tiny), core::InsufficientDataError);
}
