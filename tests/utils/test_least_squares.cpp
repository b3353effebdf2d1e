#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/utils/least_squares.hpp"
#include "common/series_helpers.hpp"

#include <Eigen/Dense>

using namespace commodex;

TEST_CASE("ordinaryLeastSquares recovers linear coefficients", "[utils][least_squares]") {
	const int n = 200;
	const auto noise = tests::helpers::whiteNoise(n, 0.1, 11);
	Eigen::MatrixXd X(n, 2);
	Eigen::MatrixXd Y(n, 1);
	for (int i = 0; i < n; ++i) {
		const double x = static_cast<double>(i) / n;
		X(i, 0) = 1.0;
		X(i, 1) = x;
		Y(i, 0) = 2.0 + 3.0 * x + noise[static_cast<std::size_t>(i)];
	}

	const auto fit = utils::ordinaryLeastSquares(X, Y, core::Stage::ForecastModel);

	REQUIRE(fit.observations() == n);
	REQUIRE(fit.regressors() == 2);
	REQUIRE(fit.degreesOfFreedom() == n - 2);
	REQUIRE(fit.coefficients(0, 0) == Catch::Approx(2.0).margin(0.05));
	REQUIRE(fit.coefficients(1, 0) == Catch::Approx(3.0).margin(0.1));
	REQUIRE(fit.standardError(1) > 0.0);
	REQUIRE(fit.rss() == Catch::Approx(fit.residuals.squaredNorm()));
	REQUIRE(std::abs(fit.residuals.sum()) < 1e-8);
}

TEST_CASE("ordinaryLeastSquares rejects short or collinear designs", "[utils][least_squares][validation]") {
	Eigen::MatrixXd square = Eigen::MatrixXd::Identity(3, 3);
	Eigen::MatrixXd y = Eigen::MatrixXd::Ones(3, 1);
	REQUIRE_THROWS_AS(utils::ordinaryLeastSquares(square, y, core::Stage::Causality), core::InsufficientDataError);

	Eigen::MatrixXd collinear(10, 2);
	for (int i = 0; i < 10; ++i) {
		collinear(i, 0) = i;
		collinear(i, 1) = 2.0 * i;
	}
	Eigen::MatrixXd target = Eigen::MatrixXd::Ones(10, 1);
	try {
		utils::ordinaryLeastSquares(collinear, target, core::Stage::Causality);
		FAIL("expected a ModelNotApplicableError");
	} catch (const core::ModelNotApplicableError &error) {
		REQUIRE(error.stage() == core::Stage::Causality);
	}
}

TEST_CASE("autocorrelation starts at one", "[utils][least_squares]") {
	Eigen::VectorXd alternating(100);
	for (int i = 0; i < 100; ++i) {
		alternating(i) = (i % 2 == 0) ? 1.0 : -1.0;
	}
	const auto acf = utils::autocorrelation(alternating, 2);
	REQUIRE(acf.size() == 3);
	REQUIRE(acf(0) == Catch::Approx(1.0));
	REQUIRE(acf(1) < -0.9);
	REQUIRE(acf(2) > 0.9);
}
