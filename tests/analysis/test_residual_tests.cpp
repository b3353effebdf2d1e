#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/analysis/residual_tests.hpp"
#include "common/series_helpers.hpp"

#include <Eigen/Dense>

using namespace commodex;

namespace {

Eigen::VectorXd toVector(const std::vector<double> &values) {
	return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

} // namespace

TEST_CASE("Ljung-Box separates white noise from persistent series", "[analysis][residuals]") {
	const auto white = analysis::ljungBox(toVector(tests::helpers::whiteNoise(500, 1.0, 71)), 10);
	REQUIRE(white.lags == 10);
	REQUIRE(white.p_value > 0.01);

	const auto persistent = analysis::ljungBox(toVector(tests::helpers::ar1(500, 0.8, 1.0, 72)), 10);
	REQUIRE(persistent.statistic > white.statistic);
	REQUIRE(persistent.p_value < 1e-6);

	const auto clipped = analysis::ljungBox(Eigen::VectorXd::Ones(3), 10);
	REQUIRE(clipped.lags == 2);
}

TEST_CASE("Jarque-Bera flags heavy tails", "[analysis][residuals]") {
	const auto normal = analysis::jarqueBera(toVector(tests::helpers::whiteNoise(2000, 1.0, 73)));
	REQUIRE(normal.kurtosis == Catch::Approx(3.0).margin(0.3));
	REQUIRE(normal.p_value > 0.001);

	Eigen::VectorXd spiky = toVector(tests::helpers::whiteNoise(500, 1.0, 74));
	for (Eigen::Index i = 0; i < spiky.size(); i += 50) {
		spiky(i) *= 12.0;
	}
	const auto heavy = analysis::jarqueBera(spiky);
	REQUIRE(heavy.kurtosis > 5.0);
	REQUIRE(heavy.p_value < 1e-6);

	const auto degenerate = analysis::jarqueBera(Eigen::VectorXd::Constant(10, 2.0));
	REQUIRE(degenerate.p_value == 1.0);
}
