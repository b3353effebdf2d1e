#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/analysis/cointegration.hpp"
#include "commodex/core/errors.hpp"
#include "common/series_helpers.hpp"

using namespace commodex;

TEST_CASE("Johansen detects one cointegrating relation", "[analysis][johansen]") {
	const auto series = tests::helpers::cointegratedPair(500, 21);
	const auto result = analysis::JohansenTest().run(series);

	REQUIRE(result.variables == series.variables());
	REQUIRE(result.rank == 1);
	REQUIRE(result.cointegrated());
	REQUIRE(result.eigenvalues.size() == 2);
	REQUIRE(result.eigenvalues[0] >= result.eigenvalues[1]);
	REQUIRE(result.trace_statistics[0] > result.trace_critical_values[0][1]);
	REQUIRE(result.trace_statistics[1] < result.trace_critical_values[1][1]);

	REQUIRE(result.cointegrating_vectors.size() == 1);
	REQUIRE(result.cointegrating_vectors[0][0] == Catch::Approx(1.0));
	REQUIRE(result.cointegrating_vectors[0][1] == Catch::Approx(-1.05).margin(0.02));

	const auto beta = result.beta();
	REQUIRE(beta.rows() == 2);
	REQUIRE(beta.cols() == 1);
}

TEST_CASE("Johansen finds no relation between independent walks", "[analysis][johansen]") {
	const auto a = tests::helpers::randomWalk(400, 20.0, 1.0, 31);
	const auto b = tests::helpers::randomWalk(400, 40.0, 1.0, 32);
	const auto result = analysis::JohansenTest().run(tests::helpers::makeMultivariate({"a", "b"}, {a, b}));

	REQUIRE(result.rank == 0);
	REQUIRE(result.cointegrating_vectors.empty());
	REQUIRE(result.trace_statistics[0] >= result.max_eigen_statistics[0]);
}

TEST_CASE("Johansen validates its inputs", "[analysis][johansen][validation]") {
	const auto walk = tests::helpers::randomWalk(100, 1.0, 1.0, 41);
	REQUIRE_THROWS_AS(analysis::JohansenTest().run(tests::helpers::makeMultivariate({"only"}, {walk})),
	                  core::ModelNotApplicableError);

	analysis::JohansenTest::Options options;
	options.significance = 0.2;
	REQUIRE_THROWS_AS(analysis::JohansenTest(options), core::InvalidInputError);

	const auto short_pair = tests::helpers::cointegratedPair(6, 43);
	analysis::JohansenTest::Options many_lags;
	many_lags.lag_differences = 4;
	REQUIRE_THROWS_AS(analysis::JohansenTest(many_lags).run(short_pair), core::InsufficientDataError);
}
