#include <catch2/catch_test_macros.hpp>

#include "commodex/analysis/stationarity.hpp"
#include "commodex/core/errors.hpp"
#include "common/series_helpers.hpp"

#include <vector>

using namespace commodex;
using analysis::StationarityAnalyzer;

TEST_CASE("StationarityAnalyzer classifies each variable", "[analysis][stationarity]") {
	const auto noise = tests::helpers::whiteNoise(300, 1.0, 51);
	const auto walk = tests::helpers::randomWalk(300, 10.0, 1.0, 52);
	const auto series = tests::helpers::makeMultivariate({"noise", "walk"}, {noise, walk});

	const StationarityAnalyzer analyzer;
	const auto report = analyzer.analyze(series);

	REQUIRE(report.entries.size() == 2);
	REQUIRE(report.entry("noise").stationary);
	REQUIRE(report.entry("noise").differencing_order == 0);
	REQUIRE_FALSE(report.entry("walk").stationary);
	REQUIRE(report.entry("walk").differencing_order == 1);
	REQUIRE_FALSE(report.allStationary());
	REQUIRE_FALSE(report.allNonStationary());
	REQUIRE(report.maxDifferencingOrder() == 1);
	REQUIRE_THROWS_AS(report.entry("missing"), core::InvalidInputError);
}

TEST_CASE("StationarityAnalyzer suggests second differences for I(2) data", "[analysis][stationarity]") {
	const auto walk = tests::helpers::randomWalk(300, 0.0, 1.0, 53);
	std::vector<double> integrated(walk.size());
	double level = 0.0;
	for (std::size_t i = 0; i < walk.size(); ++i) {
		level += walk[i];
		integrated[i] = level;
	}
	const auto entry = StationarityAnalyzer().test("i2", integrated);
	REQUIRE_FALSE(entry.stationary);
	REQUIRE(entry.differencing_order == 2);
}

TEST_CASE("StationarityAnalyzer treats a constant series as stationary", "[analysis][stationarity][edge]") {
	const auto entry = StationarityAnalyzer().test("flat", std::vector<double>(50, 3.0));
	REQUIRE(entry.stationary);
	REQUIRE(entry.differencing_order == 0);
}

TEST_CASE("StationarityAnalyzer classifies deterministic trends without a regression",
          "[analysis][stationarity][edge]") {
	std::vector<double> line(120);
	std::vector<double> parabola(120);
	for (std::size_t t = 0; t < line.size(); ++t) {
		const double x = static_cast<double>(t);
		line[t] = 5.0 + 0.25 * x;
		parabola[t] = 1.0 + 0.5 * x + 0.01 * x * x;
	}
	const auto series = tests::helpers::makeMultivariate(
	    {"line", "parabola", "noise"}, {line, parabola, tests::helpers::whiteNoise(120, 1.0, 55)});

	const auto report = StationarityAnalyzer().analyze(series);
	REQUIRE_FALSE(report.entry("line").stationary);
	REQUIRE(report.entry("line").differencing_order == 1);
	REQUIRE(report.entry("line").p_value == 1.0);
	REQUIRE_FALSE(report.entry("parabola").stationary);
	REQUIRE(report.entry("parabola").differencing_order == 2);
	REQUIRE(report.entry("noise").stationary);
}

TEST_CASE("StationarityAnalyzer enforces the minimum observation count", "[analysis][stationarity][validation]") {
	StationarityAnalyzer::Options options;
	options.min_observations = 40;
	const StationarityAnalyzer analyzer(options);
	const auto series = tests::helpers::makeMultivariate({"x"}, {tests::helpers::whiteNoise(39, 1.0, 54)});
	REQUIRE_THROWS_AS(analyzer.analyze(series), core::InsufficientDataError);

	StationarityAnalyzer::Options invalid;
	invalid.min_observations = 5;
	invalid.max_lag_order = 5;
	REQUIRE_THROWS_AS(StationarityAnalyzer(invalid), core::InvalidInputError);
}

TEST_CASE("Cointegration runs only on non-stationary variables", "[analysis][stationarity][cointegration]") {
	const StationarityAnalyzer analyzer;

	const auto pair = tests::helpers::cointegratedPair(500, 55);
	const auto report = analyzer.analyze(pair);
	REQUIRE(report.allNonStationary());
	const auto result = analyzer.cointegration(pair, report);
	REQUIRE(result.rank == 1);

	const auto mixed = tests::helpers::makeMultivariate(
	    {"noise", "walk"}, {tests::helpers::whiteNoise(300, 1.0, 56), tests::helpers::randomWalk(300, 1.0, 1.0, 57)});
	REQUIRE_THROWS_AS(analyzer.cointegration(mixed, analyzer.analyze(mixed)), core::ModelNotApplicableError);

	const auto single = pair.select({"y"});
	REQUIRE_THROWS_AS(analyzer.cointegration(single, analyzer.analyze(single)), core::ModelNotApplicableError);
}
