#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/core/time_series.hpp"
#include "common/series_helpers.hpp"

#include <chrono>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using commodex::core::EngineError;
using commodex::core::InsufficientDataError;
using commodex::core::InvalidInputError;
using commodex::core::Stage;
using commodex::core::TimeSeries;

TEST_CASE("TimeSeries constructs univariate data", "[core][time_series]") {
	auto series = tests::helpers::makeSeries("copper", {1.0, 2.0, 3.0});

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.isEmpty());
	REQUIRE(series.name() == "copper");
	REQUIRE(series.values()[1] == Catch::Approx(2.0));
	REQUIRE(series.lastValue() == Catch::Approx(3.0));
	REQUIRE(series.metadataValue("source").empty());

	const auto tagged = series.withMetadata(TimeSeries::kSeriesKindKey, TimeSeries::kKindReturns);
	REQUIRE(tagged.metadataValue(TimeSeries::kSeriesKindKey) == "returns");
	REQUIRE(series.metadataValue(TimeSeries::kSeriesKindKey).empty());
}

TEST_CASE("TimeSeries rejects unordered and duplicate timestamps", "[core][time_series][validation]") {
	auto timestamps = tests::helpers::makeTimestamps(3);
	std::swap(timestamps[0], timestamps[1]);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, {1.0, 2.0, 3.0}), InvalidInputError);

	auto duplicated = tests::helpers::makeTimestamps(3);
	duplicated[2] = duplicated[1];
	REQUIRE_THROWS_AS(TimeSeries(duplicated, {1.0, 2.0, 3.0}), InvalidInputError);

	REQUIRE_THROWS_AS(TimeSeries(tests::helpers::makeTimestamps(2), {1.0, 2.0, 3.0}), InvalidInputError);
}

TEST_CASE("TimeSeries errors carry stage and parameters", "[core][time_series][errors]") {
	try {
		TimeSeries(tests::helpers::makeTimestamps(2), {1.0}, "gold");
		FAIL("expected an InvalidInputError");
	} catch (const EngineError &error) {
		REQUIRE(error.stage() == Stage::SeriesStore);
		REQUIRE(error.parameters().at("series") == "gold");
		REQUIRE(error.parameters().at("values") == "1");
		REQUIRE(std::string(error.what()).find("[series-store]") == 0);
	}
}

TEST_CASE("TimeSeries slices and sanitizes", "[core][time_series]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	auto series = tests::helpers::makeSeries("oil", {nan, 2.0, nan, 4.0});

	REQUIRE(series.hasMissingValues());
	REQUIRE_THROWS_AS(series.sanitized(), InvalidInputError);

	const auto dropped = series.sanitized(TimeSeries::MissingValuePolicy::Drop);
	REQUIRE(dropped.values() == std::vector<double>{2.0, 4.0});

	const auto filled = series.sanitized(TimeSeries::MissingValuePolicy::ForwardFill);
	REQUIRE(filled.values() == std::vector<double>{2.0, 2.0, 4.0});
	REQUIRE(filled.timestamps().front() == series.timestamps()[1]);

	const auto sliced = series.slice(1, 3);
	REQUIRE(sliced.size() == 2);
	REQUIRE(sliced.values()[0] == Catch::Approx(2.0));
	REQUIRE_THROWS_AS(series.slice(3, 5), InvalidInputError);
}

TEST_CASE("Empty TimeSeries has no last value", "[core][time_series][edge]") {
	TimeSeries empty({}, {}, "empty");
	REQUIRE(empty.isEmpty());
	REQUIRE_THROWS_AS(empty.lastValue(), InsufficientDataError);
}
