#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "commodex/core/errors.hpp"
#include "commodex/core/multivariate_series.hpp"
#include "common/series_helpers.hpp"

#include <limits>
#include <utility>
#include <vector>

using commodex::core::GapPolicy;
using commodex::core::InsufficientDataError;
using commodex::core::InvalidInputError;
using commodex::core::MultivariateSeries;
using commodex::core::TimeSeries;

namespace {

TimeSeries seriesAt(const std::string &name, const std::vector<std::size_t> &days, std::vector<double> values) {
	const auto all = tests::helpers::makeTimestamps(10);
	std::vector<TimeSeries::TimePoint> timestamps;
	for (auto day : days) {
		timestamps.push_back(all[day]);
	}
	return TimeSeries(std::move(timestamps), std::move(values), name);
}

} // namespace

TEST_CASE("MultivariateSeries inner join keeps common timestamps", "[core][multivariate]") {
	auto a = seriesAt("a", {0, 1, 2, 3}, {1.0, 2.0, 3.0, 4.0});
	auto b = seriesAt("b", {1, 3, 4}, {10.0, 30.0, 40.0});

	MultivariateSeries aligned({a, b}, GapPolicy::InnerJoin);

	REQUIRE(aligned.dimensions() == 2);
	REQUIRE(aligned.size() == 2);
	REQUIRE(aligned.column("a") == std::vector<double>{2.0, 4.0});
	REQUIRE(aligned.column("b") == std::vector<double>{10.0, 30.0});
	REQUIRE(aligned.lastRow() == std::vector<double>{4.0, 30.0});
}

TEST_CASE("MultivariateSeries forward fill carries values over the union", "[core][multivariate]") {
	auto a = seriesAt("a", {0, 1, 2, 3}, {1.0, 2.0, 3.0, 4.0});
	auto b = seriesAt("b", {1, 3, 4}, {10.0, 30.0, 40.0});

	MultivariateSeries aligned({a, b}, GapPolicy::ForwardFill);

	// Day 0 is dropped: b has nothing to carry yet.
	REQUIRE(aligned.size() == 4);
	REQUIRE(aligned.column("a") == std::vector<double>{2.0, 3.0, 4.0, 4.0});
	REQUIRE(aligned.column("b") == std::vector<double>{10.0, 10.0, 30.0, 40.0});
}

TEST_CASE("MultivariateSeries treats non-finite values as gaps", "[core][multivariate][edge]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	auto a = seriesAt("a", {0, 1, 2}, {1.0, nan, 3.0});
	auto b = seriesAt("b", {0, 1, 2}, {5.0, 6.0, 7.0});

	MultivariateSeries inner({a, b});
	REQUIRE(inner.size() == 2);

	MultivariateSeries filled({a, b}, GapPolicy::ForwardFill);
	REQUIRE(filled.column("a") == std::vector<double>{1.0, 1.0, 3.0});
}

TEST_CASE("MultivariateSeries validates names and alignment", "[core][multivariate][validation]") {
	auto a = seriesAt("a", {0, 1}, {1.0, 2.0});
	auto disjoint = seriesAt("b", {5, 6}, {1.0, 2.0});

	REQUIRE_THROWS_AS(MultivariateSeries({a, a}), InvalidInputError);
	REQUIRE_THROWS_AS(MultivariateSeries({a.renamed("")}), InvalidInputError);
	REQUIRE_THROWS_AS(MultivariateSeries(std::vector<TimeSeries>{}), InvalidInputError);
	REQUIRE_THROWS_AS(MultivariateSeries({a, disjoint}), InsufficientDataError);

	REQUIRE_THROWS_AS(tests::helpers::makeMultivariate({"x"}, {{1.0, std::numeric_limits<double>::infinity()}}),
	                  InvalidInputError);
}

TEST_CASE("MultivariateSeries selection, differencing and tail", "[core][multivariate]") {
	auto series = tests::helpers::makeMultivariate({"x", "y", "z"}, {{1.0, 2.0, 4.0, 7.0},
	                                                                  {0.0, 0.0, 1.0, 1.0},
	                                                                  {5.0, 5.0, 5.0, 5.0}});

	const auto selected = series.select({"z", "x"});
	REQUIRE(selected.variables() == std::vector<std::string>{"z", "x"});
	REQUIRE(selected.column(1) == series.column("x"));
	REQUIRE_THROWS_AS(series.select({"missing"}), InvalidInputError);

	const auto diffed = series.differenced(1);
	REQUIRE(diffed.size() == 3);
	REQUIRE(diffed.column("x") == std::vector<double>{1.0, 2.0, 3.0});
	REQUIRE(diffed.timestamps().front() == series.timestamps()[1]);

	const auto second = series.differenced(2);
	REQUIRE(second.column("x") == std::vector<double>{1.0, 1.0});
	REQUIRE_THROWS_AS(series.differenced(4), InsufficientDataError);

	const auto last_two = series.tail(2);
	REQUIRE(last_two.column("x") == std::vector<double>{4.0, 7.0});

	const auto matrix = series.matrix();
	REQUIRE(matrix.rows() == 4);
	REQUIRE(matrix.cols() == 3);
	REQUIRE(matrix(3, 0) == Catch::Approx(7.0));

	const auto levels = series.series("y");
	REQUIRE(levels.metadataValue(TimeSeries::kSeriesKindKey) == TimeSeries::kKindLevels);
}
