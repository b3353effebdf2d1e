#pragma once

#include "commodex/core/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace commodex::models {
class FittedModel;
} // namespace commodex::models

namespace commodex::core {

/// One row of a variable's forecast path.
struct ForecastStep {
	int step = 0;
	double point = 0.0;
	double lower = 0.0;
	double upper = 0.0;
};

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * Values are arranged dimension-major: `point[v][h]` is variable `v` at
 * horizon step `h`. Step 0 is the last observed value with a zero-width band;
 * steps 1..horizon are model forecasts. The producing model is referenced
 * weakly for traceability only.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;
	using Matrix = std::vector<Series>;

	/// Variable names, one per dimension.
	std::vector<std::string> variables;

	/// Variable treated as the commodity price, when known.
	std::string target;

	/// Two-sided coverage of the [lower, upper] band.
	double confidence_level = 0.95;

	/// Point forecasts arranged by dimension (dimension-major).
	Matrix point;

	/// Lower bounds of the prediction intervals (dimension-major).
	Matrix lower;

	/// Upper bounds of the prediction intervals (dimension-major).
	Matrix upper;

	/// The model that produced this forecast; not owned.
	std::weak_ptr<const models::FittedModel> model;

	/// Returns whether the forecast contains any values.
	bool empty() const {
		return point.empty() || point.front().empty();
	}

	std::size_t dimensions() const {
		return point.size();
	}

	/// Returns the forecast horizon (number of steps after step 0).
	int horizon() const {
		return empty() ? 0 : static_cast<int>(point.front().size()) - 1;
	}

	std::size_t indexOf(const std::string &variable) const {
		const auto it = std::find(variables.begin(), variables.end(), variable);
		if (it == variables.end()) {
			throw InvalidInputError(Stage::ForecastModel, "Variable not present in forecast.",
			                        {{"variable", variable}});
		}
		return static_cast<std::size_t>(std::distance(variables.begin(), it));
	}

	/// Dimension of the target variable, falling back to the first dimension.
	std::size_t targetIndex() const {
		return target.empty() ? 0 : indexOf(target);
	}

	const Series &series(std::size_t dimension = 0) const {
		checkDimension(dimension);
		return point[dimension];
	}

	const Series &series(const std::string &variable) const {
		return series(indexOf(variable));
	}

	const Series &lowerSeries(std::size_t dimension = 0) const {
		checkDimension(dimension);
		return lower[dimension];
	}

	const Series &upperSeries(std::size_t dimension = 0) const {
		checkDimension(dimension);
		return upper[dimension];
	}

	double intervalWidth(std::size_t dimension, int step) const {
		checkDimension(dimension);
		const auto h = static_cast<std::size_t>(step);
		return upper[dimension].at(h) - lower[dimension].at(h);
	}

	/// The (step, point, lower, upper) rows for one variable.
	std::vector<ForecastStep> path(const std::string &variable) const {
		const std::size_t dim = indexOf(variable);
		std::vector<ForecastStep> rows;
		rows.reserve(point[dim].size());
		for (std::size_t h = 0; h < point[dim].size(); ++h) {
			rows.push_back(ForecastStep{static_cast<int>(h), point[dim][h], lower[dim][h], upper[dim][h]});
		}
		return rows;
	}

private:
	void checkDimension(std::size_t dimension) const {
		if (dimension >= point.size() || dimension >= lower.size() || dimension >= upper.size()) {
			throw InvalidInputError(Stage::ForecastModel, "Requested dimension exceeds the forecast dimensions.",
			                        {{"dimension", param(dimension)}, {"dimensions", param(point.size())}});
		}
	}
};

} // namespace commodex::core
