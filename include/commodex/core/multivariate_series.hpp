#pragma once

#include "commodex/core/config.hpp"
#include "commodex/core/time_series.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace commodex::core {

/**
 * @class MultivariateSeries
 * @brief Named variables aligned to one common, strictly increasing timestamp index.
 *
 * Alignment happens once, at construction, according to a GapPolicy. After
 * that every row holds a finite value for every variable, so nothing
 * downstream has to deal with missingness. Instances are immutable snapshots
 * and safe to share across concurrent readers.
 */
class MultivariateSeries {
public:
	using TimePoint = TimeSeries::TimePoint;

	/**
	 * @brief Aligns the given series.
	 * @param series Input variables; names must be unique and non-empty.
	 * @param policy InnerJoin keeps timestamps present in every variable; ForwardFill
	 *               carries the last value over the union of timestamps.
	 * @throws InvalidInputError on empty input or duplicate names.
	 * @throws InsufficientDataError when alignment leaves no rows.
	 */
	explicit MultivariateSeries(const std::vector<TimeSeries> &series, GapPolicy policy = GapPolicy::InnerJoin);

	/// Builds directly from already-aligned columns.
	MultivariateSeries(std::vector<TimePoint> timestamps, std::vector<std::string> variables,
	                   std::vector<std::vector<double>> columns);

	const std::vector<std::string> &variables() const {
		return variables_;
	}

	std::size_t dimensions() const {
		return variables_.size();
	}

	std::size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return timestamps_.empty();
	}

	const std::vector<TimePoint> &timestamps() const {
		return timestamps_;
	}

	bool contains(const std::string &name) const;

	/// Column position of @p name. Throws InvalidInputError when absent.
	std::size_t indexOf(const std::string &name) const;

	const std::vector<double> &column(std::size_t index) const;
	const std::vector<double> &column(const std::string &name) const;

	/// Column as a standalone TimeSeries tagged as price levels.
	TimeSeries series(const std::string &name) const;

	std::vector<double> row(std::size_t index) const;
	std::vector<double> lastRow() const;

	/// T x k matrix with one column per variable.
	Eigen::MatrixXd matrix() const;

	/// Subset of variables in the requested order.
	MultivariateSeries select(const std::vector<std::string> &names) const;

	/// Applies @p order rounds of first differencing to every column.
	MultivariateSeries differenced(int order) const;

	/// The last @p count rows.
	MultivariateSeries tail(std::size_t count) const;

private:
	void validate() const;

	std::vector<TimePoint> timestamps_;
	std::vector<std::string> variables_;
	std::vector<std::vector<double>> columns_;
};

} // namespace commodex::core
