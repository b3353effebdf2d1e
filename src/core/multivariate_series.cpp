#include "commodex/core/multivariate_series.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <unordered_set>
#include <utility>

namespace commodex::core {

namespace {

std::vector<double> firstDifference(const std::vector<double> &values) {
	std::vector<double> result;
	if (values.size() < 2) {
		return result;
	}
	result.reserve(values.size() - 1);
	for (std::size_t i = 1; i < values.size(); ++i) {
		result.push_back(values[i] - values[i - 1]);
	}
	return result;
}

} // namespace

MultivariateSeries::MultivariateSeries(const std::vector<TimeSeries> &series, GapPolicy policy) {
	if (series.empty()) {
		throw InvalidInputError(Stage::SeriesStore, "MultivariateSeries requires at least one variable.");
	}

	variables_.reserve(series.size());
	for (const auto &entry : series) {
		variables_.push_back(entry.name());
	}

	// Union of all timestamps; each input is already strictly ordered.
	std::set<TimePoint> index;
	for (const auto &entry : series) {
		index.insert(entry.timestamps().begin(), entry.timestamps().end());
	}

	const std::size_t k = series.size();
	std::vector<std::size_t> cursor(k, 0);
	std::vector<double> last(k, 0.0);
	std::vector<bool> seen(k, false);
	columns_.assign(k, {});

	for (const auto &tp : index) {
		std::vector<double> row(k, std::numeric_limits<double>::quiet_NaN());
		bool complete = true;
		for (std::size_t j = 0; j < k; ++j) {
			const auto &ts = series[j].timestamps();
			const auto &vals = series[j].values();
			while (cursor[j] < ts.size() && ts[cursor[j]] < tp) {
				++cursor[j];
			}
			const bool present = cursor[j] < ts.size() && ts[cursor[j]] == tp && std::isfinite(vals[cursor[j]]);
			if (present) {
				row[j] = vals[cursor[j]];
				last[j] = row[j];
				seen[j] = true;
			} else if (policy == GapPolicy::ForwardFill && seen[j]) {
				row[j] = last[j];
			} else {
				complete = false;
			}
		}
		if (!complete) {
			continue;
		}
		timestamps_.push_back(tp);
		for (std::size_t j = 0; j < k; ++j) {
			columns_[j].push_back(row[j]);
		}
	}

	validate();
	if (timestamps_.empty()) {
		throw InsufficientDataError(Stage::SeriesStore, "Alignment left no complete rows.",
		                            {{"variables", param(k)},
		                             {"policy", policy == GapPolicy::InnerJoin ? "inner-join" : "forward-fill"}});
	}
}

MultivariateSeries::MultivariateSeries(std::vector<TimePoint> timestamps, std::vector<std::string> variables,
                                       std::vector<std::vector<double>> columns)
    : timestamps_(std::move(timestamps)), variables_(std::move(variables)), columns_(std::move(columns)) {
	validate();
	for (std::size_t j = 0; j < columns_.size(); ++j) {
		if (columns_[j].size() != timestamps_.size()) {
			throw InvalidInputError(Stage::SeriesStore, "Column length must match the timestamp index.",
			                        {{"variable", variables_[j]},
			                         {"rows", param(columns_[j].size())},
			                         {"timestamps", param(timestamps_.size())}});
		}
		for (double v : columns_[j]) {
			if (!std::isfinite(v)) {
				throw InvalidInputError(Stage::SeriesStore, "Aligned columns must not contain missing values.",
				                        {{"variable", variables_[j]}});
			}
		}
	}
	for (std::size_t i = 1; i < timestamps_.size(); ++i) {
		if (!(timestamps_[i] > timestamps_[i - 1])) {
			throw InvalidInputError(Stage::SeriesStore, "Timestamps must be strictly increasing and unique.",
			                        {{"index", param(i)}});
		}
	}
}

void MultivariateSeries::validate() const {
	if (variables_.empty()) {
		throw InvalidInputError(Stage::SeriesStore, "MultivariateSeries requires at least one variable.");
	}
	if (columns_.size() != variables_.size()) {
		throw InvalidInputError(Stage::SeriesStore, "Every variable needs exactly one column.",
		                        {{"variables", param(variables_.size())}, {"columns", param(columns_.size())}});
	}
	std::unordered_set<std::string> names;
	for (const auto &name : variables_) {
		if (name.empty()) {
			throw InvalidInputError(Stage::SeriesStore, "Variable names must be non-empty.");
		}
		if (!names.insert(name).second) {
			throw InvalidInputError(Stage::SeriesStore, "Variable names must be unique.", {{"variable", name}});
		}
	}
}

bool MultivariateSeries::contains(const std::string &name) const {
	return std::find(variables_.begin(), variables_.end(), name) != variables_.end();
}

std::size_t MultivariateSeries::indexOf(const std::string &name) const {
	const auto it = std::find(variables_.begin(), variables_.end(), name);
	if (it == variables_.end()) {
		throw InvalidInputError(Stage::SeriesStore, "Unknown variable.", {{"variable", name}});
	}
	return static_cast<std::size_t>(std::distance(variables_.begin(), it));
}

const std::vector<double> &MultivariateSeries::column(std::size_t index) const {
	if (index >= columns_.size()) {
		throw InvalidInputError(Stage::SeriesStore, "Column index out of range.",
		                        {{"index", param(index)}, {"dimensions", param(columns_.size())}});
	}
	return columns_[index];
}

const std::vector<double> &MultivariateSeries::column(const std::string &name) const {
	return columns_[indexOf(name)];
}

TimeSeries MultivariateSeries::series(const std::string &name) const {
	return TimeSeries(timestamps_, column(name), name, {{TimeSeries::kSeriesKindKey, TimeSeries::kKindLevels}});
}

std::vector<double> MultivariateSeries::row(std::size_t index) const {
	if (index >= size()) {
		throw InvalidInputError(Stage::SeriesStore, "Row index out of range.",
		                        {{"index", param(index)}, {"rows", param(size())}});
	}
	std::vector<double> values;
	values.reserve(columns_.size());
	for (const auto &col : columns_) {
		values.push_back(col[index]);
	}
	return values;
}

std::vector<double> MultivariateSeries::lastRow() const {
	if (isEmpty()) {
		throw InsufficientDataError(Stage::SeriesStore, "MultivariateSeries is empty.");
	}
	return row(size() - 1);
}

Eigen::MatrixXd MultivariateSeries::matrix() const {
	Eigen::MatrixXd data(static_cast<Eigen::Index>(size()), static_cast<Eigen::Index>(dimensions()));
	for (std::size_t j = 0; j < columns_.size(); ++j) {
		for (std::size_t t = 0; t < columns_[j].size(); ++t) {
			data(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(j)) = columns_[j][t];
		}
	}
	return data;
}

MultivariateSeries MultivariateSeries::select(const std::vector<std::string> &names) const {
	if (names.empty()) {
		throw InvalidInputError(Stage::SeriesStore, "Selection must name at least one variable.");
	}
	std::vector<std::vector<double>> selected;
	selected.reserve(names.size());
	for (const auto &name : names) {
		selected.push_back(column(name));
	}
	return MultivariateSeries(timestamps_, names, std::move(selected));
}

MultivariateSeries MultivariateSeries::differenced(int order) const {
	if (order < 0) {
		throw InvalidInputError(Stage::SeriesStore, "Differencing order must be non-negative.",
		                        {{"order", param(order)}});
	}
	if (order == 0) {
		return *this;
	}
	if (size() <= static_cast<std::size_t>(order)) {
		throw InsufficientDataError(Stage::SeriesStore, "Insufficient data length for requested differencing order.",
		                            {{"order", param(order)}, {"rows", param(size())}});
	}
	std::vector<std::vector<double>> diffed = columns_;
	for (int round = 0; round < order; ++round) {
		for (auto &col : diffed) {
			col = firstDifference(col);
		}
	}
	std::vector<TimePoint> ts(timestamps_.begin() + order, timestamps_.end());
	return MultivariateSeries(std::move(ts), variables_, std::move(diffed));
}

MultivariateSeries MultivariateSeries::tail(std::size_t count) const {
	const std::size_t n = std::min(count, size());
	const auto offset = static_cast<std::ptrdiff_t>(size() - n);
	std::vector<std::vector<double>> cols;
	cols.reserve(columns_.size());
	for (const auto &col : columns_) {
		cols.emplace_back(col.begin() + offset, col.end());
	}
	return MultivariateSeries(std::vector<TimePoint>(timestamps_.begin() + offset, timestamps_.end()), variables_,
	                          std::move(cols));
}

} // namespace commodex::core
