#pragma once

#include "commodex/core/errors.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace commodex::core {

/**
 * @class TimeSeries
 * @brief An immutable, ordered sequence of (timestamp, value) observations for one variable.
 *
 * Timestamps and values are stored in separate vectors for cache-efficient
 * numerical processing. Timestamps are strictly increasing; construction
 * fails otherwise.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;
	using Metadata = std::unordered_map<std::string, std::string>;

	/// Metadata key describing what the values represent ("levels" or "returns").
	static constexpr const char *kSeriesKindKey = "series_kind";
	static constexpr const char *kKindLevels = "levels";
	static constexpr const char *kKindReturns = "returns";

	enum class MissingValuePolicy {
		Error,
		Drop,
		ForwardFill
	};

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of time points.
	 * @param values A vector of corresponding values.
	 * @param name Variable name.
	 * @param metadata Free-form string annotations.
	 * @throws InvalidInputError If the sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string name = {},
	           Metadata metadata = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), name_(std::move(name)),
	      metadata_(std::move(metadata)) {
		if (timestamps_.size() != values_.size()) {
			throw InvalidInputError(Stage::SeriesStore, "Timestamps and values vectors must have the same size.",
			                        {{"series", name_},
			                         {"timestamps", param(timestamps_.size())},
			                         {"values", param(values_.size())}});
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &timestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &values() const {
		return values_;
	}

	const std::string &name() const {
		return name_;
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	/// Returns the metadata value for @p key, or an empty string.
	std::string metadataValue(const std::string &key) const {
		const auto it = metadata_.find(key);
		return it == metadata_.end() ? std::string{} : it->second;
	}

	/// Copy of this series with @p key set to @p value.
	TimeSeries withMetadata(const std::string &key, std::string value) const {
		Metadata updated = metadata_;
		updated[key] = std::move(value);
		return TimeSeries(timestamps_, values_, name_, std::move(updated));
	}

	/// Copy of this series under a different name.
	TimeSeries renamed(std::string name) const {
		return TimeSeries(timestamps_, values_, std::move(name), metadata_);
	}

	/**
	 * @brief Gets the number of data points in the series.
	 */
	std::size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	Value lastValue() const {
		if (values_.empty()) {
			throw InsufficientDataError(Stage::SeriesStore, "TimeSeries is empty.", {{"series", name_}});
		}
		return values_.back();
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end || end > size()) {
			throw InvalidInputError(Stage::SeriesStore, "Slice bounds are out of range.",
			                        {{"series", name_},
			                         {"start", param(start)},
			                         {"end", param(end)},
			                         {"size", param(size())}});
		}
		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));
		return TimeSeries(std::move(sliced_timestamps), std::move(sliced_values), name_, metadata_);
	}

	bool hasMissingValues() const {
		for (double v : values_) {
			if (!std::isfinite(v)) {
				return true;
			}
		}
		return false;
	}

	TimeSeries sanitized(MissingValuePolicy policy = MissingValuePolicy::Error) const {
		switch (policy) {
		case MissingValuePolicy::Error:
			if (hasMissingValues()) {
				throw InvalidInputError(Stage::SeriesStore, "TimeSeries contains non-finite values.",
				                        {{"series", name_}});
			}
			return *this;
		case MissingValuePolicy::Drop:
			return sanitizedDrop();
		case MissingValuePolicy::ForwardFill:
			return sanitizedForwardFill();
		default:
			throw InvalidInputError(Stage::SeriesStore, "Unsupported missing value policy.", {{"series", name_}});
		}
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw InvalidInputError(Stage::SeriesStore,
				                        "TimeSeries timestamps must be strictly increasing and unique.",
				                        {{"series", name_}, {"index", param(i)}});
			}
		}
	}

	TimeSeries sanitizedDrop() const {
		std::vector<TimePoint> kept_timestamps;
		std::vector<Value> kept_values;
		kept_timestamps.reserve(size());
		kept_values.reserve(size());
		for (std::size_t i = 0; i < size(); ++i) {
			if (std::isfinite(values_[i])) {
				kept_timestamps.push_back(timestamps_[i]);
				kept_values.push_back(values_[i]);
			}
		}
		return TimeSeries(std::move(kept_timestamps), std::move(kept_values), name_, metadata_);
	}

	// Leading non-finite values have nothing to carry forward and are dropped.
	TimeSeries sanitizedForwardFill() const {
		std::vector<TimePoint> kept_timestamps;
		std::vector<Value> kept_values;
		kept_timestamps.reserve(size());
		kept_values.reserve(size());
		bool has_last = false;
		double last = 0.0;
		for (std::size_t i = 0; i < size(); ++i) {
			if (std::isfinite(values_[i])) {
				last = values_[i];
				has_last = true;
			}
			if (has_last) {
				kept_timestamps.push_back(timestamps_[i]);
				kept_values.push_back(last);
			}
		}
		return TimeSeries(std::move(kept_timestamps), std::move(kept_values), name_, metadata_);
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string name_;
	Metadata metadata_;
};

} // namespace commodex::core
