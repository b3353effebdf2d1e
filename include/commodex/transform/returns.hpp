#pragma once

#include "commodex/core/time_series.hpp"

#include <vector>

namespace commodex::transform {

/**
 * @brief Log returns r_t = log(p_t / p_{t-1}) of a price series.
 *
 * The result starts at the second timestamp, keeps the input metadata and
 * is tagged as a returns series.
 * @throws InvalidInputError for non-positive or non-finite prices.
 * @throws InsufficientDataError for fewer than two prices.
 */
core::TimeSeries logReturns(const core::TimeSeries &prices);

/// Simple returns r_t = p_t / p_{t-1} - 1, with the same preconditions as logReturns.
core::TimeSeries simpleReturns(const core::TimeSeries &prices);

/// Applies @p order rounds of first differencing.
std::vector<double> difference(const std::vector<double> &values, int order = 1);

} // namespace commodex::transform
