#pragma once

#include <optional>
#include <vector>

namespace commodex::utils {

/// In-sample fit measures reported per equation and used to weight forecast ensembles.
class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Coefficient of determination; empty for a constant actual series.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace commodex::utils
