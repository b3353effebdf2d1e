#pragma once

#include "commodex/core/multivariate_series.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace commodex::analysis {

/**
 * @struct CointegrationResult
 * @brief Johansen rank test outcome.
 *
 * Eigenvalues and statistics are sorted in descending eigenvalue order.
 * Critical value rows correspond to the null hypotheses r = 0..k-1, with
 * columns for the 90%, 95% and 99% levels.
 */
struct CointegrationResult {
	std::vector<std::string> variables;
	int rank = 0;
	int lag_differences = 1;
	double significance = 0.05;
	std::vector<double> eigenvalues;
	std::vector<double> trace_statistics;
	std::vector<double> max_eigen_statistics;
	std::vector<std::vector<double>> trace_critical_values;
	std::vector<std::vector<double>> max_eigen_critical_values;

	/// The first `rank` eigenvectors, normalized so their first component is 1.
	std::vector<std::vector<double>> cointegrating_vectors;

	/// All eigenvectors, normalized the same way, as columns.
	Eigen::MatrixXd eigenvectors;

	/// k x rank matrix holding the cointegrating vectors as columns.
	Eigen::MatrixXd beta() const;

	bool cointegrated() const {
		return rank > 0;
	}
};

/**
 * @brief Johansen trace test with an unrestricted constant.
 */
class JohansenTest {
public:
	struct Options {
		int lag_differences = 1; // lagged differences in the auxiliary regressions
		double significance = 0.05; // one of 0.10, 0.05, 0.01

		void validate() const;
	};

	JohansenTest() = default;
	explicit JohansenTest(Options options);

	/**
	 * @throws ModelNotApplicableError for fewer than 2 or more than 12 variables.
	 * @throws InsufficientDataError when the series is too short for the lag.
	 */
	CointegrationResult run(const core::MultivariateSeries &series) const;

	const Options &options() const {
		return options_;
	}

	static constexpr int kMaxVariables = 12;

private:
	Options options_;
};

} // namespace commodex::analysis
