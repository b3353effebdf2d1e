#pragma once

#include "commodex/core/errors.hpp"

#include <Eigen/Dense>

namespace commodex::utils {

/**
 * @brief Ordinary least squares estimate of Y = X B + E for one or more targets.
 *
 * `coefficients` has one row per regressor and one column per target.
 */
struct OlsFit {
	Eigen::MatrixXd coefficients;
	Eigen::MatrixXd residuals;
	Eigen::MatrixXd xtx_inverse;

	Eigen::Index observations() const {
		return residuals.rows();
	}

	Eigen::Index regressors() const {
		return coefficients.rows();
	}

	Eigen::Index degreesOfFreedom() const {
		return observations() - regressors();
	}

	/// Residual sum of squares of target @p column.
	double rss(Eigen::Index column = 0) const {
		return residuals.col(column).squaredNorm();
	}

	/// Conventional standard error of coefficient @p row for target @p column.
	double standardError(Eigen::Index row, Eigen::Index column = 0) const;

	/// Residual cross-product divided by @p divisor.
	Eigen::MatrixXd residualCovariance(double divisor) const {
		return residuals.transpose() * residuals / divisor;
	}
};

/**
 * @brief Solves the least squares problem by column-pivoting QR.
 * @throws InsufficientDataError when there are no more rows than regressors.
 * @throws ModelNotApplicableError when the design matrix is rank deficient.
 */
OlsFit ordinaryLeastSquares(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y, core::Stage stage);

/// Sample autocorrelations at lags 0..max_lag of a residual sequence.
Eigen::VectorXd autocorrelation(const Eigen::VectorXd &values, int max_lag);

} // namespace commodex::utils
