#include "commodex/utils/least_squares.hpp"

#include <cmath>
#include <limits>

namespace commodex::utils {

double OlsFit::standardError(Eigen::Index row, Eigen::Index column) const {
	const auto dof = degreesOfFreedom();
	if (dof <= 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double sigma2 = rss(column) / static_cast<double>(dof);
	return std::sqrt(sigma2 * xtx_inverse(row, row));
}

OlsFit ordinaryLeastSquares(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y, core::Stage stage) {
	if (X.rows() != Y.rows()) {
		throw core::InvalidInputError(stage, "Regressor and target row counts differ.",
		                              {{"regressor_rows", core::param(X.rows())},
		                               {"target_rows", core::param(Y.rows())}});
	}
	if (X.rows() <= X.cols()) {
		throw core::InsufficientDataError(stage, "Not enough observations for the regression.",
		                                  {{"observations", core::param(X.rows())},
		                                   {"regressors", core::param(X.cols())}});
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (qr.rank() < X.cols()) {
		throw core::ModelNotApplicableError(stage, "Design matrix is rank deficient (constant or collinear input).",
		                                    {{"rank", core::param(qr.rank())}, {"regressors", core::param(X.cols())}});
	}

	OlsFit fit;
	fit.coefficients = qr.solve(Y);
	fit.residuals = Y - X * fit.coefficients;
	fit.xtx_inverse = (X.transpose() * X).ldlt().solve(Eigen::MatrixXd::Identity(X.cols(), X.cols()));
	return fit;
}

Eigen::VectorXd autocorrelation(const Eigen::VectorXd &values, int max_lag) {
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(max_lag + 1);
	const Eigen::Index n = values.size();
	if (n == 0) {
		return acf;
	}
	const Eigen::VectorXd centered = values.array() - values.mean();
	const double variance = centered.squaredNorm();
	if (variance == 0.0) {
		return acf;
	}
	acf[0] = 1.0;
	for (int lag = 1; lag <= max_lag && lag < n; ++lag) {
		acf[lag] = centered.tail(n - lag).dot(centered.head(n - lag)) / variance;
	}
	return acf;
}

} // namespace commodex::utils
