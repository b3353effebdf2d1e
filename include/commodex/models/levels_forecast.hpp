#pragma once

#include "commodex/core/forecast.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace commodex::models {

/**
 * @brief A VAR in levels: y_t = c + sum_i A_i y_{t-i} + u_t, Cov(u_t) = sigma.
 *
 * VAR on differences and VECM both map onto this form for forecasting.
 * `history` holds the last lags() observed rows, oldest first.
 */
struct LevelsRepresentation {
	std::vector<Eigen::MatrixXd> A;
	Eigen::VectorXd intercept;
	Eigen::MatrixXd sigma;
	Eigen::MatrixXd history;

	int lags() const {
		return static_cast<int>(A.size());
	}
};

/// Companion matrix of the lag polynomial sum_i A_i L^i.
Eigen::MatrixXd companionMatrix(const std::vector<Eigen::MatrixXd> &A);

/// Largest modulus among the companion eigenvalues (0 for an empty polynomial).
double maxRootModulus(const std::vector<Eigen::MatrixXd> &A);

/// Moving-average matrices Psi_0..Psi_steps (Psi_0 = I).
std::vector<Eigen::MatrixXd> maCoefficients(const std::vector<Eigen::MatrixXd> &A, int steps, Eigen::Index k);

/**
 * @brief Levels of a VAR fitted on d-th differences.
 *
 * Multiplies (I - sum_i B_i L^i) by (1 - L)^d and returns the resulting
 * level coefficients A_1..A_{p+d}.
 */
std::vector<Eigen::MatrixXd> integrateLagPolynomial(const std::vector<Eigen::MatrixXd> &B, int d);

/**
 * @brief Iterated forecast with horizon-dependent bands.
 *
 * Step 0 repeats the last observed row with zero width. Step h uses
 * MSE(h) = sum_{i<h} Psi_i sigma Psi_i'.
 */
core::Forecast levelsForecast(const LevelsRepresentation &model, const std::vector<std::string> &variables,
                              int horizon, double confidence);

/// Forecast-error covariance matrices for steps 1..horizon.
std::vector<Eigen::MatrixXd> forecastErrorCovariance(const LevelsRepresentation &model, int horizon);

} // namespace commodex::models
