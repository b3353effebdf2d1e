#include "commodex/models/levels_forecast.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/distributions.hpp"

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <utility>

namespace commodex::models {

Eigen::MatrixXd companionMatrix(const std::vector<Eigen::MatrixXd> &A) {
	if (A.empty()) {
		return Eigen::MatrixXd();
	}
	const Eigen::Index k = A.front().rows();
	const auto p = static_cast<Eigen::Index>(A.size());
	Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(k * p, k * p);
	for (Eigen::Index i = 0; i < p; ++i) {
		companion.block(0, i * k, k, k) = A[static_cast<std::size_t>(i)];
	}
	if (p > 1) {
		companion.block(k, 0, k * (p - 1), k * (p - 1)).setIdentity();
	}
	return companion;
}

double maxRootModulus(const std::vector<Eigen::MatrixXd> &A) {
	if (A.empty()) {
		return 0.0;
	}
	Eigen::EigenSolver<Eigen::MatrixXd> solver(companionMatrix(A), false);
	return solver.eigenvalues().cwiseAbs().maxCoeff();
}

std::vector<Eigen::MatrixXd> maCoefficients(const std::vector<Eigen::MatrixXd> &A, int steps, Eigen::Index k) {
	std::vector<Eigen::MatrixXd> psi;
	psi.reserve(static_cast<std::size_t>(steps) + 1);
	psi.push_back(Eigen::MatrixXd::Identity(k, k));
	for (int i = 1; i <= steps; ++i) {
		Eigen::MatrixXd next = Eigen::MatrixXd::Zero(k, k);
		const int upto = std::min<int>(i, static_cast<int>(A.size()));
		for (int j = 1; j <= upto; ++j) {
			next += A[static_cast<std::size_t>(j - 1)] * psi[static_cast<std::size_t>(i - j)];
		}
		psi.push_back(std::move(next));
	}
	return psi;
}

std::vector<Eigen::MatrixXd> integrateLagPolynomial(const std::vector<Eigen::MatrixXd> &B, int d) {
	if (d == 0) {
		return B;
	}
	const Eigen::Index k = B.empty() ? 0 : B.front().rows();
	if (k == 0) {
		return B;
	}
	// Coefficients of the lag polynomial, C_0 = I.
	std::vector<Eigen::MatrixXd> poly;
	poly.push_back(Eigen::MatrixXd::Identity(k, k));
	for (const auto &b : B) {
		poly.push_back(-b);
	}
	for (int round = 0; round < d; ++round) {
		std::vector<Eigen::MatrixXd> next(poly.size() + 1, Eigen::MatrixXd::Zero(k, k));
		for (std::size_t j = 0; j < poly.size(); ++j) {
			next[j] += poly[j];
			next[j + 1] -= poly[j];
		}
		poly = std::move(next);
	}
	std::vector<Eigen::MatrixXd> levels;
	for (std::size_t j = 1; j < poly.size(); ++j) {
		levels.push_back(-poly[j]);
	}
	return levels;
}

std::vector<Eigen::MatrixXd> forecastErrorCovariance(const LevelsRepresentation &model, int horizon) {
	const Eigen::Index k = model.sigma.rows();
	const auto psi = maCoefficients(model.A, std::max(horizon - 1, 0), k);
	std::vector<Eigen::MatrixXd> mse;
	mse.reserve(static_cast<std::size_t>(std::max(horizon, 0)));
	Eigen::MatrixXd accum = Eigen::MatrixXd::Zero(k, k);
	for (int h = 1; h <= horizon; ++h) {
		const auto &p = psi[static_cast<std::size_t>(h - 1)];
		accum += p * model.sigma * p.transpose();
		mse.push_back(accum);
	}
	return mse;
}

core::Forecast levelsForecast(const LevelsRepresentation &model, const std::vector<std::string> &variables,
                              int horizon, double confidence) {
	if (horizon < 0) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Forecast horizon must be non-negative.",
		                              {{"horizon", core::param(horizon)}});
	}
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Confidence level must lie in (0, 1).",
		                              {{"confidence", core::param(confidence)}});
	}
	const Eigen::Index k = model.sigma.rows();
	const int p = model.lags();
	if (model.history.rows() < std::max(p, 1) || model.history.cols() != k) {
		throw core::InvalidInputError(core::Stage::ForecastModel, "Forecast history does not match the model.",
		                              {{"history_rows", core::param(model.history.rows())},
		                               {"lags", core::param(p)}});
	}

	// Rolling window of the latest rows; window.back() is the most recent.
	std::vector<Eigen::VectorXd> window;
	for (Eigen::Index r = 0; r < model.history.rows(); ++r) {
		window.emplace_back(model.history.row(r).transpose());
	}

	const double z = utils::distributions::normalCritical(confidence);
	const auto mse = forecastErrorCovariance(model, horizon);

	core::Forecast forecast;
	forecast.variables = variables;
	forecast.confidence_level = confidence;
	const auto steps = static_cast<std::size_t>(horizon) + 1;
	forecast.point.assign(static_cast<std::size_t>(k), std::vector<double>(steps, 0.0));
	forecast.lower = forecast.point;
	forecast.upper = forecast.point;

	const Eigen::VectorXd &last = window.back();
	for (Eigen::Index v = 0; v < k; ++v) {
		const auto dim = static_cast<std::size_t>(v);
		forecast.point[dim][0] = last(v);
		forecast.lower[dim][0] = last(v);
		forecast.upper[dim][0] = last(v);
	}

	for (int h = 1; h <= horizon; ++h) {
		Eigen::VectorXd next = model.intercept;
		for (int i = 1; i <= p; ++i) {
			next += model.A[static_cast<std::size_t>(i - 1)] * window[window.size() - static_cast<std::size_t>(i)];
		}
		window.push_back(next);

		const auto &cov = mse[static_cast<std::size_t>(h - 1)];
		for (Eigen::Index v = 0; v < k; ++v) {
			const auto dim = static_cast<std::size_t>(v);
			const auto step = static_cast<std::size_t>(h);
			const double half_width = z * std::sqrt(std::max(cov(v, v), 0.0));
			forecast.point[dim][step] = next(v);
			forecast.lower[dim][step] = next(v) - half_width;
			forecast.upper[dim][step] = next(v) + half_width;
		}
	}
	return forecast;
}

} // namespace commodex::models
