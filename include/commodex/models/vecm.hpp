#pragma once

#include "commodex/analysis/cointegration.hpp"
#include "commodex/core/multivariate_series.hpp"
#include "commodex/models/levels_forecast.hpp"
#include "commodex/models/model_capability.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace commodex::models {

struct VecmOptions {
	std::optional<int> lag_differences; // defaults to the cointegration test's setting
	double stability_tolerance = 1e-6;
	int diagnostic_lags = 10;

	void validate() const;
};

/**
 * @class VecmModel
 * @brief Vector error correction model with cointegrating vectors taken from a
 * Johansen result.
 *
 * dy_t = alpha * beta' y_{t-1} + sum_i Gamma_i dy_{t-i} + c + u_t, estimated by
 * least squares given beta.
 */
class VecmModel final : public IFittedModel {
public:
	/**
	 * @throws ModelNotApplicableError when the cointegration rank is 0.
	 * @throws InvalidInputError when the result describes different variables.
	 * @throws InsufficientDataError when the regression has too few rows.
	 */
	static VecmModel fit(const core::MultivariateSeries &series, const analysis::CointegrationResult &cointegration,
	                     const VecmOptions &options = {});

	ModelKind kind() const override {
		return ModelKind::VECM;
	}

	const std::vector<std::string> &variables() const override {
		return variables_;
	}

	const ModelDiagnostics &diagnostics() const override {
		return diagnostics_;
	}

	/// @throws UnstableModelError when the level companion has explosive roots.
	core::Forecast forecast(int horizon, double confidence) const override;

	std::string describe() const override;

	int rank() const {
		return static_cast<int>(beta_.cols());
	}

	int lagDifferences() const {
		return static_cast<int>(gamma_.size());
	}

	/// k x r loading matrix.
	const Eigen::MatrixXd &alpha() const {
		return alpha_;
	}

	/// k x r cointegrating vectors.
	const Eigen::MatrixXd &beta() const {
		return beta_;
	}

	const std::vector<Eigen::MatrixXd> &gamma() const {
		return gamma_;
	}

	const Eigen::VectorXd &intercept() const {
		return intercept_;
	}

	const Eigen::MatrixXd &residualCovariance() const {
		return sigma_;
	}

	/// Long-run impact matrix alpha * beta'.
	Eigen::MatrixXd pi() const {
		return alpha_ * beta_.transpose();
	}

	bool isStable() const {
		return diagnostics_.stable;
	}

	std::vector<Eigen::MatrixXd> impulseResponse(int steps, bool orthogonalized = false) const;

	std::vector<Eigen::MatrixXd> forecastErrorCovariance(int horizon) const;

	const LevelsRepresentation &levels() const {
		return levels_;
	}

private:
	VecmModel() = default;

	std::vector<std::string> variables_;
	Eigen::MatrixXd alpha_;
	Eigen::MatrixXd beta_;
	std::vector<Eigen::MatrixXd> gamma_;
	Eigen::VectorXd intercept_;
	Eigen::MatrixXd sigma_;
	double stability_tolerance_ = 1e-6;
	LevelsRepresentation levels_;
	ModelDiagnostics diagnostics_;
};

} // namespace commodex::models
