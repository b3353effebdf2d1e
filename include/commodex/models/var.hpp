#pragma once

#include "commodex/core/config.hpp"
#include "commodex/core/multivariate_series.hpp"
#include "commodex/models/levels_forecast.hpp"
#include "commodex/models/model_capability.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace commodex::models {

struct VarOptions {
	int max_lag = 5;
	core::InformationCriterion criterion = core::InformationCriterion::AIC;
	std::optional<int> fixed_lag; // skips the lag search when set
	int differencing_order = 0;   // fit on d-th differences, forecast in levels
	double stability_tolerance = 1e-6;
	int diagnostic_lags = 10;

	void validate() const;
};

/// Information criterion values for one candidate lag.
struct LagSelectionEntry {
	int lag = 0;
	double aic = 0.0;
	double bic = 0.0;
	double hqic = 0.0;
};

/**
 * @class VarModel
 * @brief Vector autoregression with intercept estimated by least squares.
 *
 * Coefficients describe the (possibly differenced) series the model was fitted
 * on; forecasts are always reported in levels.
 */
class VarModel final : public IFittedModel {
public:
	/**
	 * @brief Selects the lag order and estimates the model.
	 * @throws InsufficientDataError when max_lag leaves too few rows.
	 */
	static VarModel fit(const core::MultivariateSeries &series, const VarOptions &options = {});

	ModelKind kind() const override {
		return ModelKind::VAR;
	}

	const std::vector<std::string> &variables() const override {
		return variables_;
	}

	const ModelDiagnostics &diagnostics() const override {
		return diagnostics_;
	}

	/// @throws UnstableModelError when a companion root lies outside the unit circle.
	core::Forecast forecast(int horizon, double confidence) const override;

	std::string describe() const override;

	int lagOrder() const {
		return static_cast<int>(coefficients_.size());
	}

	int differencingOrder() const {
		return differencing_order_;
	}

	core::InformationCriterion criterion() const {
		return criterion_;
	}

	const std::vector<LagSelectionEntry> &lagSelection() const {
		return lag_selection_;
	}

	/// A_lag(effect, cause): response of @p effect to @p cause lagged @p lag steps.
	double coefficient(const std::string &effect, const std::string &cause, int lag) const;

	const std::vector<Eigen::MatrixXd> &coefficientMatrices() const {
		return coefficients_;
	}

	const Eigen::VectorXd &intercept() const {
		return intercept_;
	}

	const Eigen::MatrixXd &residualCovariance() const {
		return sigma_;
	}

	const Eigen::MatrixXd &residuals() const {
		return residuals_;
	}

	bool isStable() const {
		return diagnostics_.stable;
	}

	/// Responses Psi_0..Psi_steps; Cholesky-orthogonalised when requested.
	std::vector<Eigen::MatrixXd> impulseResponse(int steps, bool orthogonalized = false) const;

	/// Level forecast-error covariance for steps 1..horizon.
	std::vector<Eigen::MatrixXd> forecastErrorCovariance(int horizon) const;

	/// Level form used for forecasting.
	const LevelsRepresentation &levels() const {
		return levels_;
	}

private:
	VarModel() = default;

	std::vector<std::string> variables_;
	std::vector<Eigen::MatrixXd> coefficients_;
	Eigen::VectorXd intercept_;
	Eigen::MatrixXd sigma_;
	Eigen::MatrixXd residuals_;
	int differencing_order_ = 0;
	core::InformationCriterion criterion_ = core::InformationCriterion::AIC;
	double stability_tolerance_ = 1e-6;
	std::vector<LagSelectionEntry> lag_selection_;
	LevelsRepresentation levels_;
	ModelDiagnostics diagnostics_;
};

namespace detail {

/// Regressor matrix [1, y_{t-1}, ..., y_{t-p}] for rows t = first..T-1 of @p Y.
Eigen::MatrixXd lagRegressors(const Eigen::MatrixXd &Y, int p, Eigen::Index first);

/// Residual checks per equation, shared by VAR and VECM.
std::vector<EquationDiagnostics> equationDiagnostics(const std::vector<std::string> &variables,
                                                     const Eigen::MatrixXd &targets,
                                                     const Eigen::MatrixXd &residuals, int lags,
                                                     int fitted_parameters);

/// Fills likelihood and information criteria from the ML residual covariance.
void fillInformationCriteria(ModelDiagnostics &diagnostics, const Eigen::MatrixXd &residuals, int parameters);

} // namespace detail

} // namespace commodex::models
