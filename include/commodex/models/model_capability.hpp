#pragma once

#include "commodex/analysis/residual_tests.hpp"
#include "commodex/core/forecast.hpp"

#include <optional>
#include <string>
#include <vector>

namespace commodex::models {

enum class ModelKind {
	VAR,
	VECM,
	GARCH
};

std::string toString(ModelKind kind);

/// Advisory residual checks of one equation.
struct EquationDiagnostics {
	std::string variable;
	std::optional<double> r_squared;
	double residual_variance = 0.0; // in-sample mean squared error
	double rmse = 0.0;
	double mae = 0.0;
	analysis::LjungBoxResult ljung_box;
	analysis::JarqueBeraResult jarque_bera;
};

/**
 * @struct ModelDiagnostics
 * @brief Goodness-of-fit figures attached to a fitted model.
 *
 * Diagnostics never block forecasting. For VAR/VECM the information criteria
 * follow the per-observation convention log|Sigma| + penalty / T; for GARCH
 * they are -2 logL + penalty.
 */
struct ModelDiagnostics {
	double log_likelihood = 0.0;
	double aic = 0.0;
	double bic = 0.0;
	double hqic = 0.0;
	int observations = 0;
	int parameters = 0;
	std::vector<EquationDiagnostics> equations;
	double max_root_modulus = 0.0;
	bool stable = true;
	std::optional<double> persistence; // GARCH only
	std::vector<std::string> warnings;
};

/**
 * @class IFittedModel
 * @brief Capability interface shared by every fitted model alternative.
 *
 * Fitted models are immutable after construction; all members are const and
 * safe to call from concurrent readers.
 */
class IFittedModel {
public:
	virtual ~IFittedModel() = default;

	virtual ModelKind kind() const = 0;

	virtual const std::vector<std::string> &variables() const = 0;

	virtual const ModelDiagnostics &diagnostics() const = 0;

	/**
	 * @brief Forecasts steps 0..horizon with central bands of the given coverage.
	 *
	 * The returned record does not reference the model; use models::forecast
	 * on a shared FittedModel to get a traceable forecast.
	 */
	virtual core::Forecast forecast(int horizon, double confidence) const = 0;

	/// One-line summary for logs and reports.
	virtual std::string describe() const = 0;
};

} // namespace commodex::models
