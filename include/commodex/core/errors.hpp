#pragma once

#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace commodex::core {

/// Pipeline stage that raised an error.
enum class Stage {
	SeriesStore,
	Stationarity,
	Cointegration,
	Causality,
	ForecastModel,
	Volatility,
	Risk,
	Procurement,
	Solver,
	Pipeline
};

std::string toString(Stage stage);

/**
 * @class EngineError
 * @brief Base of the error taxonomy raised by the analytical core.
 *
 * Every error carries the stage that raised it together with the offending
 * parameters, so callers can render an actionable message without parsing
 * the text.
 */
class EngineError : public std::runtime_error {
public:
	using Parameters = std::map<std::string, std::string>;

	EngineError(Stage stage, const std::string &message, Parameters parameters = {});

	Stage stage() const {
		return stage_;
	}

	const Parameters &parameters() const {
		return parameters_;
	}

	/// The message without the stage prefix and parameter suffix.
	const std::string &detail() const {
		return detail_;
	}

private:
	static std::string render(Stage stage, const std::string &message, const Parameters &parameters);

	Stage stage_;
	std::string detail_;
	Parameters parameters_;
};

/// Not enough observations for the requested lag or window.
class InsufficientDataError final : public EngineError {
public:
	using EngineError::EngineError;
};

/// A structural precondition of the model is unmet.
class ModelNotApplicableError final : public EngineError {
public:
	using EngineError::EngineError;
};

/// Fitted VAR/VECM has characteristic roots outside the unit circle.
class UnstableModelError final : public EngineError {
public:
	using EngineError::EngineError;
};

/// Wrong kind of input or an invalid option value.
class InvalidInputError final : public EngineError {
public:
	using EngineError::EngineError;
};

/// Optimizer failed to reach a valid parameter set within its budget.
class NonConvergentFitError final : public EngineError {
public:
	using EngineError::EngineError;
};

/// Optimizer constraints admit no solution.
class NoFeasibleSolutionError final : public EngineError {
public:
	using EngineError::EngineError;
};

/// Formats a value for an error parameter map.
template <typename T>
std::string param(const T &value) {
	std::ostringstream oss;
	oss << value;
	return oss.str();
}

} // namespace commodex::core
