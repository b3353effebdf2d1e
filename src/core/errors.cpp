#include "commodex/core/errors.hpp"

#include <utility>

namespace commodex::core {

std::string toString(Stage stage) {
	switch (stage) {
	case Stage::SeriesStore:
		return "series-store";
	case Stage::Stationarity:
		return "stationarity";
	case Stage::Cointegration:
		return "cointegration";
	case Stage::Causality:
		return "causality";
	case Stage::ForecastModel:
		return "forecast-model";
	case Stage::Volatility:
		return "volatility";
	case Stage::Risk:
		return "risk";
	case Stage::Procurement:
		return "procurement";
	case Stage::Solver:
		return "solver";
	case Stage::Pipeline:
		return "pipeline";
	default:
		return "unknown";
	}
}

EngineError::EngineError(Stage stage, const std::string &message, Parameters parameters)
    : std::runtime_error(render(stage, message, parameters)), stage_(stage), detail_(message),
      parameters_(std::move(parameters)) {
}

std::string EngineError::render(Stage stage, const std::string &message, const Parameters &parameters) {
	std::string rendered = "[" + toString(stage) + "] " + message;
	if (!parameters.empty()) {
		rendered += " (";
		bool first = true;
		for (const auto &entry : parameters) {
			if (!first) {
				rendered += ", ";
			}
			rendered += entry.first + "=" + entry.second;
			first = false;
		}
		rendered += ")";
	}
	return rendered;
}

} // namespace commodex::core
