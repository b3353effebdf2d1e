#pragma once

#include <chrono>
#include <string>

namespace commodex::core {

/// Rule used to pick a lag order.
enum class InformationCriterion {
	AIC,
	BIC,
	HQIC
};

/// Distribution family assumed for standardized residuals.
enum class ResidualDistribution {
	Normal,
	StudentT
};

/// Correction applied when a causality test scans several lag orders.
enum class MultipleComparisonCorrection {
	Bonferroni,
	Sidak
};

/// How variables with different timestamp sets are aligned.
enum class GapPolicy {
	InnerJoin,
	ForwardFill
};

struct GarchOrder {
	int p = 1; // ARCH terms
	int q = 1; // GARCH terms
};

/// Annualized volatility band edges: below `low` is Low, below `medium` is Medium, High otherwise.
struct RiskThresholds {
	double low = 0.15;
	double medium = 0.30;
};

/// Iteration and wall-clock budget for iterative solvers.
struct SolverBudget {
	int max_iterations = 500;
	std::chrono::milliseconds time_limit{5000};
};

std::string toString(InformationCriterion criterion);
std::string toString(ResidualDistribution distribution);
std::string toString(MultipleComparisonCorrection correction);

} // namespace commodex::core
