#include "commodex/core/config.hpp"

namespace commodex::core {

std::string toString(InformationCriterion criterion) {
	switch (criterion) {
	case InformationCriterion::AIC:
		return "AIC";
	case InformationCriterion::BIC:
		return "BIC";
	case InformationCriterion::HQIC:
		return "HQIC";
	default:
		return "?";
	}
}

std::string toString(ResidualDistribution distribution) {
	switch (distribution) {
	case ResidualDistribution::Normal:
		return "normal";
	case ResidualDistribution::StudentT:
		return "student-t";
	default:
		return "?";
	}
}

std::string toString(MultipleComparisonCorrection correction) {
	switch (correction) {
	case MultipleComparisonCorrection::Bonferroni:
		return "bonferroni";
	case MultipleComparisonCorrection::Sidak:
		return "sidak";
	default:
		return "?";
	}
}

} // namespace commodex::core
