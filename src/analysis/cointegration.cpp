#include "commodex/analysis/cointegration.hpp"
#include "commodex/core/errors.hpp"
#include "commodex/utils/logging.hpp"

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>

namespace commodex::analysis {

namespace {

// MacKinnon, Haug and Michelis (1999) critical values for the constant case,
// indexed by the number of common trends k - r (row 0 is one trend).
constexpr std::array<std::array<double, 3>, 12> kTraceCritical = {{
    {2.7055, 3.8415, 6.6349},
    {13.4294, 15.4943, 19.9349},
    {27.0669, 29.7961, 35.4628},
    {44.4929, 47.8545, 54.6815},
    {65.8202, 69.8189, 77.8202},
    {91.1090, 95.7542, 104.9637},
    {120.3673, 125.6185, 135.9825},
    {153.6341, 159.5290, 171.0905},
    {190.8714, 197.3772, 210.0366},
    {232.1030, 239.2468, 253.2526},
    {277.3740, 285.1402, 300.2821},
    {326.5354, 334.9795, 351.2150},
}};

constexpr std::array<std::array<double, 3>, 12> kMaxEigenCritical = {{
    {2.7055, 3.8415, 6.6349},
    {12.2971, 14.2639, 18.52},
    {18.8928, 21.1314, 25.865},
    {25.1236, 27.5858, 32.7172},
    {31.2379, 33.8777, 39.3693},
    {37.2786, 40.0763, 45.8662},
    {43.2947, 46.2299, 52.3069},
    {49.2855, 52.3622, 58.6634},
    {55.2412, 58.4332, 64.996},
    {61.2041, 64.504, 71.2525},
    {67.1307, 70.5392, 77.4877},
    {73.0563, 76.5734, 83.7105},
}};

int significanceColumn(double significance) {
	if (std::abs(significance - 0.10) < 1e-9) {
		return 0;
	}
	if (std::abs(significance - 0.05) < 1e-9) {
		return 1;
	}
	if (std::abs(significance - 0.01) < 1e-9) {
		return 2;
	}
	return -1;
}

Eigen::MatrixXd demeaned(const Eigen::MatrixXd &m) {
	if (m.cols() == 0) {
		return m;
	}
	return m.rowwise() - m.colwise().mean();
}

// Residuals of y regressed on z (both already demeaned).
Eigen::MatrixXd residualsOn(const Eigen::MatrixXd &y, const Eigen::MatrixXd &z) {
	if (z.cols() == 0) {
		return y;
	}
	const Eigen::MatrixXd coef = z.colPivHouseholderQr().solve(y);
	return y - z * coef;
}

} // namespace

Eigen::MatrixXd CointegrationResult::beta() const {
	const auto k = static_cast<Eigen::Index>(variables.size());
	Eigen::MatrixXd b(k, rank);
	for (int r = 0; r < rank; ++r) {
		for (Eigen::Index i = 0; i < k; ++i) {
			b(i, r) = cointegrating_vectors[static_cast<std::size_t>(r)][static_cast<std::size_t>(i)];
		}
	}
	return b;
}

void JohansenTest::Options::validate() const {
	if (lag_differences < 0) {
		throw core::InvalidInputError(core::Stage::Cointegration, "Lagged differences must be non-negative.",
		                              {{"lag_differences", core::param(lag_differences)}});
	}
	if (significanceColumn(significance) < 0) {
		throw core::InvalidInputError(core::Stage::Cointegration,
		                              "Johansen significance must be one of 0.10, 0.05 or 0.01.",
		                              {{"significance", core::param(significance)}});
	}
}

JohansenTest::JohansenTest(Options options) : options_(options) {
	options_.validate();
}

CointegrationResult JohansenTest::run(const core::MultivariateSeries &series) const {
	const auto k = static_cast<Eigen::Index>(series.dimensions());
	if (k < 2 || k > kMaxVariables) {
		throw core::ModelNotApplicableError(core::Stage::Cointegration,
		                                    "Johansen rank test needs between 2 and 12 variables.",
		                                    {{"variables", core::param(k)}});
	}
	const int L = options_.lag_differences;
	const auto T = static_cast<Eigen::Index>(series.size());
	const Eigen::Index n = T - 1 - L;
	if (n <= k * (L + 1) + 1) {
		throw core::InsufficientDataError(core::Stage::Cointegration,
		                                  "Not enough observations for the Johansen regressions.",
		                                  {{"observations", core::param(T)},
		                                   {"variables", core::param(k)},
		                                   {"lag_differences", core::param(L)}});
	}

	const Eigen::MatrixXd x = series.matrix();
	const Eigen::MatrixXd dx = x.bottomRows(T - 1) - x.topRows(T - 1);

	// Row j describes time t = j + L + 1.
	Eigen::MatrixXd z(n, k * L);
	for (int lag = 1; lag <= L; ++lag) {
		z.middleCols((lag - 1) * k, k) = dx.middleRows(L - lag, n);
	}
	const Eigen::MatrixXd z0 = demeaned(z);
	const Eigen::MatrixXd r0 = residualsOn(demeaned(dx.bottomRows(n)), z0);
	const Eigen::MatrixXd rk = residualsOn(demeaned(x.middleRows(L, n)), z0);

	const double nd = static_cast<double>(n);
	const Eigen::MatrixXd s00 = r0.transpose() * r0 / nd;
	const Eigen::MatrixXd s0k = r0.transpose() * rk / nd;
	const Eigen::MatrixXd skk = rk.transpose() * rk / nd;

	const Eigen::MatrixXd s00_inv_s0k = s00.ldlt().solve(s0k);
	Eigen::MatrixXd sig = s0k.transpose() * s00_inv_s0k;
	sig = 0.5 * (sig + sig.transpose());

	Eigen::GeneralizedSelfAdjointEigenSolver<Eigen::MatrixXd> solver(sig, skk);
	if (solver.info() != Eigen::Success) {
		throw core::ModelNotApplicableError(core::Stage::Cointegration,
		                                    "Level moment matrix is singular; variables may be collinear.",
		                                    {{"variables", core::param(k)}});
	}

	// Eigen returns ascending order.
	std::vector<Eigen::Index> order(static_cast<std::size_t>(k));
	std::iota(order.begin(), order.end(), 0);
	std::reverse(order.begin(), order.end());

	CointegrationResult result;
	result.variables = series.variables();
	result.lag_differences = L;
	result.significance = options_.significance;
	result.eigenvectors.resize(k, k);
	for (Eigen::Index i = 0; i < k; ++i) {
		const Eigen::Index src = order[static_cast<std::size_t>(i)];
		const double lambda = std::clamp(solver.eigenvalues()(src), 0.0, 1.0 - 1e-12);
		result.eigenvalues.push_back(lambda);
		Eigen::VectorXd v = solver.eigenvectors().col(src);
		if (std::abs(v(0)) > 1e-12) {
			v /= v(0);
		}
		result.eigenvectors.col(i) = v;
	}

	const int column = significanceColumn(options_.significance);
	for (Eigen::Index r = 0; r < k; ++r) {
		double trace = 0.0;
		for (Eigen::Index j = r; j < k; ++j) {
			trace -= nd * std::log(1.0 - result.eigenvalues[static_cast<std::size_t>(j)]);
		}
		result.trace_statistics.push_back(trace);
		result.max_eigen_statistics.push_back(-nd * std::log(1.0 - result.eigenvalues[static_cast<std::size_t>(r)]));
		const auto &trace_row = kTraceCritical[static_cast<std::size_t>(k - r - 1)];
		const auto &max_row = kMaxEigenCritical[static_cast<std::size_t>(k - r - 1)];
		result.trace_critical_values.emplace_back(trace_row.begin(), trace_row.end());
		result.max_eigen_critical_values.emplace_back(max_row.begin(), max_row.end());
	}

	int rank = 0;
	while (rank < k && result.trace_statistics[static_cast<std::size_t>(rank)] >
	                       result.trace_critical_values[static_cast<std::size_t>(rank)][static_cast<std::size_t>(column)]) {
		++rank;
	}
	result.rank = rank;
	for (int r = 0; r < rank; ++r) {
		const Eigen::VectorXd v = result.eigenvectors.col(r);
		result.cointegrating_vectors.emplace_back(v.data(), v.data() + v.size());
	}

	COMMODEX_INFO("Johansen test on {} variables ({} lagged differences): rank {} at {:.0f}% significance", k, L,
	              rank, 100.0 * options_.significance);
	return result;
}

} // namespace commodex::analysis
