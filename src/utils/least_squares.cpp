#include "stockcast/utils/least_squares.hpp"

#include <stdexcept>
#include <string>

namespace stockcast::utils {

LeastSquaresFit fitLeastSquares(const Eigen::MatrixXd &design, const Eigen::VectorXd &response) {
	if (design.rows() != response.size()) {
		throw std::invalid_argument("Design matrix and response must have the same number of rows.");
	}
	if (design.cols() == 0) {
		throw std::invalid_argument("Design matrix must have at least one column.");
	}
	if (design.rows() < design.cols()) {
		throw std::invalid_argument("Insufficient observations: " + std::to_string(design.rows()) +
		                            " rows for " + std::to_string(design.cols()) + " parameters.");
	}

	const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr = design.colPivHouseholderQr();
	LeastSquaresFit fit;
	fit.coefficients = qr.solve(response);
	if (!fit.coefficients.allFinite()) {
		throw std::runtime_error("Least squares solution is not finite.");
	}
	fit.rank = qr.rank();
	fit.residuals = response - design * fit.coefficients;
	fit.observations = static_cast<std::size_t>(design.rows());
	const Eigen::Index dof = design.rows() - fit.rank;
	fit.sigma2 = dof > 0 ? fit.residuals.squaredNorm() / static_cast<double>(dof) : 0.0;
	return fit;
}

} // namespace stockcast::utils
