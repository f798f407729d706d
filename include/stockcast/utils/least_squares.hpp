#pragma once

#include <Eigen/Dense>
#include <cstddef>

namespace stockcast::utils {

/// Ordinary least squares estimates for y = X * beta + e.
struct LeastSquaresFit {
	Eigen::VectorXd coefficients;
	Eigen::VectorXd residuals;
	double sigma2 = 0.0;
	std::size_t observations = 0;
	Eigen::Index rank = 0;
};

/**
 * @brief Solves the least squares problem with a column-pivoting QR.
 *
 * Rank-deficient designs (e.g. a constant series regressed on its own lags
 * and an intercept) are accepted and yield a basic solution.
 * @throws std::invalid_argument If there are fewer rows than columns or the
 *         sizes of @p design and @p response differ.
 * @throws std::runtime_error If the solution is not finite.
 */
LeastSquaresFit fitLeastSquares(const Eigen::MatrixXd &design, const Eigen::VectorXd &response);

} // namespace stockcast::utils
