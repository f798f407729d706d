#pragma once

#include <functional>
#include <limits>
#include <vector>

namespace stockcast::utils {

/**
 * @class NelderMeadOptimizer
 * @brief Derivative-free simplex minimiser with optional box constraints.
 *
 * Used to estimate smoothing parameters and initial states of the
 * exponential smoothing models and to refine ARIMA coefficients.
 */
class NelderMeadOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &)>;

	struct Options {
		double reflection = 1.0;
		double expansion = 2.0;
		double contraction = 0.5;
		double shrink = 0.5;
		double step = 0.05; // initial simplex step per coordinate
		int max_iterations = 500;
		double tolerance = 1e-8;
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	/**
	 * @brief Minimises @p objective starting from @p initial.
	 *
	 * Bounds are optional; when given they must have the dimension of
	 * @p initial. Non-finite objective values are treated as +infinity.
	 * @throws std::invalid_argument If bounds have the wrong dimension.
	 */
	Result minimize(const Objective &objective, const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {},
	                const std::vector<double> &upper_bounds = {}) const;
};

} // namespace stockcast::utils
