#include "stockcast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace stockcast::utils {

namespace {

struct Vertex {
	std::vector<double> point;
	double value;
};

void clampToBounds(std::vector<double> &point, const std::vector<double> &lower, const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (!lower.empty()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (!upper.empty()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double spread(const std::vector<Vertex> &simplex) {
	double mean = 0.0;
	for (const auto &vertex : simplex) {
		mean += vertex.value;
	}
	mean /= static_cast<double>(simplex.size());
	double accum = 0.0;
	for (const auto &vertex : simplex) {
		const double diff = vertex.value - mean;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(simplex.size()));
}

// Moves from the centroid towards (or away from) a reference point.
std::vector<double> along(const std::vector<double> &centroid, const std::vector<double> &reference, double factor) {
	std::vector<double> point(centroid.size());
	for (std::size_t i = 0; i < centroid.size(); ++i) {
		point[i] = centroid[i] + factor * (reference[i] - centroid[i]);
	}
	return point;
}

} // namespace

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial,
                                                          const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds) const {
	Result result;
	if (initial.empty()) {
		return result;
	}
	const std::size_t n = initial.size();
	if ((!lower_bounds.empty() && lower_bounds.size() != n) || (!upper_bounds.empty() && upper_bounds.size() != n)) {
		throw std::invalid_argument("Nelder-Mead bounds must match the parameter dimension.");
	}

	auto evaluate = [&objective](const std::vector<double> &point) {
		const double value = objective(point);
		return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
	};
	auto byValue = [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; };

	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);
	std::vector<double> start = initial;
	clampToBounds(start, lower_bounds, upper_bounds);
	simplex.push_back({start, evaluate(start)});
	for (std::size_t i = 0; i < n; ++i) {
		std::vector<double> vertex = start;
		vertex[i] += options.step;
		if (!upper_bounds.empty() && vertex[i] > upper_bounds[i]) {
			vertex[i] = start[i] - options.step;
		}
		clampToBounds(vertex, lower_bounds, upper_bounds);
		simplex.push_back({vertex, evaluate(vertex)});
	}
	std::sort(simplex.begin(), simplex.end(), byValue);

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		if (spread(simplex) < options.tolerance) {
			result.converged = true;
			break;
		}

		std::vector<double> centroid(n, 0.0);
		for (std::size_t v = 0; v < n; ++v) {
			for (std::size_t i = 0; i < n; ++i) {
				centroid[i] += simplex[v].point[i] / static_cast<double>(n);
			}
		}
		const Vertex &worst = simplex.back();

		auto reflected = along(centroid, worst.point, -options.reflection);
		clampToBounds(reflected, lower_bounds, upper_bounds);
		const double reflected_value = evaluate(reflected);

		if (reflected_value < simplex.front().value) {
			auto expanded = along(centroid, reflected, options.expansion);
			clampToBounds(expanded, lower_bounds, upper_bounds);
			const double expanded_value = evaluate(expanded);
			if (expanded_value < reflected_value) {
				simplex.back() = {std::move(expanded), expanded_value};
			} else {
				simplex.back() = {std::move(reflected), reflected_value};
			}
		} else if (reflected_value < simplex[n - 1].value) {
			simplex.back() = {std::move(reflected), reflected_value};
		} else {
			auto contracted = along(centroid, worst.point, options.contraction);
			clampToBounds(contracted, lower_bounds, upper_bounds);
			const double contracted_value = evaluate(contracted);
			if (contracted_value < worst.value) {
				simplex.back() = {std::move(contracted), contracted_value};
			} else {
				const std::vector<double> best = simplex.front().point;
				for (std::size_t v = 1; v < simplex.size(); ++v) {
					simplex[v].point = along(best, simplex[v].point, options.shrink);
					clampToBounds(simplex[v].point, lower_bounds, upper_bounds);
					simplex[v].value = evaluate(simplex[v].point);
				}
			}
		}
		std::sort(simplex.begin(), simplex.end(), byValue);
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace stockcast::utils
